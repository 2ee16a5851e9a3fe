#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QRegularExpression>
#include <QTemporaryDir>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "timeline/timeline_store.hpp"

class TimelineStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testFreshStoreDefaults();
    void testCreateExistingBranchFails();
    void testForkCopiesHistory();
    void testCreateBranchFromMissingSourceFails();
    void testSwitchBranch();
    void testSwitchMissingBranchFails();
    void testCreateSnapshot();
    void testSnapshotIdsUniqueWithinOneSecond();
    void testRestoreSafe();
    void testRestoreUnsafe();
    void testRestoreUnknownId();
    void testRestoreAcrossBranches();
    void testStashLifo();
    void testApplyStashKeepsStash();
    void testApplyStashPop();
    void testApplyStashById();
    void testStashOperationsOnEmptyStack();
    void testGetSnapshotInfo();
    void testEndToEndScenario();
    void testPersistenceRoundTrip();
    void testPointerMirrorFallback();
    void testSharedRootAcrossInstances();
    void testConcurrentWritersAcrossThreads();
    void testLockHeldElsewhereTimesOut();
    void testDanglingCurrentBranchFallsBack();
    void testStoreLogsStayUnderItsRoot();
    void testNonUtf8InputsDoNotThrow();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevConfigDir;
    int m_caseIndex = 0;
    std::string m_root;

    void writeDocument(const QByteArray &data) const;
};

void TimelineStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevConfigDir = qgetenv("REWIND_CONFIG_DIR");
    qputenv("REWIND_CONFIG_DIR", m_tempDir.path().toUtf8());
}

void TimelineStoreTests::cleanupTestCase()
{
    if (m_prevConfigDir.isEmpty()) {
        qunsetenv("REWIND_CONFIG_DIR");
    } else {
        qputenv("REWIND_CONFIG_DIR", m_prevConfigDir);
    }
}

void TimelineStoreTests::init()
{
    // Every test gets its own storage root.
    ++m_caseIndex;
    m_root = (m_tempDir.path() + QStringLiteral("/case-%1").arg(m_caseIndex)).toStdString();
}

void TimelineStoreTests::testFreshStoreDefaults()
{
    rewind::TimelineStore store(m_root);

    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("main"));

    const auto branches = store.listBranches();
    QCOMPARE(static_cast<int>(branches.size()), 1);
    QCOMPARE(QString::fromStdString(branches.front().name), QStringLiteral("main"));
    QVERIFY(branches.front().isCurrent);
    QCOMPARE(static_cast<int>(branches.front().snapshotCount), 0);

    QVERIFY(store.listSnapshots().empty());
    QVERIFY(store.listStashes().empty());
    QVERIFY(!store.lastRecoveryBackup().has_value());

    const QString root = QString::fromStdString(m_root);
    QVERIFY(QFile::exists(rewind::timelineFilePath(root)));
    QVERIFY(QFile::exists(rewind::currentBranchFilePath(root)));
}

void TimelineStoreTests::testCreateExistingBranchFails()
{
    rewind::TimelineStore store(m_root);
    store.createSnapshot("base");

    QFile document(rewind::timelineFilePath(QString::fromStdString(m_root)));
    QVERIFY(document.open(QIODevice::ReadOnly));
    const QByteArray before = document.readAll();
    document.close();

    QVERIFY(!store.createBranch("main", "again"));

    QVERIFY(document.open(QIODevice::ReadOnly));
    QCOMPARE(document.readAll(), before);
    QCOMPARE(static_cast<int>(store.listBranches().size()), 1);
}

void TimelineStoreTests::testForkCopiesHistory()
{
    rewind::TimelineStore store(m_root);
    store.createSnapshot("one");
    store.createSnapshot("two");
    const auto mainAtFork = store.listSnapshots("main");

    QVERIFY(store.createBranch("f", "feature work", std::string("main")));
    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("main"));

    const auto forked = store.listSnapshots("f");
    QCOMPARE(forked.size(), mainAtFork.size());
    for (std::size_t i = 0; i < forked.size(); ++i) {
        QCOMPARE(QString::fromStdString(forked[i].id), QString::fromStdString(mainAtFork[i].id));
        QCOMPARE(QString::fromStdString(forked[i].message),
                 QString::fromStdString(mainAtFork[i].message));
    }

    store.createSnapshot("three");
    QCOMPARE(static_cast<int>(store.listSnapshots("main").size()), 3);
    QCOMPARE(static_cast<int>(store.listSnapshots("f").size()), 2);

    bool sawFeature = false;
    for (const auto &summary : store.listBranches()) {
        if (summary.name == "f") {
            sawFeature = true;
            QCOMPARE(QString::fromStdString(summary.description), QStringLiteral("feature work"));
            QVERIFY(!summary.isCurrent);
        }
    }
    QVERIFY(sawFeature);
}

void TimelineStoreTests::testCreateBranchFromMissingSourceFails()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(!store.createBranch("orphan", "", std::string("nope")));
    QVERIFY(!store.createBranch("", ""));
    QCOMPARE(static_cast<int>(store.listBranches().size()), 1);
}

void TimelineStoreTests::testSwitchBranch()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(store.createBranch("feature"));
    QVERIFY(store.switchBranch("feature"));
    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("feature"));

    QFile pointer(rewind::currentBranchFilePath(QString::fromStdString(m_root)));
    QVERIFY(pointer.open(QIODevice::ReadOnly));
    QCOMPARE(pointer.readAll().trimmed(), QByteArray("feature"));

    for (const auto &summary : store.listBranches()) {
        QCOMPARE(summary.isCurrent, summary.name == "feature");
    }
}

void TimelineStoreTests::testSwitchMissingBranchFails()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(!store.switchBranch("nope"));
    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("main"));
}

void TimelineStoreTests::testCreateSnapshot()
{
    rewind::TimelineStore store(m_root);
    const auto before = store.listSnapshots().size();

    const std::string id = store.createSnapshot("m");
    QVERIFY(QRegularExpression(QStringLiteral("^snap_\\d+$"))
                .match(QString::fromStdString(id))
                .hasMatch());

    const auto snapshots = store.listSnapshots();
    QCOMPARE(snapshots.size(), before + 1);
    const auto &latest = snapshots.back();
    QCOMPARE(QString::fromStdString(latest.id), QString::fromStdString(id));
    QCOMPARE(QString::fromStdString(latest.message), QStringLiteral("m"));
    QVERIFY(!latest.automatic);
    QCOMPARE(QString::fromStdString(latest.branch), QStringLiteral("main"));
    QCOMPARE(latest.kind(), rewind::SnapshotKind::Plain);

    const std::string autoId = store.createSnapshot("auto", true);
    QVERIFY(store.listSnapshots().back().automatic);
    QVERIFY(autoId != id);
}

void TimelineStoreTests::testSnapshotIdsUniqueWithinOneSecond()
{
    rewind::TimelineStore store(m_root);
    std::set<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.insert(store.createSnapshot("burst"));
    }
    QCOMPARE(static_cast<int>(ids.size()), 5);

    std::set<std::string> stashes;
    for (int i = 0; i < 3; ++i) {
        stashes.insert(store.createStash("burst"));
    }
    QCOMPARE(static_cast<int>(stashes.size()), 3);
}

void TimelineStoreTests::testRestoreSafe()
{
    rewind::TimelineStore store(m_root);
    const std::string target = store.createSnapshot("base");
    store.createSnapshot("later");
    const auto before = store.listSnapshots().size();

    QVERIFY(store.restoreSnapshot(target, true));

    const auto snapshots = store.listSnapshots();
    QCOMPARE(snapshots.size(), before + 2);

    const auto &safety = snapshots[snapshots.size() - 2];
    QVERIFY(safety.automatic);
    QCOMPARE(safety.kind(), rewind::SnapshotKind::Plain);
    QVERIFY(QString::fromStdString(safety.message).contains(QString::fromStdString(target)));

    const auto &record = snapshots.back();
    QCOMPARE(record.kind(), rewind::SnapshotKind::Restore);
    QVERIFY(!record.automatic);
    QVERIFY(record.restore() != nullptr);
    QCOMPARE(QString::fromStdString(record.restore()->restoredFrom), QString::fromStdString(target));
    QCOMPARE(QString::fromStdString(record.restore()->sourceBranch), QStringLiteral("main"));
    QVERIFY(record.restore()->preRestoreSnapshot.has_value());
    QCOMPARE(QString::fromStdString(*record.restore()->preRestoreSnapshot),
             QString::fromStdString(safety.id));
}

void TimelineStoreTests::testRestoreUnsafe()
{
    rewind::TimelineStore store(m_root);
    const std::string target = store.createSnapshot("base");
    const auto before = store.listSnapshots().size();

    QVERIFY(store.restoreSnapshot(target, false));

    const auto snapshots = store.listSnapshots();
    QCOMPARE(snapshots.size(), before + 1);
    QCOMPARE(snapshots.back().kind(), rewind::SnapshotKind::Restore);
    QVERIFY(!snapshots.back().restore()->preRestoreSnapshot.has_value());
}

void TimelineStoreTests::testRestoreUnknownId()
{
    rewind::TimelineStore store(m_root);
    store.createSnapshot("base");
    const auto before = store.listSnapshots().size();

    QVERIFY(!store.restoreSnapshot("bogus"));
    QCOMPARE(store.listSnapshots().size(), before);
}

void TimelineStoreTests::testRestoreAcrossBranches()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(store.createBranch("other"));
    QVERIFY(store.switchBranch("other"));
    const std::string target = store.createSnapshot("on other");
    QVERIFY(store.switchBranch("main"));

    QVERIFY(store.restoreSnapshot(target, false));

    const auto mainSnapshots = store.listSnapshots("main");
    QCOMPARE(static_cast<int>(mainSnapshots.size()), 1);
    QCOMPARE(QString::fromStdString(mainSnapshots.back().restore()->sourceBranch),
             QStringLiteral("other"));
    QCOMPARE(QString::fromStdString(mainSnapshots.back().branch), QStringLiteral("main"));
    QCOMPARE(static_cast<int>(store.listSnapshots("other").size()), 1);
}

void TimelineStoreTests::testStashLifo()
{
    rewind::TimelineStore store(m_root);
    const std::string a = store.createStash("A");
    const std::string b = store.createStash("B");

    const auto stashes = store.listStashes();
    QCOMPARE(static_cast<int>(stashes.size()), 2);
    QCOMPARE(QString::fromStdString(stashes.front().id), QString::fromStdString(a));
    QCOMPARE(QString::fromStdString(stashes.front().branch), QStringLiteral("main"));

    const auto snapshotsBefore = store.listSnapshots().size();
    QVERIFY(store.dropStash());

    const auto remaining = store.listStashes();
    QCOMPARE(static_cast<int>(remaining.size()), 1);
    QCOMPARE(QString::fromStdString(remaining.front().id), QString::fromStdString(a));
    QCOMPARE(store.listSnapshots().size(), snapshotsBefore);
    QVERIFY(b != a);
}

void TimelineStoreTests::testApplyStashKeepsStash()
{
    rewind::TimelineStore store(m_root);
    const std::string id = store.createStash("wip");
    const auto before = store.listSnapshots().size();

    QVERIFY(store.applyStash(std::nullopt, false));

    QCOMPARE(static_cast<int>(store.listStashes().size()), 1);
    const auto snapshots = store.listSnapshots();
    QCOMPARE(snapshots.size(), before + 1);
    QCOMPARE(snapshots.back().kind(), rewind::SnapshotKind::StashApply);
    QCOMPARE(QString::fromStdString(snapshots.back().stashApply()->stashApplied),
             QString::fromStdString(id));
}

void TimelineStoreTests::testApplyStashPop()
{
    rewind::TimelineStore store(m_root);
    store.createStash("first");
    const std::string second = store.createStash("second");
    const auto before = store.listSnapshots().size();

    QVERIFY(store.applyStash(std::nullopt, true));

    const auto stashes = store.listStashes();
    QCOMPARE(static_cast<int>(stashes.size()), 1);
    QVERIFY(stashes.front().id != second);
    QCOMPARE(store.listSnapshots().size(), before + 1);
    QCOMPARE(QString::fromStdString(store.listSnapshots().back().stashApply()->stashApplied),
             QString::fromStdString(second));
}

void TimelineStoreTests::testApplyStashById()
{
    rewind::TimelineStore store(m_root);
    const std::string first = store.createStash("first");
    store.createStash("second");

    QVERIFY(store.applyStash(first, true));
    const auto stashes = store.listStashes();
    QCOMPARE(static_cast<int>(stashes.size()), 1);
    QCOMPARE(QString::fromStdString(stashes.front().message), QStringLiteral("second"));

    const auto snapshotsBefore = store.listSnapshots().size();
    QVERIFY(!store.applyStash(std::string("stash_0"), false));
    QVERIFY(!store.dropStash(std::string("stash_0")));
    QCOMPARE(store.listSnapshots().size(), snapshotsBefore);
    QCOMPARE(static_cast<int>(store.listStashes().size()), 1);
}

void TimelineStoreTests::testStashOperationsOnEmptyStack()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(!store.applyStash());
    QVERIFY(!store.applyStash(std::nullopt, true));
    QVERIFY(!store.dropStash());
    QVERIFY(store.listSnapshots().empty());
}

void TimelineStoreTests::testGetSnapshotInfo()
{
    rewind::TimelineStore store(m_root);
    QVERIFY(store.createBranch("side"));
    QVERIFY(store.switchBranch("side"));
    const std::string id = store.createSnapshot("side work");

    const auto info = store.getSnapshotInfo(id);
    QVERIFY(info.has_value());
    QCOMPARE(QString::fromStdString(info->message), QStringLiteral("side work"));
    QCOMPARE(QString::fromStdString(info->branch), QStringLiteral("side"));

    QVERIFY(!store.getSnapshotInfo("snap_0").has_value());
}

void TimelineStoreTests::testEndToEndScenario()
{
    rewind::TimelineStore store(m_root);
    store.createSnapshot("s1");
    QVERIFY(store.createBranch("feature"));
    QVERIFY(store.switchBranch("feature"));
    store.createSnapshot("s2");

    const auto mainSnapshots = store.listSnapshots("main");
    const auto featureSnapshots = store.listSnapshots("feature");
    QCOMPARE(static_cast<int>(mainSnapshots.size()), 1);
    QCOMPARE(static_cast<int>(featureSnapshots.size()), 2);
    QCOMPARE(QString::fromStdString(featureSnapshots[0].message), QStringLiteral("s1"));
    QCOMPARE(QString::fromStdString(featureSnapshots[1].message), QStringLiteral("s2"));
    QCOMPARE(QString::fromStdString(featureSnapshots[1].branch), QStringLiteral("feature"));
}

void TimelineStoreTests::testPersistenceRoundTrip()
{
    std::vector<rewind::BranchSummary> branches;
    std::vector<rewind::Snapshot> snapshots;
    std::vector<rewind::Stash> stashes;
    {
        rewind::TimelineStore store(m_root);
        const std::string base = store.createSnapshot("base");
        QVERIFY(store.createBranch("feature", "desc"));
        QVERIFY(store.switchBranch("feature"));
        store.createSnapshot("feature work");
        QVERIFY(store.restoreSnapshot(base));
        store.createStash("Persistence stash");
        store.createStash("second");
        QVERIFY(store.applyStash());

        branches = store.listBranches();
        snapshots = store.listSnapshots();
        stashes = store.listStashes();
    }

    rewind::TimelineStore reopened(m_root);
    QCOMPARE(QString::fromStdString(reopened.currentBranch()), QStringLiteral("feature"));

    const auto branchesAfter = reopened.listBranches();
    QCOMPARE(branchesAfter.size(), branches.size());
    for (std::size_t i = 0; i < branches.size(); ++i) {
        QCOMPARE(QString::fromStdString(branchesAfter[i].name),
                 QString::fromStdString(branches[i].name));
        QCOMPARE(branchesAfter[i].isCurrent, branches[i].isCurrent);
        QCOMPARE(branchesAfter[i].snapshotCount, branches[i].snapshotCount);
        QCOMPARE(QString::fromStdString(branchesAfter[i].description),
                 QString::fromStdString(branches[i].description));
        QVERIFY(branchesAfter[i].created == branches[i].created);
    }

    const auto snapshotsAfter = reopened.listSnapshots();
    QCOMPARE(snapshotsAfter.size(), snapshots.size());
    for (std::size_t i = 0; i < snapshots.size(); ++i) {
        QCOMPARE(QString::fromStdString(snapshotsAfter[i].id),
                 QString::fromStdString(snapshots[i].id));
        QCOMPARE(snapshotsAfter[i].kind(), snapshots[i].kind());
        QCOMPARE(snapshotsAfter[i].automatic, snapshots[i].automatic);
        QVERIFY(snapshotsAfter[i].timestamp == snapshots[i].timestamp);
    }

    const auto stashesAfter = reopened.listStashes();
    QCOMPARE(stashesAfter.size(), stashes.size());
    QCOMPARE(QString::fromStdString(stashesAfter.front().message),
             QStringLiteral("Persistence stash"));
}

void TimelineStoreTests::testPointerMirrorFallback()
{
    const QString root = QString::fromStdString(m_root);
    {
        rewind::TimelineStore store(m_root);
        QVERIFY(store.createBranch("feature"));
        QVERIFY(store.switchBranch("feature"));
    }

    // A missing mirror falls back to the document.
    QVERIFY(QFile::remove(rewind::currentBranchFilePath(root)));
    {
        rewind::TimelineStore store(m_root);
        QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("feature"));
    }

    // A mirror naming an unknown branch is ignored.
    QFile pointer(rewind::currentBranchFilePath(root));
    QVERIFY(pointer.open(QIODevice::WriteOnly | QIODevice::Truncate));
    pointer.write("ghost");
    pointer.close();

    rewind::TimelineStore store(m_root);
    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("feature"));
    store.createSnapshot("after repair");
    QCOMPARE(static_cast<int>(store.listSnapshots("feature").size()), 1);
}

void TimelineStoreTests::testSharedRootAcrossInstances()
{
    rewind::TimelineStore first(m_root);
    rewind::TimelineStore second(m_root);

    first.createSnapshot("from first");
    second.createSnapshot("from second");
    first.createStash("stash from first");

    // Each call reloads, so neither instance overwrites the other.
    QCOMPARE(static_cast<int>(first.listSnapshots().size()), 2);
    QCOMPARE(static_cast<int>(second.listSnapshots().size()), 2);
    QCOMPARE(static_cast<int>(second.listStashes().size()), 1);
}

void TimelineStoreTests::writeDocument(const QByteArray &data) const
{
    const QString root = QString::fromStdString(m_root);
    QVERIFY(QDir().mkpath(root));
    QFile file(rewind::timelineFilePath(root));
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    QCOMPARE(file.write(data), static_cast<qint64>(data.size()));
}

void TimelineStoreTests::testConcurrentWritersAcrossThreads()
{
    constexpr int kPerThread = 20;
    { rewind::TimelineStore init(m_root); }

    std::atomic<int> failures{0};
    auto writer = [this, &failures](const std::string &label) {
        try {
            rewind::TimelineStore store(m_root);
            for (int i = 0; i < kPerThread; ++i) {
                store.createSnapshot(label + " " + std::to_string(i));
            }
        } catch (const rewind::StorageError &) {
            ++failures;
        }
    };

    std::thread first(writer, std::string("first"));
    std::thread second(writer, std::string("second"));
    first.join();
    second.join();

    QCOMPARE(failures.load(), 0);

    rewind::TimelineStore store(m_root);
    const auto snapshots = store.listSnapshots();
    QCOMPARE(static_cast<int>(snapshots.size()), 2 * kPerThread);

    std::set<std::string> ids;
    for (const auto &snapshot : snapshots) {
        ids.insert(snapshot.id);
    }
    QCOMPARE(static_cast<int>(ids.size()), 2 * kPerThread);
}

void TimelineStoreTests::testLockHeldElsewhereTimesOut()
{
    rewind::TimelineStore store(m_root);
    const QString lockPath = rewind::lockFilePath(QString::fromStdString(m_root));

    QLockFile holder(lockPath);
    QVERIFY(holder.tryLock(0));

    bool thrown = false;
    try {
        store.createSnapshot("blocked");
    } catch (const rewind::StorageError &error) {
        thrown = true;
        QCOMPARE(error.kind(), rewind::StorageErrorKind::LockTimeout);
        QCOMPARE(QString::fromStdString(error.path()), lockPath);
    }
    QVERIFY(thrown);

    holder.unlock();
    QVERIFY(store.listSnapshots().empty());
    store.createSnapshot("unblocked");
    QCOMPARE(static_cast<int>(store.listSnapshots().size()), 1);
}

void TimelineStoreTests::testDanglingCurrentBranchFallsBack()
{
    writeDocument(QByteArray(R"({"branches": {"dev": {}}, "current_branch": "ghost"})"));
    {
        rewind::TimelineStore store(m_root);
        QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("dev"));
        const auto branches = store.listBranches();
        QCOMPARE(static_cast<int>(branches.size()), 1);
        QVERIFY(branches.front().isCurrent);
    }

    writeDocument(QByteArray(
        R"({"branches": {"dev": {}, "main": {}}, "current_branch": "ghost"})"));
    QFile::remove(rewind::currentBranchFilePath(QString::fromStdString(m_root)));
    rewind::TimelineStore store(m_root);
    QCOMPARE(QString::fromStdString(store.currentBranch()), QStringLiteral("main"));
    store.createSnapshot("lands on main");
    QCOMPARE(static_cast<int>(store.listSnapshots("main").size()), 1);
    QVERIFY(store.listSnapshots("dev").empty());
}

void TimelineStoreTests::testStoreLogsStayUnderItsRoot()
{
    rewind::logging::initLogging(rewind::logging::LogSettings());

    rewind::TimelineStore store(m_root);
    store.createSnapshot("quiet");
    QVERIFY(!store.switchBranch("nope"));

    QVERIFY(!QFileInfo::exists(rewind::logsDirPath(m_tempDir.path())));
    QVERIFY(!QFileInfo::exists(rewind::logsDirPath(QString::fromStdString(m_root))));
}

void TimelineStoreTests::testNonUtf8InputsDoNotThrow()
{
    const QString root = QString::fromStdString(m_root);
    rewind::logging::LogSettings settings;
    settings.rootDir = root;
    settings.traceEnabled = true;
    rewind::logging::initLogging(settings);

    rewind::TimelineStore store(m_root);
    QVERIFY(!store.switchBranch(std::string("bad\xff")));

    const std::string id = store.createSnapshot(std::string("bad\xff message"));
    QVERIFY(!id.empty());

    rewind::TimelineStore reopened(m_root);
    const auto snapshots = reopened.listSnapshots();
    QCOMPARE(static_cast<int>(snapshots.size()), 1);
    QCOMPARE(QString::fromStdString(snapshots.front().id), QString::fromStdString(id));
    QCOMPARE(QString::fromStdString(snapshots.front().message.substr(0, 3)),
             QStringLiteral("bad"));
    QVERIFY(QFileInfo::exists(rewind::logsDirPath(root) + QStringLiteral("/rewind-trace.log")));

    rewind::logging::initLogging(rewind::logging::LogSettings());
}

QTEST_MAIN(TimelineStoreTests)
#include "test_timeline_store.moc"
