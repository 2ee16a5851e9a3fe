#include "timeline/timeline_store.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <system_error>
#include <utility>

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace rewind {

namespace {

constexpr int kLockTimeoutMs = 5000;
constexpr int kStaleLockMs = 30000;

const QString kComponent = QStringLiteral("TimelineStore");

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

// <prefix><unix-seconds>, moved forward a second at a time past any id in
// taken. Keeps ids unique when several are issued within the same second.
std::string nextId(const std::string &prefix, const std::set<std::string> &taken)
{
    int64_t seconds = toEpochSeconds(std::chrono::system_clock::now());
    std::string candidate = prefix + std::to_string(seconds);
    while (taken.count(candidate) > 0) {
        ++seconds;
        candidate = prefix + std::to_string(seconds);
    }
    return candidate;
}

std::set<std::string> snapshotIds(const TimelineState &state)
{
    std::set<std::string> ids;
    for (const auto &entry : state.branches) {
        for (const auto &snapshot : entry.second.snapshots) {
            ids.insert(snapshot.id);
        }
    }
    return ids;
}

std::set<std::string> stashIds(const TimelineState &state)
{
    std::set<std::string> ids;
    for (const auto &stash : state.stashes) {
        ids.insert(stash.id);
    }
    return ids;
}

TimelineState defaultState()
{
    Branch main;
    main.name = "main";
    main.created = nowSeconds();
    main.description = "Main timeline branch";

    TimelineState state;
    state.branches.emplace(main.name, main);
    state.currentBranch = main.name;
    return state;
}

// main when present, otherwise the first branch by name. An empty document
// keeps main; the next append recreates it.
std::string fallbackBranch(const TimelineState &state)
{
    if (state.branches.empty() || state.branches.count("main") > 0) {
        return "main";
    }
    return state.branches.begin()->first;
}

// Appends a new record to the current branch, creating the branch entry if the
// document lost it. The returned reference is invalidated by the next append.
Snapshot &appendRecord(TimelineState &state,
                       const std::string &idPrefix,
                       const std::string &message,
                       bool automatic)
{
    auto it = state.branches.find(state.currentBranch);
    if (it == state.branches.end()) {
        Branch branch;
        branch.name = state.currentBranch;
        branch.created = nowSeconds();
        branch.description = "Branch " + state.currentBranch;
        it = state.branches.emplace(branch.name, branch).first;
    }

    Snapshot snapshot;
    snapshot.id = nextId(idPrefix, snapshotIds(state));
    snapshot.message = message;
    snapshot.timestamp = nowSeconds();
    snapshot.automatic = automatic;
    snapshot.branch = state.currentBranch;

    it->second.snapshots.push_back(std::move(snapshot));
    return it->second.snapshots.back();
}

// First match in branch order, with the name of the branch that holds it.
std::optional<std::pair<Snapshot, std::string>> findSnapshot(const TimelineState &state,
                                                             const std::string &id)
{
    for (const auto &entry : state.branches) {
        for (const auto &snapshot : entry.second.snapshots) {
            if (snapshot.id == id) {
                return std::make_pair(snapshot, entry.first);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> findStashIndex(const TimelineState &state,
                                          const std::optional<std::string> &id)
{
    if (state.stashes.empty()) {
        return std::nullopt;
    }
    if (!id.has_value()) {
        return state.stashes.size() - 1;
    }
    const auto it = std::find_if(state.stashes.begin(), state.stashes.end(),
                                 [&id](const Stash &stash) { return stash.id == *id; });
    if (it == state.stashes.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(state.stashes.begin(), it));
}

void writeAtomically(const QString &path, const QByteArray &data)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "cannot open for writing: " + file.errorString().toStdString());
    }
    if (file.write(data) != data.size()) {
        const std::string reason = file.errorString().toStdString();
        file.cancelWriting();
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "short write: " + reason);
    }
    if (!file.commit()) {
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "cannot commit: " + file.errorString().toStdString());
    }
}

QByteArray readWhole(const QString &path)
{
    if (QFileInfo(path).isDir()) {
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "expected a file, found a directory");
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "cannot open for reading: " + file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw StorageError(StorageErrorKind::Io, path.toStdString(),
                           "cannot read: " + file.errorString().toStdString());
    }
    return data;
}

std::optional<TimelineState> decodeDocument(const QByteArray &data)
{
    try {
        const auto document = nlohmann::json::parse(data.toStdString());
        if (!isTimelineDocument(document)) {
            return std::nullopt;
        }
        return document.get<TimelineState>();
    } catch (const nlohmann::json::exception &error) {
        RLOG_DEBUG(kComponent,
                   QStringLiteral("decodeDocument"),
                   QStringLiteral("timeline_decode_failed"),
                   QStringLiteral("malformed_document"),
                   (nlohmann::json{{"error", error.what()}}));
        return std::nullopt;
    }
}

} // namespace

StorageError::StorageError(StorageErrorKind kind, std::string path, const std::string &message)
    : std::runtime_error(path + ": " + message)
    , m_kind(kind)
    , m_path(std::move(path))
{
}

StorageErrorKind StorageError::kind() const
{
    return m_kind;
}

const std::string &StorageError::path() const
{
    return m_path;
}

struct TimelineStore::Impl {
    std::filesystem::path root;
    QString documentPath;
    QString pointerPath;
    QString lockPath;
    std::mutex mutex;
    std::optional<std::string> lastRecoveryBackup;

    void ensureRoot()
    {
        std::error_code error;
        std::filesystem::create_directories(root, error);
        if (error || !std::filesystem::is_directory(root, error)) {
            const std::string reason = error ? error.message() : "not a directory";
            RLOG_ERROR(kComponent,
                       QStringLiteral("ensureRoot"),
                       QStringLiteral("storage_root_unavailable"),
                       QStringLiteral("create_directories_failed"),
                       (nlohmann::json{{"root", root.string()}, {"error", reason}}));
            throw StorageError(StorageErrorKind::Io, root.string(),
                               "cannot create storage directory: " + reason);
        }
    }

    // Runs fn on a freshly loaded state while holding both the in-process
    // mutex and the cross-process lock file.
    template <typename Fn>
    auto withState(Fn &&fn)
    {
        std::lock_guard<std::mutex> guard(mutex);
        ensureRoot();

        QLockFile lockFile(lockPath);
        lockFile.setStaleLockTime(kStaleLockMs);
        if (!lockFile.tryLock(kLockTimeoutMs)) {
            RLOG_ERROR(kComponent,
                       QStringLiteral("withState"),
                       QStringLiteral("storage_lock_timeout"),
                       QStringLiteral("concurrent_writer"),
                       (nlohmann::json{{"lock", lockPath.toStdString()},
                                       {"error", static_cast<int>(lockFile.error())}}));
            throw StorageError(StorageErrorKind::LockTimeout, lockPath.toStdString(),
                               "timed out waiting for the timeline lock");
        }

        TimelineState state = load();
        return fn(state);
    }

    TimelineState load()
    {
        if (!QFileInfo::exists(documentPath)) {
            TimelineState state = defaultState();
            save(state);
            RLOG_INFO(kComponent,
                      QStringLiteral("load"),
                      QStringLiteral("timeline_initialized"),
                      QStringLiteral("document_absent"),
                      (nlohmann::json{{"path", documentPath.toStdString()}}));
            return state;
        }

        std::optional<TimelineState> decoded = decodeDocument(readWhole(documentPath));
        if (!decoded.has_value()) {
            return recoverFromCorruption();
        }

        TimelineState state = std::move(*decoded);
        state.currentBranch = resolveCurrent(state);
        if (state.branches.count(state.currentBranch) == 0) {
            state.currentBranch = fallbackBranch(state);
        }
        return state;
    }

    // The pointer mirror wins when it names a branch the document has.
    std::string resolveCurrent(const TimelineState &state)
    {
        if (!QFileInfo::exists(pointerPath)) {
            return state.currentBranch;
        }
        const std::string name = readWhole(pointerPath).trimmed().toStdString();
        if (name.empty() || state.branches.count(name) == 0) {
            return state.currentBranch;
        }
        return name;
    }

    TimelineState recoverFromCorruption()
    {
        const QString stamp =
            QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMddTHHmmss"));
        QString backupPath = documentPath + QStringLiteral(".corrupt-") + stamp;
        for (int suffix = 1; QFileInfo::exists(backupPath); ++suffix) {
            backupPath = documentPath + QStringLiteral(".corrupt-") + stamp
                + QStringLiteral("-") + QString::number(suffix);
        }

        if (!QFile::rename(documentPath, backupPath)) {
            throw StorageError(StorageErrorKind::Io, documentPath.toStdString(),
                               "cannot move corrupt document aside to "
                                   + backupPath.toStdString());
        }

        RLOG_WARN(kComponent,
                  QStringLiteral("recoverFromCorruption"),
                  QStringLiteral("timeline_reinitialized"),
                  QStringLiteral("document_corrupt"),
                  (nlohmann::json{{"path", documentPath.toStdString()},
                                  {"backup", backupPath.toStdString()}}));

        lastRecoveryBackup = backupPath.toStdString();
        TimelineState state = defaultState();
        save(state);
        return state;
    }

    // Document first, then the pointer mirror.
    void save(const TimelineState &state)
    {
        const nlohmann::json document = state;
        const std::string text =
            document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        writeAtomically(documentPath, QByteArray::fromStdString(text + "\n"));
        writeAtomically(pointerPath, QByteArray::fromStdString(state.currentBranch));
    }
};

TimelineStore::TimelineStore()
    : TimelineStore(defaultRootDir().toStdString())
{
}

TimelineStore::TimelineStore(const std::string &rootDir)
    : impl(std::make_unique<Impl>())
{
    impl->root = std::filesystem::path(rootDir);
    const QString root = QString::fromStdString(rootDir);
    impl->documentPath = timelineFilePath(root);
    impl->pointerPath = currentBranchFilePath(root);
    impl->lockPath = lockFilePath(root);

    // Initializes the document on first use.
    impl->withState([](TimelineState &) { return true; });
}

TimelineStore::~TimelineStore() = default;

std::string TimelineStore::currentBranch() const
{
    return impl->withState([](TimelineState &state) { return state.currentBranch; });
}

std::vector<BranchSummary> TimelineStore::listBranches() const
{
    return impl->withState([](TimelineState &state) {
        std::vector<BranchSummary> summaries;
        summaries.reserve(state.branches.size());
        for (const auto &entry : state.branches) {
            BranchSummary summary;
            summary.name = entry.first;
            summary.isCurrent = entry.first == state.currentBranch;
            summary.created = entry.second.created;
            summary.description = entry.second.description;
            summary.snapshotCount = entry.second.snapshots.size();
            summaries.push_back(std::move(summary));
        }
        return summaries;
    });
}

std::vector<Snapshot> TimelineStore::listSnapshots(const std::optional<std::string> &branch) const
{
    return impl->withState([&branch](TimelineState &state) {
        const std::string name = branch.value_or(state.currentBranch);
        const auto it = state.branches.find(name);
        if (it == state.branches.end()) {
            return std::vector<Snapshot>{};
        }
        return it->second.snapshots;
    });
}

bool TimelineStore::createBranch(const std::string &name,
                                 const std::string &description,
                                 const std::optional<std::string> &fromBranch)
{
    return impl->withState([&](TimelineState &state) {
        const std::string source = fromBranch.value_or(state.currentBranch);
        const auto sourceIt = state.branches.find(source);
        if (name.empty() || state.branches.count(name) > 0
            || sourceIt == state.branches.end()) {
            RLOG_DEBUG(kComponent,
                       QStringLiteral("createBranch"),
                       QStringLiteral("branch_create_rejected"),
                       QStringLiteral("exists_or_missing_source"),
                       (nlohmann::json{{"branch", name}, {"from", source}}));
            return false;
        }

        Branch branch;
        branch.name = name;
        branch.created = nowSeconds();
        branch.description = description;
        branch.parent = source;
        branch.snapshots = sourceIt->second.snapshots;
        const std::size_t inherited = branch.snapshots.size();
        state.branches.emplace(name, std::move(branch));
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("createBranch"),
                  QStringLiteral("branch_created"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"branch", name},
                                  {"from", source},
                                  {"snapshots", inherited}}));
        return true;
    });
}

bool TimelineStore::switchBranch(const std::string &name)
{
    return impl->withState([&](TimelineState &state) {
        if (state.branches.count(name) == 0) {
            RLOG_DEBUG(kComponent,
                       QStringLiteral("switchBranch"),
                       QStringLiteral("branch_switch_rejected"),
                       QStringLiteral("branch_missing"),
                       (nlohmann::json{{"branch", name}}));
            return false;
        }

        const std::string previous = state.currentBranch;
        state.currentBranch = name;
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("switchBranch"),
                  QStringLiteral("branch_switched"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"from", previous}, {"to", name}}));
        return true;
    });
}

std::string TimelineStore::createSnapshot(const std::string &message, bool automatic)
{
    return impl->withState([&](TimelineState &state) {
        const std::string id = appendRecord(state, "snap_", message, automatic).id;
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("createSnapshot"),
                  QStringLiteral("snapshot_created"),
                  automatic ? QStringLiteral("automatic") : QStringLiteral("user_request"),
                  (nlohmann::json{{"id", id}, {"branch", state.currentBranch}}));
        return id;
    });
}

bool TimelineStore::restoreSnapshot(const std::string &id, bool safe)
{
    return impl->withState([&](TimelineState &state) {
        const auto found = findSnapshot(state, id);
        if (!found.has_value()) {
            RLOG_DEBUG(kComponent,
                       QStringLiteral("restoreSnapshot"),
                       QStringLiteral("restore_rejected"),
                       QStringLiteral("snapshot_missing"),
                       (nlohmann::json{{"id", id}}));
            return false;
        }
        const Snapshot &target = found->first;
        const std::string &sourceBranch = found->second;

        std::optional<std::string> safetyId;
        if (safe) {
            safetyId = appendRecord(state, "snap_",
                                    "Auto-snapshot before restore to " + id, true).id;
        }

        Snapshot &record = appendRecord(state, "restore_",
                                        "Restored to snapshot " + id + ": " + target.message,
                                        false);
        record.details = RestoreDetails{id, sourceBranch, safetyId};
        const std::string recordId = record.id;
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("restoreSnapshot"),
                  QStringLiteral("restore_recorded"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"id", id},
                                  {"record", recordId},
                                  {"sourceBranch", sourceBranch},
                                  {"branch", state.currentBranch},
                                  {"safetySnapshot", safetyId.value_or("")}}));
        return true;
    });
}

std::string TimelineStore::createStash(const std::string &message)
{
    return impl->withState([&](TimelineState &state) {
        Stash stash;
        stash.id = nextId("stash_", stashIds(state));
        stash.message = message;
        stash.timestamp = nowSeconds();
        stash.branch = state.currentBranch;
        state.stashes.push_back(stash);
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("createStash"),
                  QStringLiteral("stash_created"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"id", stash.id},
                                  {"branch", stash.branch},
                                  {"depth", state.stashes.size()}}));
        return stash.id;
    });
}

std::vector<Stash> TimelineStore::listStashes() const
{
    return impl->withState([](TimelineState &state) { return state.stashes; });
}

bool TimelineStore::applyStash(const std::optional<std::string> &id, bool pop)
{
    return impl->withState([&](TimelineState &state) {
        const auto index = findStashIndex(state, id);
        if (!index.has_value()) {
            RLOG_DEBUG(kComponent,
                       QStringLiteral("applyStash"),
                       QStringLiteral("stash_apply_rejected"),
                       QStringLiteral("stash_missing"),
                       (nlohmann::json{{"id", id.value_or("")},
                                       {"depth", state.stashes.size()}}));
            return false;
        }

        const Stash stash = state.stashes.at(*index);
        Snapshot &record = appendRecord(state, "stash_apply_",
                                        "Applied stash " + stash.id + ": " + stash.message,
                                        false);
        record.details = StashApplyDetails{stash.id};
        const std::string recordId = record.id;

        if (pop) {
            state.stashes.erase(state.stashes.begin() + static_cast<std::ptrdiff_t>(*index));
        }
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("applyStash"),
                  QStringLiteral("stash_applied"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"id", stash.id},
                                  {"record", recordId},
                                  {"branch", state.currentBranch},
                                  {"popped", pop}}));
        return true;
    });
}

bool TimelineStore::dropStash(const std::optional<std::string> &id)
{
    return impl->withState([&](TimelineState &state) {
        const auto index = findStashIndex(state, id);
        if (!index.has_value()) {
            RLOG_DEBUG(kComponent,
                       QStringLiteral("dropStash"),
                       QStringLiteral("stash_drop_rejected"),
                       QStringLiteral("stash_missing"),
                       (nlohmann::json{{"id", id.value_or("")},
                                       {"depth", state.stashes.size()}}));
            return false;
        }

        const std::string dropped = state.stashes.at(*index).id;
        state.stashes.erase(state.stashes.begin() + static_cast<std::ptrdiff_t>(*index));
        impl->save(state);

        RLOG_INFO(kComponent,
                  QStringLiteral("dropStash"),
                  QStringLiteral("stash_dropped"),
                  QStringLiteral("user_request"),
                  (nlohmann::json{{"id", dropped}, {"depth", state.stashes.size()}}));
        return true;
    });
}

std::optional<Snapshot> TimelineStore::getSnapshotInfo(const std::string &id) const
{
    return impl->withState([&id](TimelineState &state) -> std::optional<Snapshot> {
        auto found = findSnapshot(state, id);
        if (!found.has_value()) {
            return std::nullopt;
        }
        Snapshot snapshot = std::move(found->first);
        snapshot.branch = found->second;
        return snapshot;
    });
}

std::optional<std::string> TimelineStore::lastRecoveryBackup() const
{
    std::lock_guard<std::mutex> guard(impl->mutex);
    return impl->lastRecoveryBackup;
}

std::string TimelineStore::rootDir() const
{
    return impl->root.string();
}

} // namespace rewind
