#include "cli/RewindCli.hpp"

#include <iostream>
#include <optional>
#include <string>

#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "timeline/timeline_store.hpp"

namespace rewind {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitStorage = 2;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  rewind list [--snapshots|--stashes] [--branch B] [--format text|json]\n"
        "  rewind branch [NAME] [--description D] [--from F] [--switch]\n"
        "  rewind switch NAME\n"
        "  rewind restore ID [--force] [--unsafe] [--info]\n"
        "  rewind snapshot [--] MESSAGE\n"
        "  rewind stash [MESSAGE] [--list|--apply|--pop|--drop] [STASH_ID]\n"
        "  rewind info [SNAPSHOT_ID] [--format text|json]\n"
        "\n"
        "Global options: --config-dir DIR, --force, --trace\n");
}

const QStringList kCommands = {
    QStringLiteral("list"), QStringLiteral("branch"), QStringLiteral("switch"),
    QStringLiteral("restore"), QStringLiteral("snapshot"), QStringLiteral("stash"),
    QStringLiteral("info"),
};

// Options that consume the following argument.
const QStringList kValueOptions = {
    QStringLiteral("--branch"), QStringLiteral("-b"),
    QStringLiteral("--description"), QStringLiteral("-d"),
    QStringLiteral("--from"),
    QStringLiteral("--format"),
};

const QString kEndOfOptions = QStringLiteral("--");

// Options are only recognized before a "--" terminator.
QStringList optionArgs(const QStringList &args)
{
    const int end = args.indexOf(kEndOfOptions);
    return end < 0 ? args : args.mid(0, end);
}

QString getArgValue(const QStringList &args, const QStringList &keys)
{
    const QStringList options = optionArgs(args);
    for (const QString &key : keys) {
        const int idx = options.indexOf(key);
        if (idx >= 0 && idx + 1 < options.size()) {
            return options.at(idx + 1);
        }
    }
    return {};
}

bool hasFlag(const QStringList &args, const QStringList &keys)
{
    const QStringList options = optionArgs(args);
    for (const QString &key : keys) {
        if (options.contains(key)) {
            return true;
        }
    }
    return false;
}

// Arguments after the verb that are neither options nor option values.
// Everything after "--" is positional.
QStringList positionalArgs(const QStringList &args)
{
    QStringList positional;
    for (int i = 2; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == kEndOfOptions) {
            positional += args.mid(i + 1);
            break;
        }
        if (kValueOptions.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("-"))) {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

bool wantsJson(const QStringList &args)
{
    return getArgValue(args, {QStringLiteral("--format")}).toLower() == QStringLiteral("json");
}

std::optional<std::string> optionalString(const QString &value)
{
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value.toStdString();
}

void renderBranchesText(const std::vector<BranchSummary> &branches)
{
    if (branches.empty()) {
        std::cout << "No branches found.\n";
        return;
    }

    std::cout << "Branches:\n";
    std::cout << std::string(50, '=') << "\n";
    for (const auto &branch : branches) {
        std::cout << (branch.isCurrent ? " * " : "   ") << branch.name << "\n";
        std::cout << "     Created: " << toIso8601Utc(branch.created) << "\n";
        std::cout << "     Snapshots: " << branch.snapshotCount << "\n";
        if (!branch.description.empty()) {
            std::cout << "     Description: " << branch.description << "\n";
        }
        std::cout << "\n";
    }
}

void renderSnapshotText(const Snapshot &snapshot)
{
    std::cout << "  " << snapshot.id;
    if (snapshot.automatic) {
        std::cout << " (auto)";
    }
    switch (snapshot.kind()) {
    case SnapshotKind::Restore:
        std::cout << " [RESTORE]";
        break;
    case SnapshotKind::StashApply:
        std::cout << " [STASH]";
        break;
    case SnapshotKind::Plain:
        break;
    }
    std::cout << "\n";
    std::cout << "    Message: " << snapshot.message << "\n";
    std::cout << "    Time: " << toIso8601Utc(snapshot.timestamp) << "\n";
    if (const auto *restore = snapshot.restore()) {
        std::cout << "    Restored from: " << restore->restoredFrom
                  << " (branch " << restore->sourceBranch << ")\n";
        if (restore->preRestoreSnapshot.has_value()) {
            std::cout << "    Safety snapshot: " << *restore->preRestoreSnapshot << "\n";
        }
    } else if (const auto *apply = snapshot.stashApply()) {
        std::cout << "    Stash: " << apply->stashApplied << "\n";
    }
    std::cout << "\n";
}

void renderSnapshotsText(const std::vector<Snapshot> &snapshots, const std::string &branch)
{
    if (snapshots.empty()) {
        std::cout << "No snapshots found in branch '" << branch << "'.\n";
        return;
    }

    std::cout << "Snapshots in branch '" << branch << "':\n";
    std::cout << std::string(60, '=') << "\n";
    for (const auto &snapshot : snapshots) {
        renderSnapshotText(snapshot);
    }
}

void renderStashesText(const std::vector<Stash> &stashes)
{
    if (stashes.empty()) {
        std::cout << "No stashes found.\n";
        return;
    }

    std::cout << "Stashes (oldest first):\n";
    std::cout << std::string(60, '=') << "\n";
    for (const auto &stash : stashes) {
        std::cout << "  " << stash.id << "\n";
        std::cout << "    Message: " << stash.message << "\n";
        std::cout << "    Branch: " << stash.branch << "\n";
        std::cout << "    Time: " << toIso8601Utc(stash.timestamp) << "\n\n";
    }
}

void renderSnapshotInfoText(const Snapshot &snapshot)
{
    std::cout << "Snapshot: " << snapshot.id << "\n";
    std::cout << "Branch: " << snapshot.branch << "\n";
    std::cout << "Type: " << toSnapshotKindString(snapshot.kind()) << "\n";
    std::cout << "Automatic: " << (snapshot.automatic ? "yes" : "no") << "\n";
    std::cout << "Message: " << snapshot.message << "\n";
    std::cout << "Time: " << toIso8601Utc(snapshot.timestamp) << "\n";
    if (const auto *restore = snapshot.restore()) {
        std::cout << "Restored from: " << restore->restoredFrom << "\n";
        std::cout << "Source branch: " << restore->sourceBranch << "\n";
        std::cout << "Safety snapshot: "
                  << restore->preRestoreSnapshot.value_or("(none)") << "\n";
    } else if (const auto *apply = snapshot.stashApply()) {
        std::cout << "Stash applied: " << apply->stashApplied << "\n";
    }
}

void reportRecovery(const TimelineStore &store)
{
    const auto backup = store.lastRecoveryBackup();
    if (backup.has_value()) {
        std::cerr << "Warning: the timeline document could not be read and was reset. "
                  << "The previous contents were saved to " << *backup << "\n";
    }
}

} // namespace

int RewindCli::run(int argc, char *argv[])
{
    // CLI entry: resolve configuration, parse the verb and delegate.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    m_config = loadConfig(args);
    logging::LogSettings logSettings;
    logSettings.rootDir = m_config.rootDir;
    logSettings.traceEnabled = m_config.traceEnabled;
    logging::initLogging(logSettings);
    logging::CorrelationScope correlation(
        QUuid::createUuid().toString(QUuid::WithoutBraces));

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    const QString command = args.at(1);
    RLOG_INFO(QStringLiteral("RewindCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              (nlohmann::json{{"command", command.toStdString()},
                              {"root", m_config.rootDir.toStdString()},
                              {"force", m_config.force}}));

    if (!kCommands.contains(command)) {
        std::cerr << "Unknown command: " << command.toStdString() << "\n";
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    try {
        TimelineStore store(m_config.rootDir.toStdString());
        reportRecovery(store);

        if (command == QStringLiteral("list")) {
            return runList(args, store);
        }
        if (command == QStringLiteral("branch")) {
            return runBranch(args, store);
        }
        if (command == QStringLiteral("switch")) {
            return runSwitch(args, store);
        }
        if (command == QStringLiteral("restore")) {
            return runRestore(args, store);
        }
        if (command == QStringLiteral("snapshot")) {
            return runSnapshot(args, store);
        }
        if (command == QStringLiteral("stash")) {
            return runStash(args, store);
        }
        return runInfo(args, store);
    } catch (const StorageError &error) {
        RLOG_ERROR(QStringLiteral("RewindCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_storage_error"),
                   QStringLiteral("storage_unavailable"),
                   (nlohmann::json{{"command", command.toStdString()},
                                   {"path", error.path()},
                                   {"error", error.what()}}));
        std::cerr << "Storage error: " << error.what() << std::endl;
        return kExitStorage;
    }
}

int RewindCli::runList(const QStringList &args, TimelineStore &store)
{
    const bool json = wantsJson(args);

    if (hasFlag(args, {QStringLiteral("--stashes")})) {
        const auto stashes = store.listStashes();
        if (json) {
            std::cout << nlohmann::json(stashes).dump(2) << std::endl;
        } else {
            renderStashesText(stashes);
        }
        return kExitOk;
    }

    const QString branchArg = getArgValue(args, {QStringLiteral("--branch"), QStringLiteral("-b")});
    if (hasFlag(args, {QStringLiteral("--snapshots"), QStringLiteral("-s")})
        || !branchArg.isEmpty()) {
        const auto branch = optionalString(branchArg);
        const auto snapshots = store.listSnapshots(branch);
        if (json) {
            std::cout << nlohmann::json(snapshots).dump(2) << std::endl;
        } else {
            renderSnapshotsText(snapshots, branch.value_or(store.currentBranch()));
        }
        return kExitOk;
    }

    const auto branches = store.listBranches();
    if (json) {
        std::cout << nlohmann::json(branches).dump(2) << std::endl;
    } else {
        renderBranchesText(branches);
    }
    return kExitOk;
}

int RewindCli::runBranch(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        renderBranchesText(store.listBranches());
        return kExitOk;
    }

    const std::string name = positional.first().toStdString();
    const std::string description =
        getArgValue(args, {QStringLiteral("--description"), QStringLiteral("-d")}).toStdString();
    const auto from = optionalString(getArgValue(args, {QStringLiteral("--from")}));

    if (!store.createBranch(name, description, from)) {
        std::cerr << "Failed to create branch '" << name
                  << "' (already exists, or source branch missing?)\n";
        return kExitFailure;
    }
    std::cout << "Created branch '" << name << "'\n";

    if (hasFlag(args, {QStringLiteral("--switch")})) {
        if (!store.switchBranch(name)) {
            std::cerr << "Failed to switch to branch '" << name << "'\n";
            return kExitFailure;
        }
        std::cout << "Switched to branch '" << name << "'\n";
    }
    return kExitOk;
}

int RewindCli::runSwitch(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    const std::string name = positional.first().toStdString();
    if (!store.switchBranch(name)) {
        std::cerr << "Failed to switch to branch '" << name << "' (doesn't exist?)\n";
        return kExitFailure;
    }
    std::cout << "Switched to branch '" << name << "'\n";
    return kExitOk;
}

int RewindCli::runRestore(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    const std::string id = positional.first().toStdString();
    const auto target = store.getSnapshotInfo(id);
    if (!target.has_value()) {
        std::cerr << "Snapshot '" << id << "' not found.\n";
        return kExitFailure;
    }

    if (hasFlag(args, {QStringLiteral("--info")})) {
        renderSnapshotInfoText(*target);
        return kExitOk;
    }

    const bool safe = !hasFlag(args, {QStringLiteral("--unsafe")});
    if (!m_config.force) {
        const QString prompt = QStringLiteral("Restore to snapshot '%1' (%2)%3? [y/N] ")
            .arg(QString::fromStdString(id),
                 QString::fromStdString(target->message),
                 safe ? QString() : QStringLiteral(" WITHOUT a safety snapshot"));
        if (!confirm(prompt)) {
            std::cout << "Restore cancelled.\n";
            return kExitFailure;
        }
    }

    if (!store.restoreSnapshot(id, safe)) {
        std::cerr << "Failed to restore snapshot '" << id << "' (doesn't exist?)\n";
        return kExitFailure;
    }

    std::cout << "Restored to snapshot '" << id << "'\n";
    const auto snapshots = store.listSnapshots();
    if (!snapshots.empty()) {
        if (const auto *restore = snapshots.back().restore()) {
            if (restore->preRestoreSnapshot.has_value()) {
                std::cout << "Safety snapshot: " << *restore->preRestoreSnapshot << "\n";
            }
        }
    }
    return kExitOk;
}

int RewindCli::runSnapshot(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);
    if (positional.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitFailure;
    }

    const std::string message = positional.join(QLatin1Char(' ')).toStdString();
    const std::string id = store.createSnapshot(message, false);
    std::cout << "Created snapshot '" << id << "': " << message << "\n";
    return kExitOk;
}

int RewindCli::runStash(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);

    if (hasFlag(args, {QStringLiteral("--list")})) {
        renderStashesText(store.listStashes());
        return kExitOk;
    }

    const auto stashId = positional.isEmpty()
        ? std::nullopt
        : optionalString(positional.first());
    const QString target = stashId.has_value()
        ? QString::fromStdString(*stashId)
        : QStringLiteral("the most recent stash");

    const bool pop = hasFlag(args, {QStringLiteral("--pop")});
    if (pop || hasFlag(args, {QStringLiteral("--apply")})) {
        if (!store.applyStash(stashId, pop)) {
            std::cerr << "Failed to apply " << target.toStdString()
                      << " (no stashes, or unknown id?)\n";
            return kExitFailure;
        }
        std::cout << (pop ? "Popped " : "Applied ") << target.toStdString() << "\n";
        return kExitOk;
    }

    if (hasFlag(args, {QStringLiteral("--drop")})) {
        if (!m_config.force
            && !confirm(QStringLiteral("Drop %1? [y/N] ").arg(target))) {
            std::cout << "Drop cancelled.\n";
            return kExitFailure;
        }
        if (!store.dropStash(stashId)) {
            std::cerr << "Failed to drop " << target.toStdString()
                      << " (no stashes, or unknown id?)\n";
            return kExitFailure;
        }
        std::cout << "Dropped " << target.toStdString() << "\n";
        return kExitOk;
    }

    const std::string message = positional.isEmpty()
        ? std::string("Stashed changes")
        : positional.join(QLatin1Char(' ')).toStdString();
    const std::string id = store.createStash(message);
    std::cout << "Created stash '" << id << "': " << message << "\n";
    return kExitOk;
}

int RewindCli::runInfo(const QStringList &args, TimelineStore &store)
{
    const QStringList positional = positionalArgs(args);
    const bool json = wantsJson(args);

    if (!positional.isEmpty()) {
        const std::string id = positional.first().toStdString();
        const auto snapshot = store.getSnapshotInfo(id);
        if (!snapshot.has_value()) {
            std::cerr << "Snapshot '" << id << "' not found.\n";
            return kExitFailure;
        }
        if (json) {
            std::cout << nlohmann::json(*snapshot).dump(2) << std::endl;
        } else {
            renderSnapshotInfoText(*snapshot);
        }
        return kExitOk;
    }

    const std::string current = store.currentBranch();
    const auto branches = store.listBranches();
    const auto snapshots = store.listSnapshots();
    const auto stashes = store.listStashes();

    if (json) {
        nlohmann::json payload;
        payload["currentBranch"] = current;
        payload["branches"] = branches.size();
        payload["snapshots"] = snapshots.size();
        payload["stashes"] = stashes.size();
        payload["root"] = store.rootDir();
        if (!snapshots.empty()) {
            payload["latestSnapshot"] = snapshots.back();
        }
        std::cout << payload.dump(2) << std::endl;
        return kExitOk;
    }

    std::cout << "Current branch: " << current << "\n";
    std::cout << "Branches: " << branches.size() << "\n";
    std::cout << "Snapshots on current branch: " << snapshots.size() << "\n";
    std::cout << "Stashes: " << stashes.size() << "\n";
    std::cout << "Storage: " << store.rootDir() << "\n";
    if (!snapshots.empty()) {
        const Snapshot &latest = snapshots.back();
        std::cout << "Latest snapshot: " << latest.id << " - " << latest.message
                  << " (" << toIso8601Utc(latest.timestamp) << ")\n";
    }
    return kExitOk;
}

bool RewindCli::confirm(const QString &prompt) const
{
    std::cout << prompt.toStdString() << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    const QString normalized = QString::fromStdString(answer).trimmed().toLower();
    return normalized == QStringLiteral("y") || normalized == QStringLiteral("yes");
}

} // namespace rewind
