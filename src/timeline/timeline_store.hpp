#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace rewind {

// Raised when the backing storage cannot be accessed at all. A document that
// exists but does not decode is not an error: it is backed up and replaced.
class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorKind kind, std::string path, const std::string &message);

    StorageErrorKind kind() const;
    const std::string &path() const;

private:
    StorageErrorKind m_kind;
    std::string m_path;
};

// TimelineStore owns the persisted timeline document under a root directory.
// Every call is one locked load -> mutate -> save transaction, so concurrent
// processes serialize on the lock file instead of losing updates.
class TimelineStore {
public:
    TimelineStore();
    explicit TimelineStore(const std::string &rootDir);
    ~TimelineStore();

    TimelineStore(const TimelineStore &) = delete;
    TimelineStore &operator=(const TimelineStore &) = delete;

    std::string currentBranch() const;
    std::vector<BranchSummary> listBranches() const;

    // Snapshots of branch (current branch when empty), in append order.
    // An unknown branch yields an empty list.
    std::vector<Snapshot> listSnapshots(
        const std::optional<std::string> &branch = std::nullopt) const;

    // Fails when name exists or fromBranch (current branch when empty) does
    // not. The new branch starts with a copy of the source history and is
    // not switched to.
    bool createBranch(const std::string &name,
                      const std::string &description = std::string(),
                      const std::optional<std::string> &fromBranch = std::nullopt);
    bool switchBranch(const std::string &name);

    std::string createSnapshot(const std::string &message, bool automatic = false);

    // Records a restore of id on the current branch, preceded by an automatic
    // safety snapshot when safe is set. No system state is touched.
    bool restoreSnapshot(const std::string &id, bool safe = true);

    std::string createStash(const std::string &message = "Stashed changes");
    std::vector<Stash> listStashes() const;

    // Without an id the most recently pushed stash is targeted.
    bool applyStash(const std::optional<std::string> &id = std::nullopt, bool pop = false);
    bool dropStash(const std::optional<std::string> &id = std::nullopt);

    // The snapshot with its branch field set to the branch that holds it.
    std::optional<Snapshot> getSnapshotInfo(const std::string &id) const;

    // Path of the backup made the last time a corrupt document was replaced.
    std::optional<std::string> lastRecoveryBackup() const;
    std::string rootDir() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace rewind
