#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/enums.hpp"

namespace rewind {

// Extra fields carried by a restore record. preRestoreSnapshot is empty when
// the restore skipped the safety snapshot.
struct RestoreDetails {
    std::string restoredFrom;
    std::string sourceBranch;
    std::optional<std::string> preRestoreSnapshot;
};

struct StashApplyDetails {
    std::string stashApplied;
};

struct Snapshot {
    std::string id;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    bool automatic = false;
    std::string branch;

    // monostate is a plain snapshot.
    std::variant<std::monostate, RestoreDetails, StashApplyDetails> details;

    SnapshotKind kind() const
    {
        if (std::holds_alternative<RestoreDetails>(details)) {
            return SnapshotKind::Restore;
        }
        if (std::holds_alternative<StashApplyDetails>(details)) {
            return SnapshotKind::StashApply;
        }
        return SnapshotKind::Plain;
    }

    const RestoreDetails *restore() const
    {
        return std::get_if<RestoreDetails>(&details);
    }

    const StashApplyDetails *stashApply() const
    {
        return std::get_if<StashApplyDetails>(&details);
    }
};

struct Branch {
    std::string name;
    std::chrono::system_clock::time_point created;
    std::string description;
    std::optional<std::string> parent;
    std::vector<Snapshot> snapshots;
};

struct Stash {
    std::string id;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string branch;
};

// The whole persisted document. Branches are keyed by name.
struct TimelineState {
    std::map<std::string, Branch> branches;
    std::string currentBranch;
    std::vector<Stash> stashes;
};

struct BranchSummary {
    std::string name;
    bool isCurrent = false;
    std::chrono::system_clock::time_point created;
    std::string description;
    std::size_t snapshotCount = 0;
};

} // namespace rewind
