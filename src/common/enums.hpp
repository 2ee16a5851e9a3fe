#pragma once

namespace rewind {

enum class SnapshotKind {
    Plain,
    Restore,
    StashApply
};

enum class StorageErrorKind {
    Io,
    LockTimeout
};

} // namespace rewind
