#pragma once

#include <QString>
#include <QStringList>

namespace rewind {

struct RewindConfig {
    QString rootDir;
    bool force = false;
    bool traceEnabled = false;
};

// REWIND_CONFIG_DIR, else $HOME/.rewind.
QString defaultRootDir();

// Resolve configuration from the environment, then let the global flags
// (--config-dir DIR, --force, --trace) override it. Recognized flags are
// removed from args so subcommands never see them. Arguments after "--"
// are left alone.
RewindConfig loadConfig(QStringList &args);

QString timelineFilePath(const QString &rootDir);
QString currentBranchFilePath(const QString &rootDir);
QString lockFilePath(const QString &rootDir);
QString logsDirPath(const QString &rootDir);

} // namespace rewind
