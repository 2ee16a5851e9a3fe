#include "common/config.hpp"

#include <QDir>

namespace rewind {

QString defaultRootDir()
{
    const QString overrideDir = qEnvironmentVariable("REWIND_CONFIG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".rewind");
    }
    return home + QStringLiteral("/.rewind");
}

RewindConfig loadConfig(QStringList &args)
{
    RewindConfig config;
    config.rootDir = defaultRootDir();
    config.force = qEnvironmentVariableIntValue("REWIND_FORCE") == 1;
    config.traceEnabled = qEnvironmentVariableIntValue("REWIND_TRACE") == 1;

    QStringList remaining;
    remaining.reserve(args.size());
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--")) {
            remaining += args.mid(i);
            break;
        }
        if (arg == QStringLiteral("--force")) {
            config.force = true;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        if (arg == QStringLiteral("--config-dir") && i + 1 < args.size()) {
            config.rootDir = args.at(++i);
            continue;
        }
        remaining.push_back(arg);
    }
    args = remaining;
    return config;
}

QString timelineFilePath(const QString &rootDir)
{
    return rootDir + QDir::separator() + QStringLiteral("timeline.json");
}

QString currentBranchFilePath(const QString &rootDir)
{
    return rootDir + QDir::separator() + QStringLiteral("current_branch");
}

QString lockFilePath(const QString &rootDir)
{
    return rootDir + QDir::separator() + QStringLiteral("timeline.lock");
}

QString logsDirPath(const QString &rootDir)
{
    return rootDir + QDir::separator() + QStringLiteral("logs");
}

} // namespace rewind
