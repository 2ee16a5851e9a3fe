#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace rewind {

class TimelineStore;

class RewindCli
{
public:
    // CLI dispatcher for timeline verbs.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    // Each verb is a thin layer over one or two TimelineStore calls.
    int runList(const QStringList &args, TimelineStore &store);
    int runBranch(const QStringList &args, TimelineStore &store);
    int runSwitch(const QStringList &args, TimelineStore &store);
    int runRestore(const QStringList &args, TimelineStore &store);
    int runSnapshot(const QStringList &args, TimelineStore &store);
    int runStash(const QStringList &args, TimelineStore &store);
    int runInfo(const QStringList &args, TimelineStore &store);

    bool confirm(const QString &prompt) const;

    RewindConfig m_config;
};

} // namespace rewind
