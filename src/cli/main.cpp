#include <QCoreApplication>

#include "cli/RewindCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("rewind"));

    // Configuration, logging and storage are set up by the dispatcher so the
    // tests drive exactly the same path.
    rewind::RewindCli cli;
    return cli.run(argc, argv);
}
