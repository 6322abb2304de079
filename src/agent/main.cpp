#include <QCoreApplication>

#include "agent/AgentCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("nodeos-agent"));

    // All work is synchronous; the event loop is never entered.
    nodeos::AgentCli cli;
    return cli.run(argc, argv);
}
