#pragma once

#include <functional>
#include <memory>

#include <QStringList>

#include "common/config.hpp"
#include "daemon/node_updater.hpp"

namespace nodeos {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2,
    ExitUnsupported = 3
};

class AgentCli
{
public:
    using UpdaterFactory =
        std::function<std::unique_ptr<NodeUpdater>(const AgentConfig &config)>;

    AgentCli();
    explicit AgentCli(UpdaterFactory factory);

    // Parses global options, sets up logging and dispatches the subcommand.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int dispatch(const QString &command, const QStringList &args);

    int runStatus(const QStringList &args);
    int runBooted(const QStringList &args);
    int runKargs(const QStringList &args);
    int runSetKargs(const QStringList &args);
    int runRebase(const QStringList &args);
    int runCleanup(const QStringList &args);
    int runPools(const QStringList &args);
    int runDaemon(const QStringList &args);

    // Created on first use; host identification only happens for commands
    // that need the host.
    NodeUpdater &updater();

    UpdaterFactory m_factory;
    AgentConfig m_config;
    std::unique_ptr<NodeUpdater> m_updater;
};

} // namespace nodeos
