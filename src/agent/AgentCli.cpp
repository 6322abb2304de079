#include "agent/AgentCli.hpp"

#include <iostream>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/nodeos_version.hpp"
#include "daemon/deployment_watch_plugin.hpp"
#include "daemon/plugin_harness.hpp"
#include "daemon/power_inhibitor.hpp"
#include "daemon/rollout_status.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("AgentCli");

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  nodeos-agent [--config PATH] [--debug-trace] COMMAND [ARGS]\n"
        "\n"
        "Commands:\n"
        "  status [--json]                        host deployment status\n"
        "  booted                                 booted deployment as JSON\n"
        "  kargs                                  active kernel arguments\n"
        "  set-kargs [--append ARG]... [--delete ARG]...\n"
        "  rebase IMAGE CONTENT_DIR [--no-inhibit]\n"
        "  cleanup                                remove pending deployment\n"
        "  pools FILE --version VERSION           rollout summary per pool\n"
        "  run                                    watch the host until SIGINT/SIGTERM\n"
        "  version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

// Positional arguments, skipping `--flag VALUE` pairs for the listed flags.
QStringList positionalArgs(const QStringList &args, const QStringList &valueFlags)
{
    QStringList positional;
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (valueFlags.contains(arg)) {
            ++i;
            continue;
        }
        if (arg.startsWith(QStringLiteral("--"))) {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

int usageError(const QString &message)
{
    std::cerr << message.toStdString() << "\n\n" << usageText().toStdString();
    return ExitUsage;
}

} // namespace

AgentCli::AgentCli()
    : AgentCli(createNodeUpdater)
{
}

AgentCli::AgentCli(UpdaterFactory factory)
    : m_factory(std::move(factory))
{
}

NodeUpdater &AgentCli::updater()
{
    if (!m_updater) {
        m_updater = m_factory(m_config);
    }
    return *m_updater;
}

int AgentCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 1; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QString configPath = getArgValue(args, QStringLiteral("--config"));
    if (args.contains(QStringLiteral("--config"))) {
        if (configPath.isEmpty()) {
            return usageError(QStringLiteral("--config needs a path"));
        }
        const int idx = args.indexOf(QStringLiteral("--config"));
        args.removeAt(idx + 1);
        args.removeAt(idx);
    } else {
        configPath = qEnvironmentVariable("NODEOS_CONFIG");
    }

    bool debugTrace = false;
    if (args.removeAll(QStringLiteral("--debug-trace")) > 0) {
        debugTrace = true;
    }

    try {
        m_config = loadConfig(configPath);
    } catch (const NodeOsError &e) {
        std::cerr << "nodeos-agent: " << e.what() << "\n";
        return ExitUsage;
    }
    if (debugTrace) {
        m_config.debugTrace = true;
    }

    logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("nodeos-agent");
    logOptions.logDir = QString::fromStdString(m_config.logDir);
    logOptions.debugTrace = m_config.debugTrace;
    logOptions.mirrorToStderr = m_config.logToStderr;
    logging::initLogging(logOptions);

    if (args.isEmpty()) {
        std::cerr << usageText().toStdString();
        return ExitUsage;
    }

    const QString command = args.takeFirst();
    logging::CorrelationScope scope(logging::newCorrelationId(command));

    NLOG_DEBUG(kComponent,
               QStringLiteral("dispatch"),
               QStringLiteral("Running %1").arg(command),
               (nlohmann::json{{"args", args.size()}, {"version", NODEOS_VERSION}}));

    try {
        return dispatch(command, args);
    } catch (const UnsupportedOperationError &e) {
        std::cerr << "nodeos-agent: " << command.toStdString() << ": " << e.what() << "\n";
        return ExitUnsupported;
    } catch (const NodeOsError &e) {
        NLOG_ERROR(kComponent,
                   QStringLiteral("command_failed"),
                   QStringLiteral("%1 failed").arg(command),
                   (nlohmann::json{{"error", e.what()}, {"kind", errorKindName(e.kind())}}));
        std::cerr << "nodeos-agent: " << command.toStdString() << ": " << e.what() << "\n";
        return ExitFailure;
    } catch (const std::exception &e) {
        NLOG_ERROR(kComponent,
                   QStringLiteral("command_failed"),
                   QStringLiteral("%1 failed unexpectedly").arg(command),
                   (nlohmann::json{{"error", e.what()}}));
        std::cerr << "nodeos-agent: " << command.toStdString() << ": " << e.what() << "\n";
        return ExitFailure;
    }
}

int AgentCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("status")) {
        return runStatus(args);
    }
    if (command == QStringLiteral("booted")) {
        return runBooted(args);
    }
    if (command == QStringLiteral("kargs")) {
        return runKargs(args);
    }
    if (command == QStringLiteral("set-kargs")) {
        return runSetKargs(args);
    }
    if (command == QStringLiteral("rebase")) {
        return runRebase(args);
    }
    if (command == QStringLiteral("cleanup")) {
        return runCleanup(args);
    }
    if (command == QStringLiteral("pools")) {
        return runPools(args);
    }
    if (command == QStringLiteral("run")) {
        return runDaemon(args);
    }
    if (command == QStringLiteral("version")) {
        std::cout << "nodeos-agent " << NODEOS_VERSION << "\n";
        return ExitOk;
    }
    return usageError(QStringLiteral("Unknown command: %1").arg(command));
}

int AgentCli::runStatus(const QStringList &args)
{
    if (args.contains(QStringLiteral("--json"))) {
        const nlohmann::json payload = collectNodeStatus(updater());
        std::cout << payload.dump(2) << std::endl;
        return ExitOk;
    }
    std::cout << updater().getStatus();
    return ExitOk;
}

int AgentCli::runBooted(const QStringList &)
{
    const nlohmann::json payload = updater().getBootedDeployment();
    std::cout << payload.dump(2) << std::endl;
    return ExitOk;
}

int AgentCli::runKargs(const QStringList &)
{
    for (const auto &arg : updater().getKernelArgs()) {
        std::cout << arg << "\n";
    }
    return ExitOk;
}

int AgentCli::runSetKargs(const QStringList &args)
{
    std::vector<KernelArgument> requested;
    for (int i = 0; i < args.size(); ++i) {
        const QString &flag = args.at(i);
        KernelArgument karg;
        if (flag == QStringLiteral("--append")) {
            karg.operation = KernelArgOperation::Add;
        } else if (flag == QStringLiteral("--delete")) {
            karg.operation = KernelArgOperation::Remove;
        } else {
            return usageError(QStringLiteral("Unexpected argument: %1").arg(flag));
        }
        if (i + 1 >= args.size()) {
            return usageError(QStringLiteral("%1 needs a value").arg(flag));
        }
        karg.name = args.at(++i).toStdString();
        requested.push_back(std::move(karg));
    }
    if (requested.empty()) {
        return usageError(QStringLiteral("set-kargs needs at least one --append or --delete"));
    }

    const std::string output = updater().setKernelArgs(requested);
    if (output.empty()) {
        std::cout << "No kernel argument changes needed\n";
    } else {
        std::cout << output;
    }
    return ExitOk;
}

int AgentCli::runRebase(const QStringList &args)
{
    const QStringList positional = positionalArgs(args, {});
    if (positional.size() != 2) {
        return usageError(QStringLiteral("rebase needs IMAGE and CONTENT_DIR"));
    }

    std::unique_ptr<PowerInhibitor> inhibitor;
    if (!args.contains(QStringLiteral("--no-inhibit"))) {
        inhibitor = PowerInhibitor::forUpdate(m_config.systemdInhibitPath);
        try {
            inhibitor->acquire();
        } catch (const CommandError &e) {
            // The rebase itself is still safe; only power-key handling is
            // left unguarded.
            NLOG_WARN(kComponent,
                      QStringLiteral("inhibit_failed"),
                      QStringLiteral("Could not inhibit power state changes"),
                      (nlohmann::json{{"error", e.what()}}));
        }
    }

    const bool changed = updater().rebase(positional.at(0).toStdString(),
                                          positional.at(1).toStdString());
    std::cout << (changed ? "Rebased to " : "Already at ")
              << positional.at(0).toStdString() << "\n";
    return ExitOk;
}

int AgentCli::runCleanup(const QStringList &)
{
    updater().removePendingDeployment();
    return ExitOk;
}

int AgentCli::runPools(const QStringList &args)
{
    const QString version = getArgValue(args, QStringLiteral("--version"));
    const QStringList positional = positionalArgs(args, {QStringLiteral("--version")});
    if (positional.size() != 1 || version.isEmpty()) {
        return usageError(QStringLiteral("pools needs FILE and --version"));
    }

    QFile file(positional.front());
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "nodeos-agent: cannot open " << positional.front().toStdString() << "\n";
        return ExitFailure;
    }

    std::vector<MachineConfigPool> pools;
    std::map<std::string, MachineConfig> configs;
    try {
        const auto payload = nlohmann::json::parse(file.readAll().toStdString());
        pools = payload.value("pools", nlohmann::json::array()).get<std::vector<MachineConfigPool>>();
        for (const auto &config : payload.value("machineConfigs", nlohmann::json::array())) {
            MachineConfig mc = config.get<MachineConfig>();
            if (mc.name.empty()) {
                throw NodeOsError(ErrorKind::Parse,
                                  "machine config without a name in "
                                      + positional.front().toStdString());
            }
            configs[mc.name] = mc;
        }
    } catch (const nlohmann::json::exception &e) {
        throw NodeOsError(ErrorKind::Parse,
                          "malformed pools file " + positional.front().toStdString() + ": "
                              + e.what());
    }

    const auto summary = summarizePools(
        pools, version.toStdString(), [&configs](const std::string &name) {
            auto it = configs.find(name);
            return it == configs.end() ? std::optional<MachineConfig>()
                                       : std::optional<MachineConfig>(it->second);
        });

    std::cout << nlohmann::json(summary).dump(2) << std::endl;
    return ExitOk;
}

int AgentCli::runDaemon(const QStringList &)
{
    NodeUpdater &host = updater();

    StopSignal stop;
    std::vector<PluginResult> results;
    {
        // Before any plugin thread exists, so that only the guard's waiter
        // ever sees SIGINT/SIGTERM.
        SignalStopGuard signalGuard(stop);

        PluginRegistry registry;
        registry.registerPlugin(std::make_unique<DeploymentWatchPlugin>(
            host, std::chrono::duration_cast<std::chrono::milliseconds>(m_config.watchInterval)));

        NLOG_INFO(kComponent,
                  QStringLiteral("daemon_start"),
                  QStringLiteral("nodeos-agent %1 watching host").arg(QLatin1String(NODEOS_VERSION)),
                  (nlohmann::json{{"plugins", registry.size()},
                                  {"variant", hostVariantName(host.variant())}}));

        results = PluginHarness::execute(registry, stop);
    }

    NLOG_INFO(kComponent,
              QStringLiteral("daemon_stop"),
              QStringLiteral("nodeos-agent stopped"),
              nlohmann::json::object());

    for (const auto &result : results) {
        if (result.failed) {
            return ExitFailure;
        }
    }
    return ExitOk;
}

} // namespace nodeos
