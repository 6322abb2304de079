#include "common/config.hpp"

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace nodeos {

namespace {

void readString(const nlohmann::json &j, const char *key, std::string &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_string()) {
        throw NodeOsError(ErrorKind::Config,
                          std::string("config key '") + key + "' must be a string");
    }
    target = it->get<std::string>();
}

void readInt(const nlohmann::json &j, const char *key, long long &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw NodeOsError(ErrorKind::Config,
                          std::string("config key '") + key + "' must be an integer");
    }
    target = it->get<long long>();
}

void readBool(const nlohmann::json &j, const char *key, bool &target)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw NodeOsError(ErrorKind::Config,
                          std::string("config key '") + key + "' must be a boolean");
    }
    target = it->get<bool>();
}

void overrideString(const char *name, std::string &target)
{
    if (qEnvironmentVariableIsSet(name)) {
        target = qEnvironmentVariable(name).toStdString();
    }
}

} // namespace

AgentConfig loadConfigFile(const QString &path)
{
    AgentConfig config;
    if (path.isEmpty()) {
        return config;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw NodeOsError(ErrorKind::Config,
                          "cannot open config file " + path.toStdString() + ": "
                              + file.errorString().toStdString());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &e) {
        throw NodeOsError(ErrorKind::Config,
                          "malformed config file " + path.toStdString() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw NodeOsError(ErrorKind::Config,
                          "config file " + path.toStdString() + " must hold a JSON object");
    }

    readString(j, "rpmOstreePath", config.rpmOstreePath);
    readString(j, "ostreePath", config.ostreePath);
    readString(j, "skopeoPath", config.skopeoPath);
    readString(j, "podmanPath", config.podmanPath);
    readString(j, "systemdInhibitPath", config.systemdInhibitPath);
    readString(j, "authFile", config.authFile);
    readString(j, "osReleasePath", config.osReleasePath);
    readString(j, "kernelCmdlinePath", config.kernelCmdlinePath);
    readString(j, "customOriginDescription", config.customOriginDescription);
    readString(j, "logDir", config.logDir);
    readBool(j, "debugTrace", config.debugTrace);
    readBool(j, "logToStderr", config.logToStderr);

    long long retries = config.pullRetries;
    readInt(j, "pullRetries", retries);
    if (retries < 1) {
        throw NodeOsError(ErrorKind::Config, "pullRetries must be at least 1");
    }
    config.pullRetries = static_cast<int>(retries);

    long long delayMs = config.pullRetryDelay.count();
    readInt(j, "pullRetryDelayMs", delayMs);
    if (delayMs < 0) {
        throw NodeOsError(ErrorKind::Config, "pullRetryDelayMs must not be negative");
    }
    config.pullRetryDelay = std::chrono::milliseconds(delayMs);

    long long watchSeconds = config.watchInterval.count();
    readInt(j, "watchIntervalSeconds", watchSeconds);
    if (watchSeconds < 1) {
        throw NodeOsError(ErrorKind::Config, "watchIntervalSeconds must be at least 1");
    }
    config.watchInterval = std::chrono::seconds(watchSeconds);

    return config;
}

void applyEnvironmentOverrides(AgentConfig &config)
{
    overrideString("NODEOS_RPM_OSTREE", config.rpmOstreePath);
    overrideString("NODEOS_OSTREE", config.ostreePath);
    overrideString("NODEOS_SKOPEO", config.skopeoPath);
    overrideString("NODEOS_PODMAN", config.podmanPath);
    overrideString("NODEOS_AUTH_FILE", config.authFile);
    overrideString("NODEOS_OS_RELEASE", config.osReleasePath);
    overrideString("NODEOS_KERNEL_CMDLINE", config.kernelCmdlinePath);
    overrideString("NODEOS_LOG_DIR", config.logDir);

    if (qEnvironmentVariableIsSet("NODEOS_DEBUG_TRACE")) {
        config.debugTrace = qEnvironmentVariableIntValue("NODEOS_DEBUG_TRACE") == 1;
    }
    if (qEnvironmentVariableIsSet("NODEOS_PULL_RETRIES")) {
        bool ok = false;
        const int retries = qEnvironmentVariableIntValue("NODEOS_PULL_RETRIES", &ok);
        if (!ok || retries < 1) {
            throw NodeOsError(ErrorKind::Config,
                              "NODEOS_PULL_RETRIES must be a positive integer");
        }
        config.pullRetries = retries;
    }
}

AgentConfig loadConfig(const QString &path)
{
    AgentConfig config = loadConfigFile(path);
    applyEnvironmentOverrides(config);
    return config;
}

} // namespace nodeos
