#pragma once

#include <chrono>
#include <string>

#include <QString>

namespace nodeos {

// Paths and tunables for talking to the host. Defaults match a stock
// CoreOS-style node; every field can be overridden from a JSON file and then
// from NODEOS_* environment variables.
struct AgentConfig {
    std::string rpmOstreePath = "/usr/bin/rpm-ostree";
    std::string ostreePath = "ostree";
    std::string skopeoPath = "skopeo";
    std::string podmanPath = "podman";
    std::string systemdInhibitPath = "systemd-inhibit";

    // Registry pull secret, only passed along when the file exists.
    std::string authFile = "/var/lib/kubelet/config.json";
    std::string osReleasePath = "/etc/os-release";
    std::string kernelCmdlinePath = "/proc/cmdline";

    int pullRetries = 5;
    std::chrono::milliseconds pullRetryDelay{5000};

    std::string customOriginDescription = "Managed by nodeos-agent";

    std::string logDir;
    bool debugTrace = false;
    bool logToStderr = true;

    std::chrono::seconds watchInterval{300};
};

// Load a config file (JSON object, unknown keys ignored). An empty path
// yields defaults. Throws NodeOsError(Config) on unreadable/malformed files.
AgentConfig loadConfigFile(const QString &path);

// Apply NODEOS_* overrides in place.
void applyEnvironmentOverrides(AgentConfig &config);

AgentConfig loadConfig(const QString &path);

} // namespace nodeos
