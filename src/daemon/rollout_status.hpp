#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "daemon/node_updater.hpp"

namespace nodeos {

inline constexpr const char *kGeneratedByVersionAnnotation =
    "machineconfiguration.openshift.io/generated-by-controller-version";

struct MachineConfig {
    std::string name;
    std::map<std::string, std::string> annotations;
};

struct MachineConfigPool {
    std::string name;
    std::string configurationName;
    std::vector<std::string> configurationSources;
    int machineCount = 0;
    int updatedMachineCount = 0;
    // Condition type ("Updated", "Updating", ...) -> status is True.
    std::map<std::string, bool> conditions;
};

using MachineConfigGetter =
    std::function<std::optional<MachineConfig>(const std::string &name)>;

// Empty when `pool` was rendered by controller `version`; otherwise the
// reason it is not.
std::string validatePoolConfiguration(const MachineConfigPool &pool,
                                      const std::string &version,
                                      const MachineConfigGetter &getter);

std::string describePoolStatus(const MachineConfigPool &pool);

// pool name -> description, for valid pools only.
std::map<std::string, std::string> summarizePools(const std::vector<MachineConfigPool> &pools,
                                                  const std::string &version,
                                                  const MachineConfigGetter &getter);

// What this node reports upward about itself.
struct NodeStatus {
    HostVariant variant = HostVariant::NotCoreOs;
    std::string bootedId;
    std::string bootedChecksum;
    std::string imageUrl;
    std::string version;
};

NodeStatus collectNodeStatus(NodeUpdater &updater);

void from_json(const nlohmann::json &j, MachineConfig &config);
void from_json(const nlohmann::json &j, MachineConfigPool &pool);
void to_json(nlohmann::json &j, const NodeStatus &status);

} // namespace nodeos
