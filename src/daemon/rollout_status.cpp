#include "daemon/rollout_status.hpp"

#include <QString>

#include "common/logging.hpp"
#include "daemon/rpm_ostree_client.hpp"

namespace nodeos {

namespace {

bool conditionTrue(const MachineConfigPool &pool, const char *type)
{
    auto it = pool.conditions.find(type);
    return it != pool.conditions.end() && it->second;
}

} // namespace

std::string validatePoolConfiguration(const MachineConfigPool &pool,
                                      const std::string &version,
                                      const MachineConfigGetter &getter)
{
    if (pool.configurationName.empty()) {
        return "configuration for pool " + pool.name + " is empty";
    }
    if (pool.configurationSources.empty()) {
        return "list of MachineConfigs that were used to generate configuration for pool "
            + pool.name + " is empty";
    }

    std::vector<std::string> names{pool.configurationName};
    names.insert(names.end(), pool.configurationSources.begin(), pool.configurationSources.end());

    for (const auto &name : names) {
        const std::optional<MachineConfig> config = getter(name);
        if (!config) {
            return "machineconfig " + name + " not found";
        }

        auto it = config->annotations.find(kGeneratedByVersionAnnotation);
        const bool annotated = it != config->annotations.end();
        // The rendered config must carry the annotation; user-provided
        // fragments do not, and are not version-checked.
        if (!annotated && name == pool.configurationName) {
            return name + " must be created by controller version " + version;
        }
        if (annotated && it->second != version) {
            return "controller version mismatch for " + name + " expected " + version
                + " has " + it->second;
        }
    }
    return {};
}

std::string describePoolStatus(const MachineConfigPool &pool)
{
    if (conditionTrue(pool, "Updated")) {
        return "all " + std::to_string(pool.machineCount)
            + " nodes are at latest configuration " + pool.configurationName;
    }
    if (conditionTrue(pool, "Updating")) {
        return std::to_string(pool.updatedMachineCount) + " out of "
            + std::to_string(pool.machineCount)
            + " nodes have updated to latest configuration " + pool.configurationName;
    }
    return "<unknown>";
}

std::map<std::string, std::string> summarizePools(const std::vector<MachineConfigPool> &pools,
                                                  const std::string &version,
                                                  const MachineConfigGetter &getter)
{
    std::map<std::string, std::string> summary;
    for (const auto &pool : pools) {
        const std::string invalid = validatePoolConfiguration(pool, version, getter);
        if (!invalid.empty()) {
            NLOG_DEBUG(QStringLiteral("RolloutStatus"),
                       QStringLiteral("pool_skipped"),
                       QStringLiteral("Skipping status for pool %1 because %2")
                           .arg(QString::fromStdString(pool.name),
                                QString::fromStdString(invalid)),
                       nlohmann::json::object());
            continue;
        }
        summary[pool.name] = describePoolStatus(pool);
    }
    return summary;
}

NodeStatus collectNodeStatus(NodeUpdater &updater)
{
    NodeStatus status;
    status.variant = updater.variant();

    const Deployment booted = updater.getBootedDeployment();
    status.bootedId = booted.id;
    status.bootedChecksum = booted.checksum;
    status.version = booted.version;
    status.imageUrl = imageUrlFromCustomOrigin(booted);
    return status;
}

// MachineConfig objects keep name and annotations under metadata; the flat
// {"name", "annotations"} form is accepted for hand-written files.
void from_json(const nlohmann::json &j, MachineConfig &config)
{
    const nlohmann::json &source =
        j.contains("metadata") && j.at("metadata").is_object() ? j.at("metadata") : j;

    config.name = source.value("name", "");
    config.annotations.clear();
    if (source.contains("annotations") && source.at("annotations").is_object()) {
        for (const auto &item : source.at("annotations").items()) {
            if (item.value().is_string()) {
                config.annotations[item.key()] = item.value().get<std::string>();
            }
        }
    }
}

// Accepts the subset of a MachineConfigPool object that status reporting
// reads: metadata.name, status.configuration{name,source[].name},
// status.machineCount, status.updatedMachineCount, status.conditions[].
void from_json(const nlohmann::json &j, MachineConfigPool &pool)
{
    const nlohmann::json metadata = j.value("metadata", nlohmann::json::object());
    const nlohmann::json status = j.value("status", nlohmann::json::object());
    const nlohmann::json configuration = status.value("configuration", nlohmann::json::object());

    pool.name = metadata.value("name", "");
    pool.configurationName = configuration.value("name", "");
    pool.configurationSources.clear();
    if (configuration.contains("source") && configuration.at("source").is_array()) {
        for (const auto &source : configuration.at("source")) {
            pool.configurationSources.push_back(source.value("name", ""));
        }
    }
    pool.machineCount = status.value("machineCount", 0);
    pool.updatedMachineCount = status.value("updatedMachineCount", 0);

    pool.conditions.clear();
    if (status.contains("conditions") && status.at("conditions").is_array()) {
        for (const auto &condition : status.at("conditions")) {
            pool.conditions[condition.value("type", "")] =
                condition.value("status", "") == "True";
        }
    }
}

void to_json(nlohmann::json &j, const NodeStatus &status)
{
    j = nlohmann::json{
        {"variant", hostVariantName(status.variant)},
        {"bootedId", status.bootedId},
        {"bootedChecksum", status.bootedChecksum},
        {"imageUrl", status.imageUrl},
        {"version", status.version}
    };
}

} // namespace nodeos
