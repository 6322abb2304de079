#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace nodeos {

inline void from_json(const nlohmann::json &j, Deployment &deployment)
{
    deployment.id = j.value("id", "");
    deployment.osName = j.value("osname", "");
    deployment.serial = j.value("serial", 0);
    deployment.checksum = j.value("checksum", "");
    deployment.version = j.value("version", "");
    deployment.timestamp = j.value("timestamp", static_cast<uint64_t>(0));
    deployment.booted = j.value("booted", false);
    deployment.origin = j.value("origin", "");
    if (j.contains("custom-origin") && j.at("custom-origin").is_array()) {
        deployment.customOrigin = j.at("custom-origin").get<std::vector<std::string>>();
    } else {
        deployment.customOrigin.clear();
    }
}

inline void to_json(nlohmann::json &j, const Deployment &deployment)
{
    j = nlohmann::json{
        {"id", deployment.id},
        {"osname", deployment.osName},
        {"serial", deployment.serial},
        {"checksum", deployment.checksum},
        {"version", deployment.version},
        {"timestamp", deployment.timestamp},
        {"booted", deployment.booted},
        {"origin", deployment.origin},
        {"custom-origin", deployment.customOrigin}
    };
}

inline void from_json(const nlohmann::json &j, DeploymentState &state)
{
    if (j.contains("deployments") && j.at("deployments").is_array()) {
        state.deployments = j.at("deployments").get<std::vector<Deployment>>();
    } else {
        state.deployments.clear();
    }
}

// skopeo emits "Name", "Digest", "Labels", ...; podman emits the same keys
// but Labels may be null for images without any.
inline void from_json(const nlohmann::json &j, ImageInspection &inspection)
{
    inspection.name = j.value("Name", "");
    inspection.tag = j.value("Tag", "");
    inspection.digest = j.value("Digest", "");
    inspection.architecture = j.value("Architecture", "");
    inspection.os = j.value("Os", "");

    inspection.repoDigests.clear();
    if (j.contains("RepoDigests") && j.at("RepoDigests").is_array()) {
        inspection.repoDigests = j.at("RepoDigests").get<std::vector<std::string>>();
    }

    inspection.layers.clear();
    if (j.contains("Layers") && j.at("Layers").is_array()) {
        inspection.layers = j.at("Layers").get<std::vector<std::string>>();
    }

    inspection.labels.clear();
    if (j.contains("Labels") && j.at("Labels").is_object()) {
        for (const auto &item : j.at("Labels").items()) {
            if (item.value().is_string()) {
                inspection.labels[item.key()] = item.value().get<std::string>();
            }
        }
    }
}

inline void to_json(nlohmann::json &j, const OsImageUrl &url)
{
    j = nlohmann::json{{"imageUrl", url.imageUrl}, {"version", url.version}};
}

} // namespace nodeos
