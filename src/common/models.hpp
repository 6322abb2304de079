#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nodeos {

// One entry of `rpm-ostree status --json` .deployments[].
struct Deployment {
    std::string id;
    std::string osName;
    int32_t serial = 0;
    std::string checksum;
    std::string version;
    uint64_t timestamp = 0;
    bool booted = false;
    std::string origin;
    // [0] is the origin URL, [1] the human description.
    std::vector<std::string> customOrigin;
};

struct DeploymentState {
    std::vector<Deployment> deployments;
};

enum class KernelArgOperation {
    Remove,
    Add
};

struct KernelArgument {
    KernelArgOperation operation = KernelArgOperation::Add;
    std::string name;
};

// Subset of skopeo/podman image inspection output.
struct ImageInspection {
    std::string name;
    std::string tag;
    std::string digest;
    std::vector<std::string> repoDigests;
    std::map<std::string, std::string> labels;
    std::string architecture;
    std::string os;
    std::vector<std::string> layers;
};

struct ResolvedCommit {
    std::string checksum;
    std::string version;
    std::string source;
};

struct OsImageUrl {
    std::string imageUrl;
    std::string version;
};

} // namespace nodeos
