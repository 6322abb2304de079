#pragma once

#include <memory>
#include <string>
#include <vector>

#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace nodeos {

enum class HostVariant {
    CoreOs,
    NotCoreOs
};

/**
 * NodeUpdater is everything the agent may ask of the host's OS deployment
 * store. Two implementations exist:
 * - RpmOstreeClient drives rpm-ostree on CoreOS-style hosts
 * - NotCoreOsClient answers on any other host; every mutating call throws
 *   UnsupportedOperationError
 *
 * Which one a process gets is decided once by createNodeUpdater(). Callers
 * must serialize calls on one instance; a second rebase against the same
 * local repository while one is running is unsafe at the host-tool level.
 */
class NodeUpdater
{
public:
    virtual ~NodeUpdater() = default;

    virtual HostVariant variant() const = 0;

    virtual Deployment getBootedDeployment() = 0;
    // Image reference recorded in the booted deployment's custom origin, plus
    // its version. Empty imageUrl when the origin was not set by a rebase.
    virtual OsImageUrl getBootedOsImageUrl() = 0;
    virtual std::vector<std::string> getKernelArgs() = 0;
    virtual std::string getStatus() = 0;

    // Returns true when the host was rebased.
    virtual bool rebase(const std::string &imageUrl, const std::string &osImageContentDir) = 0;
    virtual void removePendingDeployment() = 0;
    // Returns the raw output of the kargs call, empty when nothing changed.
    virtual std::string setKernelArgs(const std::vector<KernelArgument> &args) = 0;
    virtual std::string runRpmOstree(const QString &noun, const QStringList &args) = 0;
};

// Reads os-release once and returns the matching implementation. Throws
// NodeOsError(HostState) when the host cannot be identified; the caller is
// expected to treat that as a startup failure.
std::unique_ptr<NodeUpdater> createNodeUpdater(const AgentConfig &config);

const char *hostVariantName(HostVariant variant);

} // namespace nodeos
