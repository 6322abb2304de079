#pragma once

#include <memory>

#include "common/command_runner.hpp"
#include "common/config.hpp"
#include "daemon/image_resolver.hpp"
#include "daemon/node_updater.hpp"

namespace nodeos {

// Prefix marking a custom origin written by rebase().
inline constexpr const char *kPivotScheme = "pivot://";

// Extract the image reference from a deployment's custom origin, or "" when
// the origin is missing or was not written by us.
std::string imageUrlFromCustomOrigin(const Deployment &deployment);

/**
 * NodeUpdater for rpm-ostree hosts.
 *
 * Host state is never cached: each call re-runs `rpm-ostree status --json`,
 * since an operator may rebase the host behind our back at any time.
 */
class RpmOstreeClient : public NodeUpdater
{
public:
    RpmOstreeClient(const AgentConfig &config, CommandRunner runner);
    RpmOstreeClient(const AgentConfig &config,
                    CommandRunner runner,
                    std::unique_ptr<ImageResolver> resolver);

    HostVariant variant() const override;

    Deployment getBootedDeployment() override;
    OsImageUrl getBootedOsImageUrl() override;
    std::vector<std::string> getKernelArgs() override;
    std::string getStatus() override;

    bool rebase(const std::string &imageUrl, const std::string &osImageContentDir) override;
    void removePendingDeployment() override;
    std::string setKernelArgs(const std::vector<KernelArgument> &args) override;
    std::string runRpmOstree(const QString &noun, const QStringList &args) override;

private:
    std::vector<Deployment> readDeployments();

    AgentConfig m_config;
    CommandRunner m_runner;
    std::unique_ptr<ImageResolver> m_resolver;
};

} // namespace nodeos
