#pragma once

#include "common/config.hpp"
#include "daemon/node_updater.hpp"

namespace nodeos {

// NodeUpdater for hosts without image-based updates (e.g. RHEL 7 workers).
// It holds no command runner and never starts a process; mutating calls
// throw UnsupportedOperationError.
class NotCoreOsClient : public NodeUpdater
{
public:
    explicit NotCoreOsClient(const AgentConfig &config);

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
    std::string m_kernelCmdlinePath;
};

} // namespace nodeos
