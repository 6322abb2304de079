#include "daemon/not_coreos_client.hpp"

#include <QFile>

#include "common/errors.hpp"
#include "common/kargs.hpp"
#include "common/logging.hpp"

namespace nodeos {

NotCoreOsClient::NotCoreOsClient(const AgentConfig &config)
    : m_kernelCmdlinePath(config.kernelCmdlinePath)
{
}

HostVariant NotCoreOsClient::variant() const
{
    return HostVariant::NotCoreOs;
}

Deployment NotCoreOsClient::getBootedDeployment()
{
    return Deployment{};
}

OsImageUrl NotCoreOsClient::getBootedOsImageUrl()
{
    throw UnsupportedOperationError();
}

std::vector<std::string> NotCoreOsClient::getKernelArgs()
{
    QFile file(QString::fromStdString(m_kernelCmdlinePath));
    if (!file.open(QIODevice::ReadOnly)) {
        throw NodeOsError(ErrorKind::HostState,
                          "failed to read " + m_kernelCmdlinePath + ": "
                              + file.errorString().toStdString());
    }
    return spaceSplit(file.readAll().toStdString());
}

std::string NotCoreOsClient::getStatus()
{
    throw UnsupportedOperationError();
}

bool NotCoreOsClient::rebase(const std::string &, const std::string &)
{
    NLOG_INFO(QStringLiteral("NotCoreOsClient"),
              QStringLiteral("rebase_unsupported"),
              QStringLiteral("Rebase is not supported on this system."),
              nlohmann::json::object());
    throw UnsupportedOperationError();
}

void NotCoreOsClient::removePendingDeployment()
{
    throw UnsupportedOperationError();
}

std::string NotCoreOsClient::setKernelArgs(const std::vector<KernelArgument> &)
{
    throw UnsupportedOperationError();
}

std::string NotCoreOsClient::runRpmOstree(const QString &, const QStringList &)
{
    throw UnsupportedOperationError();
}

} // namespace nodeos
