#include "daemon/node_updater.hpp"

#include "common/command_runner.hpp"
#include "common/logging.hpp"
#include "daemon/host_os.hpp"
#include "daemon/not_coreos_client.hpp"
#include "daemon/rpm_ostree_client.hpp"

namespace nodeos {

std::unique_ptr<NodeUpdater> createNodeUpdater(const AgentConfig &config)
{
    const OsRelease release = readOsRelease(QString::fromStdString(config.osReleasePath));

    if (!release.isCoreOsVariant()) {
        NLOG_WARN(QStringLiteral("NodeUpdater"),
                  QStringLiteral("not_coreos"),
                  QStringLiteral("Host operating system %1 is not a CoreOS variant. "
                                 "Update functionality is disabled.")
                      .arg(QString::fromStdString(release.id)),
                  (nlohmann::json{{"id", release.id},
                                  {"variantId", release.variantId},
                                  {"versionId", release.versionId}}));
        return std::make_unique<NotCoreOsClient>(config);
    }

    NLOG_INFO(QStringLiteral("NodeUpdater"),
              QStringLiteral("coreos_detected"),
              QStringLiteral("Host operating system %1 supports image-based updates")
                  .arg(QString::fromStdString(release.prettyName.empty() ? release.id
                                                                         : release.prettyName)),
              (nlohmann::json{{"id", release.id}, {"variantId", release.variantId}}));

    return std::make_unique<RpmOstreeClient>(config, systemCommandRunner());
}

const char *hostVariantName(HostVariant variant)
{
    switch (variant) {
    case HostVariant::CoreOs:
        return "coreos";
    case HostVariant::NotCoreOs:
        return "not-coreos";
    }
    return "unknown";
}

} // namespace nodeos
