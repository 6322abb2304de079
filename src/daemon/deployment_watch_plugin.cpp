#include "daemon/deployment_watch_plugin.hpp"

#include <QString>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/rpm_ostree_client.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("DeploymentWatch");

} // namespace

DeploymentWatchPlugin::DeploymentWatchPlugin(NodeUpdater &updater,
                                             std::chrono::milliseconds interval)
    : m_updater(updater)
    , m_interval(interval)
{
}

std::string DeploymentWatchPlugin::name() const
{
    return "deployment-watch";
}

std::string DeploymentWatchPlugin::kind() const
{
    return "daemon";
}

int DeploymentWatchPlugin::pollCount() const
{
    return m_pollCount.load();
}

void DeploymentWatchPlugin::run(const StopSignal &stop)
{
    while (!stop.isRequested()) {
        poll();
        if (stop.waitFor(m_interval)) {
            break;
        }
    }
}

void DeploymentWatchPlugin::poll()
{
    ++m_pollCount;
    logging::CorrelationScope scope(logging::newCorrelationId(QStringLiteral("watch")));

    Deployment booted;
    try {
        booted = m_updater.getBootedDeployment();
    } catch (const NodeOsError &e) {
        // Host-state errors are worth surfacing but not worth dying for; the
        // next poll may see a consistent host again.
        NLOG_WARN(kComponent,
                  QStringLiteral("poll_failed"),
                  QStringLiteral("Failed to read booted deployment"),
                  (nlohmann::json{{"error", e.what()}, {"kind", errorKindName(e.kind())}}));
        return;
    }

    const std::string imageUrl = imageUrlFromCustomOrigin(booted);
    const bool changed = !m_lastChecksum.empty() && m_lastChecksum != booted.checksum;
    m_lastChecksum = booted.checksum;

    const nlohmann::json context = {
        {"variant", hostVariantName(m_updater.variant())},
        {"id", booted.id},
        {"checksum", booted.checksum},
        {"version", booted.version},
        {"imageUrl", imageUrl}
    };

    if (changed) {
        NLOG_WARN(kComponent,
                  QStringLiteral("booted_changed"),
                  QStringLiteral("Booted deployment checksum changed since last poll"),
                  context);
    } else {
        NLOG_INFO(kComponent,
                  QStringLiteral("booted"),
                  QStringLiteral("Booted %1").arg(QString::fromStdString(
                      imageUrl.empty() ? booted.checksum : imageUrl)),
                  context);
    }
}

} // namespace nodeos
