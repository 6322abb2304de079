#pragma once

#include <atomic>
#include <chrono>

#include "daemon/node_updater.hpp"
#include "daemon/plugin_harness.hpp"

namespace nodeos {

// Logs the booted image and checksum every `interval`, and whenever they
// change between two polls. Exits cleanly on stop.
class DeploymentWatchPlugin : public Plugin
{
public:
    DeploymentWatchPlugin(NodeUpdater &updater, std::chrono::milliseconds interval);

    std::string name() const override;
    std::string kind() const override;
    void run(const StopSignal &stop) override;

    int pollCount() const;

private:
    void poll();

    NodeUpdater &m_updater;
    std::chrono::milliseconds m_interval;
    std::string m_lastChecksum;
    std::atomic<int> m_pollCount{0};
};

} // namespace nodeos
