#include "daemon/plugin_harness.hpp"

#include <stdexcept>

#include <QString>

#include <pthread.h>

#include "common/logging.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("PluginHarness");

void joinAll(std::vector<std::thread> &threads)
{
    for (auto &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace

void StopSignal::request()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requested = true;
    }
    m_cv.notify_all();
}

bool StopSignal::isRequested() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requested;
}

bool StopSignal::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_requested; });
}

void PluginRegistry::registerPlugin(std::unique_ptr<Plugin> plugin)
{
    if (!plugin) {
        throw std::invalid_argument("cannot register a null plugin");
    }
    for (const auto &existing : m_plugins) {
        if (existing->name() == plugin->name()) {
            throw std::invalid_argument("plugin already registered: " + plugin->name());
        }
    }

    NLOG_INFO(kComponent,
              QStringLiteral("plugin_registered"),
              QStringLiteral("plugin registered: %1 as type %2")
                  .arg(QString::fromStdString(plugin->name()),
                       QString::fromStdString(plugin->kind())),
              nlohmann::json::object());
    m_plugins.push_back(std::move(plugin));
}

const std::vector<std::unique_ptr<Plugin>> &PluginRegistry::plugins() const
{
    return m_plugins;
}

std::size_t PluginRegistry::size() const
{
    return m_plugins.size();
}

std::vector<PluginResult> PluginHarness::execute(const PluginRegistry &registry,
                                                 StopSignal &stop)
{
    const auto &plugins = registry.plugins();
    std::vector<PluginResult> results(plugins.size());
    std::vector<std::thread> threads;
    threads.reserve(plugins.size());

    try {
        // Each thread writes only its own slot, so no lock is needed.
        for (std::size_t i = 0; i < plugins.size(); ++i) {
            Plugin *plugin = plugins[i].get();
            PluginResult *result = &results[i];
            result->name = plugin->name();
            result->kind = plugin->kind();

            threads.emplace_back([plugin, result, &stop] {
                try {
                    plugin->run(stop);
                } catch (const std::exception &e) {
                    result->failed = true;
                    result->error = e.what();
                } catch (...) {
                    result->failed = true;
                    result->error = "unknown exception";
                }
            });
        }
    } catch (const std::exception &e) {
        NLOG_ERROR(kComponent,
                   QStringLiteral("start_failed"),
                   QStringLiteral("Failed to start plugin thread, stopping %1 running plugins")
                       .arg(threads.size()),
                   (nlohmann::json{{"error", e.what()}}));
        stop.request();
        joinAll(threads);
        throw;
    }

    joinAll(threads);

    for (const auto &result : results) {
        if (!result.failed) {
            continue;
        }
        NLOG_ERROR(kComponent,
                   QStringLiteral("plugin_failed"),
                   QStringLiteral("plugin %1: %2")
                       .arg(QString::fromStdString(result.name),
                            QString::fromStdString(result.error)),
                   (nlohmann::json{{"kind", result.kind}}));
    }

    return results;
}

SignalStopGuard::SignalStopGuard(StopSignal &stop)
    : m_stop(stop)
{
    sigemptyset(&m_signals);
    sigaddset(&m_signals, SIGINT);
    sigaddset(&m_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &m_signals, nullptr);

    try {
        m_waiter = std::thread([this] {
            int received = 0;
            sigwait(&m_signals, &received);
            m_stop.request();
        });
    } catch (...) {
        pthread_sigmask(SIG_UNBLOCK, &m_signals, nullptr);
        throw;
    }
}

SignalStopGuard::~SignalStopGuard()
{
    // Nothing was received; wake the waiter with a signal of its own.
    if (!m_stop.isRequested()) {
        pthread_kill(m_waiter.native_handle(), SIGTERM);
    }
    m_waiter.join();
    pthread_sigmask(SIG_UNBLOCK, &m_signals, nullptr);
}

} // namespace nodeos
