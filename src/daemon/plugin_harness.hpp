#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <csignal>

namespace nodeos {

// Cooperative cancellation shared by every plugin of one harness run.
class StopSignal
{
public:
    void request();
    bool isRequested() const;

    // Sleep up to `timeout`; returns true as soon as stop is requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_requested = false;
};

class Plugin
{
public:
    virtual ~Plugin() = default;

    virtual std::string name() const = 0;
    // "plugin" or "daemon".
    virtual std::string kind() const = 0;

    // Runs until done or until `stop` is requested. Throwing reports a
    // terminal error for this plugin only.
    virtual void run(const StopSignal &stop) = 0;
};

// Append-only; built once in main() and handed to the harness.
class PluginRegistry
{
public:
    // Throws std::invalid_argument for a null plugin or a duplicate name.
    void registerPlugin(std::unique_ptr<Plugin> plugin);

    const std::vector<std::unique_ptr<Plugin>> &plugins() const;
    std::size_t size() const;

private:
    std::vector<std::unique_ptr<Plugin>> m_plugins;
};

struct PluginResult {
    std::string name;
    std::string kind;
    bool failed = false;
    std::string error;
};

class PluginHarness
{
public:
    // Runs every registered plugin on its own thread and blocks until all of
    // them return. Results keep registration order; every failure is logged.
    // If a thread cannot be started, stop is requested, the plugins already
    // running are joined and the error is rethrown.
    static std::vector<PluginResult> execute(const PluginRegistry &registry,
                                             StopSignal &stop);
};

/**
 * Turns SIGINT/SIGTERM into a stop request.
 *
 * The constructor blocks both signals in the calling thread (construct it
 * before any other thread exists so they inherit the mask) and starts a
 * thread that sigwait()s for them. The destructor wakes that thread if no
 * signal arrived, joins it and unblocks the signals again, so leaving the
 * scope by exception is safe.
 */
class SignalStopGuard
{
public:
    explicit SignalStopGuard(StopSignal &stop);
    ~SignalStopGuard();

    SignalStopGuard(const SignalStopGuard &) = delete;
    SignalStopGuard &operator=(const SignalStopGuard &) = delete;

private:
    StopSignal &m_stop;
    sigset_t m_signals;
    std::thread m_waiter;
};

} // namespace nodeos
