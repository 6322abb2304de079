#include <QtTest/QtTest>

#include <atomic>
#include <csignal>
#include <stdexcept>
#include <thread>

#include <pthread.h>

#include "daemon/deployment_watch_plugin.hpp"
#include "daemon/not_coreos_client.hpp"
#include "daemon/plugin_harness.hpp"
#include "daemon/rpm_ostree_client.hpp"
#include "fakes/FakeHost.hpp"
#include "fakes/StatusFixtures.hpp"

namespace {

bool signalBlocked(int signal)
{
    sigset_t current;
    sigemptyset(&current);
    pthread_sigmask(SIG_BLOCK, nullptr, &current);
    return sigismember(&current, signal) == 1;
}

// Blocks until stop, then reports that as its terminal error.
class WaitForStopPlugin : public nodeos::Plugin
{
public:
    explicit WaitForStopPlugin(std::atomic<int> &started)
        : m_started(started)
    {
    }

    std::string name() const override { return "waiter"; }
    std::string kind() const override { return "plugin"; }

    void run(const nodeos::StopSignal &stop) override
    {
        ++m_started;
        while (!stop.waitFor(std::chrono::milliseconds(10))) {
        }
        throw std::runtime_error("plugin waiter: received stop signal");
    }

private:
    std::atomic<int> &m_started;
};

class QuickPlugin : public nodeos::Plugin
{
public:
    QuickPlugin(std::string name, bool fail, std::atomic<int> &started)
        : m_name(std::move(name))
        , m_fail(fail)
        , m_started(started)
    {
    }

    std::string name() const override { return m_name; }
    std::string kind() const override { return "daemon"; }

    void run(const nodeos::StopSignal &) override
    {
        ++m_started;
        if (m_fail) {
            throw std::runtime_error(m_name + " exploded");
        }
    }

private:
    std::string m_name;
    bool m_fail;
    std::atomic<int> &m_started;
};

} // namespace

class PluginHarnessTests : public QObject
{
    Q_OBJECT
private slots:
    void testStopSignal();
    void testDuplicateNamesRejected();
    void testAllPluginsRunAndErrorsAreCollected();
    void testEmptyRegistry();
    void testDeploymentWatchStopsOnSignal();
    void testDeploymentWatchSurvivesHostErrors();
    void testSignalGuardBlocksAndRestores();
    void testSignalGuardUnwindsOnException();
};

void PluginHarnessTests::testStopSignal()
{
    nodeos::StopSignal stop;
    QVERIFY(!stop.isRequested());
    QVERIFY(!stop.waitFor(std::chrono::milliseconds(1)));
    stop.request();
    QVERIFY(stop.isRequested());
    QVERIFY(stop.waitFor(std::chrono::hours(1)));
}

void PluginHarnessTests::testDuplicateNamesRejected()
{
    std::atomic<int> started{0};
    nodeos::PluginRegistry registry;
    registry.registerPlugin(std::make_unique<QuickPlugin>("one", false, started));
    QVERIFY_EXCEPTION_THROWN(
        registry.registerPlugin(std::make_unique<QuickPlugin>("one", false, started)),
        std::invalid_argument);
    QVERIFY_EXCEPTION_THROWN(registry.registerPlugin(nullptr), std::invalid_argument);
    QCOMPARE(registry.size(), static_cast<size_t>(1));
}

void PluginHarnessTests::testAllPluginsRunAndErrorsAreCollected()
{
    std::atomic<int> started{0};
    nodeos::PluginRegistry registry;
    registry.registerPlugin(std::make_unique<WaitForStopPlugin>(started));
    registry.registerPlugin(std::make_unique<QuickPlugin>("clean", false, started));
    registry.registerPlugin(std::make_unique<QuickPlugin>("broken", true, started));

    nodeos::StopSignal stop;
    std::thread stopper([&stop, &started] {
        while (started.load() < 3) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        stop.request();
    });

    const auto results = nodeos::PluginHarness::execute(registry, stop);
    stopper.join();

    QCOMPARE(started.load(), 3);
    QCOMPARE(results.size(), static_cast<size_t>(3));

    QCOMPARE(QString::fromStdString(results[0].name), QStringLiteral("waiter"));
    QCOMPARE(QString::fromStdString(results[0].kind), QStringLiteral("plugin"));
    QVERIFY(results[0].failed);
    QVERIFY(QString::fromStdString(results[0].error).contains(QStringLiteral("stop signal")));

    QCOMPARE(QString::fromStdString(results[1].name), QStringLiteral("clean"));
    QVERIFY(!results[1].failed);
    QVERIFY(results[1].error.empty());

    QCOMPARE(QString::fromStdString(results[2].name), QStringLiteral("broken"));
    QVERIFY(results[2].failed);
    QCOMPARE(QString::fromStdString(results[2].error), QStringLiteral("broken exploded"));
}

void PluginHarnessTests::testEmptyRegistry()
{
    nodeos::PluginRegistry registry;
    nodeos::StopSignal stop;
    QVERIFY(nodeos::PluginHarness::execute(registry, stop).empty());
}

void PluginHarnessTests::testDeploymentWatchStopsOnSignal()
{
    nodeos::AgentConfig config;
    nodeos::NotCoreOsClient updater(config);
    nodeos::DeploymentWatchPlugin plugin(updater, std::chrono::hours(1));

    nodeos::StopSignal stop;
    std::thread stopper([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop.request();
    });
    plugin.run(stop);
    stopper.join();

    QCOMPARE(plugin.pollCount(), 1);
}

void PluginHarnessTests::testDeploymentWatchSurvivesHostErrors()
{
    nodeos::testing::FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"),
            nodeos::testing::statusJsonWithBooted(nullptr, false));

    nodeos::AgentConfig config;
    config.rpmOstreePath = "rpm-ostree";
    nodeos::RpmOstreeClient updater(config, host.runner());

    auto plugin = std::make_unique<nodeos::DeploymentWatchPlugin>(updater,
                                                                  std::chrono::milliseconds(5));
    nodeos::DeploymentWatchPlugin *watch = plugin.get();
    nodeos::PluginRegistry registry;
    registry.registerPlugin(std::move(plugin));

    nodeos::StopSignal stop;
    std::thread stopper([&stop, watch] {
        while (watch->pollCount() < 3) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        stop.request();
    });
    const auto results = nodeos::PluginHarness::execute(registry, stop);
    stopper.join();

    QCOMPARE(results.size(), static_cast<size_t>(1));
    QVERIFY(!results.front().failed);
    QVERIFY(host.count(QStringLiteral("rpm-ostree status --json")) >= 3);
}

void PluginHarnessTests::testSignalGuardBlocksAndRestores()
{
    QVERIFY(!signalBlocked(SIGINT));
    QVERIFY(!signalBlocked(SIGTERM));

    nodeos::StopSignal stop;
    {
        nodeos::SignalStopGuard guard(stop);
        QVERIFY(signalBlocked(SIGINT));
        QVERIFY(signalBlocked(SIGTERM));
    }

    QVERIFY(!signalBlocked(SIGINT));
    QVERIFY(!signalBlocked(SIGTERM));
}

void PluginHarnessTests::testSignalGuardUnwindsOnException()
{
    nodeos::StopSignal stop;
    bool caught = false;
    try {
        nodeos::SignalStopGuard guard(stop);
        nodeos::PluginRegistry registry;
        registry.registerPlugin(nullptr);
    } catch (const std::invalid_argument &) {
        caught = true;
    }

    // Reaching this point means the waiter thread was joined rather than
    // destroyed while joinable.
    QVERIFY(caught);
    QVERIFY(!signalBlocked(SIGINT));
    QVERIFY(!signalBlocked(SIGTERM));
}

QTEST_MAIN(PluginHarnessTests)
#include "test_plugin_harness.moc"
