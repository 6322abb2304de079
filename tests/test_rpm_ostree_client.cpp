#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "daemon/rpm_ostree_client.hpp"
#include "fakes/FakeHost.hpp"
#include "fakes/StatusFixtures.hpp"

using nodeos::testing::FakeHost;

namespace {

const QString kImage = QStringLiteral("quay.io/openshift/os@sha256:cccc");

QByteArray skopeoWithCommit()
{
    return QByteArrayLiteral(R"({"Name": "quay.io/openshift/os",
        "Digest": "sha256:cccc",
        "Labels": {"com.coreos.ostree-commit": "d00dfeed", "version": "416.94.202411"}})");
}

int indexOfCall(const FakeHost &host, const QString &prefix)
{
    const auto &calls = host.calls();
    for (std::size_t i = 0; i < calls.size(); ++i) {
        if (calls[i].commandLine().startsWith(prefix)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace

class RpmOstreeClientTests : public QObject
{
    Q_OBJECT
private slots:
    void testRebaseCommandLine();
    void testRebaseResolvesBeforeRebasing();
    void testRebaseFailurePropagates();
    void testResolutionFailureSkipsRebase();
    void testCustomOriginRoundTrip();
    void testRemoveAbsentArgIsNoop();
    void testCompositeArgExpands();
    void testAddDoesNotQueryHost();
    void testMixedArgsUseOneCommand();
    void testRemoveMatchesByPrefix();
    void testRemovePendingDeployment();
    void testPassthrough();

private:
    nodeos::AgentConfig config() const;
};

nodeos::AgentConfig RpmOstreeClientTests::config() const
{
    nodeos::AgentConfig cfg;
    cfg.rpmOstreePath = "rpm-ostree";
    cfg.skopeoPath = "skopeo";
    cfg.podmanPath = "podman";
    cfg.ostreePath = "ostree";
    cfg.authFile.clear();
    cfg.pullRetryDelay = std::chrono::milliseconds(0);
    return cfg;
}

void RpmOstreeClientTests::testRebaseCommandLine()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"), nodeos::testing::pivotedStatusJson());
    host.on(QStringLiteral("skopeo inspect"), skopeoWithCommit());
    host.on(QStringLiteral("rpm-ostree rebase"), QByteArray());
    nodeos::RpmOstreeClient client(config(), host.runner());

    QVERIFY(client.rebase(kImage.toStdString(), "/run/os-content"));

    const int rebaseIndex = indexOfCall(host, QStringLiteral("rpm-ostree rebase"));
    QVERIFY(rebaseIndex >= 0);
    const QStringList expected = {
        QStringLiteral("rebase"),
        QStringLiteral("--experimental"),
        QStringLiteral("/run/os-content/srv/repo:d00dfeed"),
        QStringLiteral("--custom-origin-url"),
        QStringLiteral("pivot://") + kImage,
        QStringLiteral("--custom-origin-description"),
        QStringLiteral("Managed by nodeos-agent"),
    };
    QCOMPARE(host.calls()[rebaseIndex].arguments, expected);
    QCOMPARE(host.count(QStringLiteral("podman")), 0);
    QCOMPARE(host.count(QStringLiteral("ostree refs")), 0);
}

void RpmOstreeClientTests::testRebaseResolvesBeforeRebasing()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"), nodeos::testing::pivotedStatusJson());
    host.failAlways(QStringLiteral("skopeo inspect"));
    host.on(QStringLiteral("podman pull"), QByteArray());
    host.on(QStringLiteral("podman inspect"), QByteArrayLiteral(R"([{"Labels": null}])"));
    host.on(QStringLiteral("podman rmi"), QByteArray());
    host.on(QStringLiteral("ostree refs"), QByteArrayLiteral("rhcos/x86_64\n"));
    host.on(QStringLiteral("ostree rev-parse"), QByteArrayLiteral("0badc0de\n"));
    host.on(QStringLiteral("rpm-ostree rebase"), QByteArray());
    nodeos::RpmOstreeClient client(config(), host.runner());

    QVERIFY(client.rebase(kImage.toStdString(), "/run/os-content"));

    const int status = indexOfCall(host, QStringLiteral("rpm-ostree status --json"));
    const int revParse = indexOfCall(host, QStringLiteral("ostree rev-parse"));
    const int rmi = indexOfCall(host, QStringLiteral("podman rmi"));
    const int rebase = indexOfCall(host, QStringLiteral("rpm-ostree rebase"));
    QVERIFY(status >= 0 && status < revParse);
    QVERIFY(rmi < revParse);
    QVERIFY(revParse < rebase);
    QVERIFY(host.calls()[rebase].arguments.contains(
        QStringLiteral("/run/os-content/srv/repo:0badc0de")));
}

void RpmOstreeClientTests::testRebaseFailurePropagates()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"), nodeos::testing::pivotedStatusJson());
    host.on(QStringLiteral("skopeo inspect"), skopeoWithCommit());
    host.failAlways(QStringLiteral("rpm-ostree rebase"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    QVERIFY_EXCEPTION_THROWN(client.rebase(kImage.toStdString(), "/run/os-content"),
                             nodeos::CommandError);
    QCOMPARE(host.count(QStringLiteral("rpm-ostree rebase")), 1);
}

void RpmOstreeClientTests::testResolutionFailureSkipsRebase()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"), nodeos::testing::pivotedStatusJson());
    host.on(QStringLiteral("skopeo inspect"), QByteArrayLiteral(R"({"Labels": {}})"));
    host.on(QStringLiteral("ostree refs"), QByteArrayLiteral("a\nb\n"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    QVERIFY_EXCEPTION_THROWN(client.rebase(kImage.toStdString(), "/run/os-content"),
                             nodeos::NodeOsError);
    QCOMPARE(host.count(QStringLiteral("rpm-ostree rebase")), 0);
}

void RpmOstreeClientTests::testCustomOriginRoundTrip()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree status --json"), nodeos::testing::pivotedStatusJson());
    host.on(QStringLiteral("skopeo inspect"), skopeoWithCommit());
    host.on(QStringLiteral("rpm-ostree rebase"), QByteArray());
    nodeos::RpmOstreeClient client(config(), host.runner());
    QVERIFY(client.rebase(kImage.toStdString(), "/run/os-content"));

    const QStringList rebaseArgs = host.calls()[indexOfCall(host, QStringLiteral("rpm-ostree rebase"))]
                                       .arguments;
    const QString originUrl = rebaseArgs.at(rebaseArgs.indexOf(QStringLiteral("--custom-origin-url")) + 1);
    const QString description =
        rebaseArgs.at(rebaseArgs.indexOf(QStringLiteral("--custom-origin-description")) + 1);

    // After the reboot the new deployment carries what we passed to rebase.
    const nlohmann::json origin = {originUrl.toStdString(), description.toStdString()};
    host.on(QStringLiteral("rpm-ostree status --json"),
            nodeos::testing::statusJsonWithBooted(origin.dump().c_str()));

    QCOMPARE(QString::fromStdString(client.getBootedOsImageUrl().imageUrl), kImage);
}

void RpmOstreeClientTests::testRemoveAbsentArgIsNoop()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("root=UUID=abc rw quiet\n"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    const std::string output = client.setKernelArgs(
        {{nodeos::KernelArgOperation::Remove, "nosmt"}});
    QVERIFY(output.empty());
    QCOMPARE(host.calls().size(), static_cast<size_t>(1));
    QCOMPARE(host.calls().front().arguments, QStringList{QStringLiteral("kargs")});
}

void RpmOstreeClientTests::testCompositeArgExpands()
{
    FakeHost composite;
    composite.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("ok"));
    nodeos::RpmOstreeClient compositeClient(config(), composite.runner());
    compositeClient.setKernelArgs({{nodeos::KernelArgOperation::Add, "a=1 b=2"}});

    FakeHost separate;
    separate.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("ok"));
    nodeos::RpmOstreeClient separateClient(config(), separate.runner());
    separateClient.setKernelArgs({{nodeos::KernelArgOperation::Add, "a=1"},
                                  {nodeos::KernelArgOperation::Add, "b=2"}});

    const QStringList expected = {QStringLiteral("kargs"),
                                  QStringLiteral("--append=a=1"),
                                  QStringLiteral("--append=b=2")};
    QCOMPARE(composite.calls().size(), static_cast<size_t>(1));
    QCOMPARE(composite.calls().front().arguments, expected);
    QCOMPARE(separate.calls().front().arguments, expected);
}

void RpmOstreeClientTests::testAddDoesNotQueryHost()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("Kernel arguments updated.\n"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    const std::string output = client.setKernelArgs(
        {{nodeos::KernelArgOperation::Add, "nosmt"}});
    QCOMPARE(QString::fromStdString(output), QStringLiteral("Kernel arguments updated.\n"));
    QCOMPARE(host.calls().size(), static_cast<size_t>(1));
}

void RpmOstreeClientTests::testMixedArgsUseOneCommand()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("root=UUID=abc rw quiet mitigations=off\n"));
    host.on(QStringLiteral("rpm-ostree kargs --"), QByteArrayLiteral("done"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    const std::string output = client.setKernelArgs({
        {nodeos::KernelArgOperation::Remove, "quiet"},
        {nodeos::KernelArgOperation::Add, "nosmt"},
        {nodeos::KernelArgOperation::Remove, "absent=1 mitigations=off"},
    });
    QCOMPARE(QString::fromStdString(output), QStringLiteral("done"));

    QCOMPARE(host.calls().size(), static_cast<size_t>(2));
    QCOMPARE(host.calls()[0].arguments, QStringList{QStringLiteral("kargs")});
    const QStringList expected = {QStringLiteral("kargs"),
                                  QStringLiteral("--delete=quiet"),
                                  QStringLiteral("--append=nosmt"),
                                  QStringLiteral("--delete=mitigations=off")};
    QCOMPARE(host.calls()[1].arguments, expected);
}

void RpmOstreeClientTests::testRemoveMatchesByPrefix()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree kargs"), QByteArrayLiteral("console=ttyS0,115200n8 rw\n"));
    host.on(QStringLiteral("rpm-ostree kargs --"), QByteArray());
    nodeos::RpmOstreeClient client(config(), host.runner());

    client.setKernelArgs({{nodeos::KernelArgOperation::Remove, "console=ttyS0"}});
    QCOMPARE(host.count(QStringLiteral("rpm-ostree kargs --delete=console=ttyS0")), 1);
}

void RpmOstreeClientTests::testRemovePendingDeployment()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree cleanup -p"), QByteArray());
    nodeos::RpmOstreeClient client(config(), host.runner());

    client.removePendingDeployment();
    QCOMPARE(host.count(QStringLiteral("rpm-ostree cleanup -p")), 1);

    host.failAlways(QStringLiteral("rpm-ostree cleanup"));
    QVERIFY_EXCEPTION_THROWN(client.removePendingDeployment(), nodeos::CommandError);
}

void RpmOstreeClientTests::testPassthrough()
{
    FakeHost host;
    host.on(QStringLiteral("rpm-ostree db diff"), QByteArrayLiteral("no changes"));
    nodeos::RpmOstreeClient client(config(), host.runner());

    QCOMPARE(QString::fromStdString(client.runRpmOstree(QStringLiteral("db"),
                                                        {QStringLiteral("diff")})),
             QStringLiteral("no changes"));
}

QTEST_MAIN(RpmOstreeClientTests)
#include "test_rpm_ostree_client.moc"
