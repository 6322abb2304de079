#include "daemon/rpm_ostree_client.hpp"

#include <optional>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/kargs.hpp"
#include "common/logging.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("RpmOstreeClient");

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

std::string imageUrlFromCustomOrigin(const Deployment &deployment)
{
    if (deployment.customOrigin.empty()) {
        return {};
    }
    const std::string &origin = deployment.customOrigin.front();
    const std::string scheme = kPivotScheme;
    if (origin.rfind(scheme, 0) != 0) {
        return {};
    }
    return origin.substr(scheme.size());
}

RpmOstreeClient::RpmOstreeClient(const AgentConfig &config, CommandRunner runner)
    : RpmOstreeClient(config, runner, ImageResolver::createDefault(config, runner))
{
}

RpmOstreeClient::RpmOstreeClient(const AgentConfig &config,
                                 CommandRunner runner,
                                 std::unique_ptr<ImageResolver> resolver)
    : m_config(config)
    , m_runner(std::move(runner))
    , m_resolver(std::move(resolver))
{
}

HostVariant RpmOstreeClient::variant() const
{
    return HostVariant::CoreOs;
}

std::string RpmOstreeClient::runRpmOstree(const QString &noun, const QStringList &args)
{
    QStringList fullArgs{noun};
    fullArgs << args;
    NLOG_INFO(kComponent,
              QStringLiteral("exec"),
              QStringLiteral("Executing cmd: '%1'")
                  .arg(formatCommandLine(qs(m_config.rpmOstreePath), fullArgs)),
              nlohmann::json::object());
    return m_runner(qs(m_config.rpmOstreePath), fullArgs).toStdString();
}

std::vector<Deployment> RpmOstreeClient::readDeployments()
{
    const std::string output = runRpmOstree(QStringLiteral("status"),
                                            {QStringLiteral("--json")});
    std::string error;
    try {
        const nlohmann::json j = nlohmann::json::parse(output);
        if (j.is_object()) {
            return j.get<DeploymentState>().deployments;
        }
        error = std::string("expected a JSON object, got ") + j.type_name();
    } catch (const nlohmann::json::exception &e) {
        error = e.what();
    }

    NLOG_ERROR(kComponent,
               QStringLiteral("parse_failed"),
               QStringLiteral("failed to parse `rpm-ostree status --json` output"),
               (nlohmann::json{{"raw", output}, {"error", error}}));
    throw NodeOsError(ErrorKind::Parse,
                      "failed to parse `rpm-ostree status --json` output: " + error
                          + ": " + QString::fromStdString(output).trimmed().toStdString());
}

Deployment RpmOstreeClient::getBootedDeployment()
{
    const std::vector<Deployment> deployments = readDeployments();

    const Deployment *booted = nullptr;
    int bootedCount = 0;
    for (const auto &deployment : deployments) {
        if (!deployment.booted) {
            continue;
        }
        ++bootedCount;
        if (!booted) {
            booted = &deployment;
        }
    }

    if (!booted) {
        throw NodeOsError(ErrorKind::HostState, "not currently booted in a deployment");
    }

    // rpm-ostree should never report this; keep the first one in list order.
    if (bootedCount > 1) {
        NLOG_WARN(kComponent,
                  QStringLiteral("multiple_booted"),
                  QStringLiteral("%1 deployments report booted, using %2")
                      .arg(bootedCount)
                      .arg(qs(booted->id)),
                  nlohmann::json::object());
    }

    return *booted;
}

std::string RpmOstreeClient::getStatus()
{
    return runRpmOstree(QStringLiteral("status"), {});
}

OsImageUrl RpmOstreeClient::getBootedOsImageUrl()
{
    const Deployment booted = getBootedDeployment();

    OsImageUrl url;
    url.imageUrl = imageUrlFromCustomOrigin(booted);
    url.version = booted.version;
    return url;
}

std::vector<std::string> RpmOstreeClient::getKernelArgs()
{
    return quoteSpaceSplit(runRpmOstree(QStringLiteral("kargs"), {}));
}

bool RpmOstreeClient::rebase(const std::string &imageUrl, const std::string &osImageContentDir)
{
    const Deployment previous = getBootedDeployment();

    NLOG_INFO(kComponent,
              QStringLiteral("rebase_start"),
              QStringLiteral("Updating OS to %1").arg(qs(imageUrl)),
              (nlohmann::json{{"bootedId", previous.id}, {"bootedChecksum", previous.checksum}}));

    if (previous.customOrigin.empty()) {
        NLOG_INFO(kComponent,
                  QStringLiteral("previous_origin"),
                  QStringLiteral("Current origin is not custom"),
                  nlohmann::json::object());
    } else {
        const std::string previousPivot = imageUrlFromCustomOrigin(previous);
        if (!previousPivot.empty()) {
            NLOG_INFO(kComponent,
                      QStringLiteral("previous_origin"),
                      QStringLiteral("Previous pivot: %1").arg(qs(previousPivot)),
                      nlohmann::json::object());
        } else {
            NLOG_INFO(kComponent,
                      QStringLiteral("previous_origin"),
                      QStringLiteral("Previous custom origin: %1")
                          .arg(qs(previous.customOrigin.front())),
                      nlohmann::json::object());
        }
    }

    const std::string repo = osImageContentDir + "/srv/repo";
    const ResolvedCommit commit = m_resolver->resolve(imageUrl, repo);

    // Shown by `rpm-ostree status` as the origin, and read back by
    // getBootedOsImageUrl() after the reboot.
    const std::string customUrl = std::string(kPivotScheme) + imageUrl;
    NLOG_INFO(kComponent,
              QStringLiteral("rebase_exec"),
              QStringLiteral("Executing rebase from repo path %1 with customImageURL %2 "
                             "and checksum %3")
                  .arg(qs(repo), qs(customUrl), qs(commit.checksum)),
              (nlohmann::json{{"source", commit.source}, {"version", commit.version}}));

    runRpmOstree(QStringLiteral("rebase"),
                 {QStringLiteral("--experimental"),
                  qs(repo + ":" + commit.checksum),
                  QStringLiteral("--custom-origin-url"),
                  qs(customUrl),
                  QStringLiteral("--custom-origin-description"),
                  qs(m_config.customOriginDescription)});
    return true;
}

void RpmOstreeClient::removePendingDeployment()
{
    runRpmOstree(QStringLiteral("cleanup"), {QStringLiteral("-p")});
}

std::string RpmOstreeClient::setKernelArgs(const std::vector<KernelArgument> &args)
{
    QStringList flags;
    // Fetched lazily, at most once, and always before the kargs call.
    std::optional<std::vector<std::string>> active;

    for (const auto &arg : args) {
        for (const auto &token : quoteSpaceSplit(arg.name)) {
            switch (arg.operation) {
            case KernelArgOperation::Add:
                flags << QStringLiteral("--append=%1").arg(qs(token));
                break;
            case KernelArgOperation::Remove:
                if (!active) {
                    active = getKernelArgs();
                }
                if (isKernelArgPresent(*active, token)) {
                    flags << QStringLiteral("--delete=%1").arg(qs(token));
                } else {
                    NLOG_DEBUG(kComponent,
                               QStringLiteral("karg_absent"),
                               QStringLiteral("Kernel argument %1 not in use, skipping delete")
                                   .arg(qs(token)),
                               nlohmann::json::object());
                }
                break;
            }
        }
    }

    if (flags.isEmpty()) {
        return {};
    }
    return runRpmOstree(QStringLiteral("kargs"), flags);
}

} // namespace nodeos
