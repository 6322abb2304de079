#include "daemon/image_resolver.hpp"

#include <QFileInfo>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("ImageResolver");

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

QStringList authArgs(const std::string &authFile)
{
    if (!authFile.empty() && QFileInfo::exists(qs(authFile))) {
        return {QStringLiteral("--authfile"), qs(authFile)};
    }
    return {};
}

std::string labelValue(const ImageInspection &inspection, const char *label)
{
    auto it = inspection.labels.find(label);
    if (it == inspection.labels.end()) {
        return {};
    }
    return it->second;
}

nlohmann::json parseToolJson(const QByteArray &output, const char *what)
{
    try {
        return nlohmann::json::parse(output.toStdString());
    } catch (const nlohmann::json::parse_error &e) {
        NLOG_ERROR(kComponent,
                   QStringLiteral("parse_failed"),
                   QStringLiteral("Failed to parse %1 output").arg(QLatin1String(what)),
                   (nlohmann::json{{"raw", output.toStdString()}}));
        throw NodeOsError(ErrorKind::Parse,
                          std::string("failed to parse ") + what + " output: " + e.what());
    }
}

ImageInspection toInspection(const nlohmann::json &j, const char *what)
{
    try {
        return j.get<ImageInspection>();
    } catch (const nlohmann::json::exception &e) {
        throw NodeOsError(ErrorKind::Parse,
                          std::string("unexpected ") + what + " output: " + e.what());
    }
}

} // namespace

SkopeoInspector::SkopeoInspector(CommandRunner runner,
                                 std::string skopeoPath,
                                 std::string authFile)
    : m_runner(std::move(runner))
    , m_skopeoPath(std::move(skopeoPath))
    , m_authFile(std::move(authFile))
{
}

QString SkopeoInspector::name() const
{
    return QStringLiteral("skopeo-inspect");
}

ImageInspection SkopeoInspector::inspect(const std::string &imageUrl)
{
    QStringList args{QStringLiteral("inspect")};
    args << authArgs(m_authFile);
    args << QStringLiteral("docker://") + qs(imageUrl);

    const QByteArray output = m_runner(qs(m_skopeoPath), args);
    const nlohmann::json j = parseToolJson(output, "skopeo inspect");
    if (!j.is_object()) {
        throw NodeOsError(ErrorKind::Parse, "skopeo inspect did not return an object");
    }
    return toInspection(j, "skopeo inspect");
}

PodmanPullInspector::PodmanPullInspector(CommandRunner runner,
                                         std::string podmanPath,
                                         std::string authFile,
                                         int pullAttempts,
                                         std::chrono::milliseconds retryDelay)
    : m_runner(std::move(runner))
    , m_podmanPath(std::move(podmanPath))
    , m_authFile(std::move(authFile))
    , m_pullAttempts(pullAttempts)
    , m_retryDelay(retryDelay)
{
}

QString PodmanPullInspector::name() const
{
    return QStringLiteral("podman-pull-inspect");
}

ImageInspection PodmanPullInspector::inspect(const std::string &imageUrl)
{
    // A failed pull may still leave partial content behind; clean up on
    // every path once the pull has been attempted.
    struct RemoveGuard {
        PodmanPullInspector *self;
        const std::string &imageUrl;
        ~RemoveGuard() { self->removeImage(imageUrl); }
    } guard{this, imageUrl};

    QStringList pullArgs{QStringLiteral("pull"), QStringLiteral("-q")};
    pullArgs << authArgs(m_authFile);
    pullArgs << qs(imageUrl);
    runWithRetries(m_runner, m_pullAttempts, m_retryDelay, qs(m_podmanPath), pullArgs);

    const QByteArray output = m_runner(qs(m_podmanPath),
                                       {QStringLiteral("inspect"),
                                        QStringLiteral("--type=image"),
                                        qs(imageUrl)});
    const nlohmann::json j = parseToolJson(output, "podman inspect");
    if (!j.is_array() || j.empty()) {
        throw NodeOsError(ErrorKind::Parse,
                          "podman inspect returned no image for " + imageUrl);
    }
    return toInspection(j.front(), "podman inspect");
}

void PodmanPullInspector::removeImage(const std::string &imageUrl)
{
    try {
        m_runner(qs(m_podmanPath), {QStringLiteral("rmi"), qs(imageUrl)});
    } catch (const std::exception &e) {
        NLOG_WARN(kComponent,
                  QStringLiteral("rmi_failed"),
                  QStringLiteral("Failed to remove pulled image %1").arg(qs(imageUrl)),
                  (nlohmann::json{{"error", e.what()}}));
    }
}

OstreeRepository::OstreeRepository(CommandRunner runner, std::string ostreePath)
    : m_runner(std::move(runner))
    , m_ostreePath(std::move(ostreePath))
{
}

std::vector<std::string> OstreeRepository::listRefs(const std::string &repoPath)
{
    const QByteArray output = m_runner(qs(m_ostreePath),
                                       {QStringLiteral("refs"),
                                        QStringLiteral("--repo"),
                                        qs(repoPath)});
    std::vector<std::string> refs;
    const QStringList lines = QString::fromUtf8(output).split(QLatin1Char('\n'),
                                                              Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString ref = line.trimmed();
        if (!ref.isEmpty()) {
            refs.push_back(ref.toStdString());
        }
    }
    return refs;
}

std::string OstreeRepository::revParse(const std::string &repoPath, const std::string &ref)
{
    const QByteArray output = m_runner(qs(m_ostreePath),
                                       {QStringLiteral("rev-parse"),
                                        QStringLiteral("--repo"),
                                        qs(repoPath),
                                        qs(ref)});
    return output.trimmed().toStdString();
}

ImageResolver::ImageResolver(std::vector<std::unique_ptr<ImageInspector>> inspectors,
                             std::unique_ptr<CommitRepository> repository)
    : m_inspectors(std::move(inspectors))
    , m_repository(std::move(repository))
{
}

ImageInspection ImageResolver::inspect(const std::string &imageUrl, QString *inspectorName)
{
    if (m_inspectors.empty()) {
        return {};
    }

    for (std::size_t i = 0; i < m_inspectors.size(); ++i) {
        ImageInspector &inspector = *m_inspectors[i];
        const bool last = i + 1 == m_inspectors.size();
        try {
            ImageInspection inspection = inspector.inspect(imageUrl);
            *inspectorName = inspector.name();
            return inspection;
        } catch (const NodeOsError &e) {
            if (last) {
                throw;
            }
            NLOG_INFO(kComponent,
                      QStringLiteral("inspect_fallback"),
                      QStringLiteral("%1 failed for %2, falling back to %3")
                          .arg(inspector.name(), qs(imageUrl), m_inspectors[i + 1]->name()),
                      (nlohmann::json{{"error", e.what()}}));
        }
    }
    return {};
}

ResolvedCommit ImageResolver::resolve(const std::string &imageUrl, const std::string &repoPath)
{
    QString inspectorName;
    const ImageInspection inspection = inspect(imageUrl, &inspectorName);

    ResolvedCommit commit;
    commit.checksum = labelValue(inspection, kOstreeCommitLabel);
    commit.version = labelValue(inspection, kVersionLabel);
    commit.source = inspectorName.toStdString();

    if (!commit.checksum.empty()) {
        if (!commit.version.empty()) {
            NLOG_INFO(kComponent,
                      QStringLiteral("commit_resolved"),
                      QStringLiteral("Pivoting to: %1 (%2)")
                          .arg(qs(commit.version), qs(commit.checksum)),
                      (nlohmann::json{{"source", commit.source}}));
        } else {
            NLOG_INFO(kComponent,
                      QStringLiteral("commit_resolved"),
                      QStringLiteral("Pivoting to: %1").arg(qs(commit.checksum)),
                      (nlohmann::json{{"source", commit.source}}));
        }
        return commit;
    }

    NLOG_INFO(kComponent,
              QStringLiteral("no_commit_label"),
              QStringLiteral("No %1 label found in metadata! Inspecting %2...")
                  .arg(QLatin1String(kOstreeCommitLabel), qs(repoPath)),
              nlohmann::json::object());

    ResolvedCommit fromRepo = resolveFromRepository(repoPath);
    fromRepo.version = commit.version;
    return fromRepo;
}

ResolvedCommit ImageResolver::resolveFromRepository(const std::string &repoPath)
{
    const std::vector<std::string> refs = m_repository->listRefs(repoPath);
    if (refs.empty()) {
        throw NodeOsError(ErrorKind::HostState, "No refs found in repo " + repoPath);
    }
    if (refs.size() > 1) {
        throw NodeOsError(ErrorKind::HostState,
                          "multiple refs found in repo " + repoPath + " ("
                              + std::to_string(refs.size()) + ")");
    }

    NLOG_INFO(kComponent,
              QStringLiteral("using_ref"),
              QStringLiteral("Using ref %1").arg(qs(refs.front())),
              nlohmann::json::object());

    ResolvedCommit commit;
    commit.checksum = m_repository->revParse(repoPath, refs.front());
    commit.source = "ostree-ref:" + refs.front();
    if (commit.checksum.empty()) {
        throw NodeOsError(ErrorKind::HostState,
                          "ref " + refs.front() + " did not resolve to a commit");
    }
    return commit;
}

std::unique_ptr<ImageResolver> ImageResolver::createDefault(const AgentConfig &config,
                                                            CommandRunner runner)
{
    std::vector<std::unique_ptr<ImageInspector>> inspectors;
    inspectors.push_back(std::make_unique<SkopeoInspector>(runner,
                                                           config.skopeoPath,
                                                           config.authFile));
    inspectors.push_back(std::make_unique<PodmanPullInspector>(runner,
                                                               config.podmanPath,
                                                               config.authFile,
                                                               config.pullRetries,
                                                               config.pullRetryDelay));
    return std::make_unique<ImageResolver>(std::move(inspectors),
                                           std::make_unique<OstreeRepository>(
                                               std::move(runner), config.ostreePath));
}

} // namespace nodeos
