#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <QString>

#include "common/command_runner.hpp"
#include "common/config.hpp"
#include "common/models.hpp"

namespace nodeos {

inline constexpr const char *kOstreeCommitLabel = "com.coreos.ostree-commit";
inline constexpr const char *kVersionLabel = "version";

// One way of reading an image's metadata. inspect() throws on failure.
class ImageInspector
{
public:
    virtual ~ImageInspector() = default;

    virtual QString name() const = 0;
    virtual ImageInspection inspect(const std::string &imageUrl) = 0;
};

// The two primitives the local-repository fallback needs.
class CommitRepository
{
public:
    virtual ~CommitRepository() = default;

    virtual std::vector<std::string> listRefs(const std::string &repoPath) = 0;
    virtual std::string revParse(const std::string &repoPath, const std::string &ref) = 0;
};

// Inspects the remote manifest without pulling layers.
class SkopeoInspector : public ImageInspector
{
public:
    SkopeoInspector(CommandRunner runner, std::string skopeoPath, std::string authFile);

    QString name() const override;
    ImageInspection inspect(const std::string &imageUrl) override;

private:
    CommandRunner m_runner;
    std::string m_skopeoPath;
    std::string m_authFile;
};

// Pulls the image into local container storage, inspects it there, and
// always removes it again.
class PodmanPullInspector : public ImageInspector
{
public:
    PodmanPullInspector(CommandRunner runner,
                        std::string podmanPath,
                        std::string authFile,
                        int pullAttempts,
                        std::chrono::milliseconds retryDelay);

    QString name() const override;
    ImageInspection inspect(const std::string &imageUrl) override;

private:
    void removeImage(const std::string &imageUrl);

    CommandRunner m_runner;
    std::string m_podmanPath;
    std::string m_authFile;
    int m_pullAttempts;
    std::chrono::milliseconds m_retryDelay;
};

class OstreeRepository : public CommitRepository
{
public:
    OstreeRepository(CommandRunner runner, std::string ostreePath);

    std::vector<std::string> listRefs(const std::string &repoPath) override;
    std::string revParse(const std::string &repoPath, const std::string &ref) override;

private:
    CommandRunner m_runner;
    std::string m_ostreePath;
};

/**
 * Resolves an OS container image reference to the ostree commit it carries.
 *
 * Inspectors run in order until one succeeds. A failure of anything but the
 * last inspector is logged and the next one is tried; the last inspector's
 * failure propagates. If the winning inspection has no commit label, the
 * local repository must expose exactly one ref, which is resolved instead.
 */
class ImageResolver
{
public:
    ImageResolver(std::vector<std::unique_ptr<ImageInspector>> inspectors,
                  std::unique_ptr<CommitRepository> repository);

    ResolvedCommit resolve(const std::string &imageUrl, const std::string &repoPath);

    // skopeo, then podman pull + inspect, then `ostree refs`.
    static std::unique_ptr<ImageResolver> createDefault(const AgentConfig &config,
                                                        CommandRunner runner);

private:
    ImageInspection inspect(const std::string &imageUrl, QString *inspectorName);
    ResolvedCommit resolveFromRepository(const std::string &repoPath);

    std::vector<std::unique_ptr<ImageInspector>> m_inspectors;
    std::unique_ptr<CommitRepository> m_repository;
};

} // namespace nodeos
