#pragma once

#include <string>
#include <vector>

#include "Protocol/Base.hpp"
#include "Extension/Errors.hpp"

struct GithubReleaseAsset
{
    std::string name;
    std::string downloadUrl;
};

struct GithubRelease
{
    std::string version;
    std::vector<GithubReleaseAsset> assets{};
};

struct GithubReleaseOptions
{
    /// Skip releases without any uploaded assets
    bool requireAssets = true;
    /// Select pre-releases instead of stable releases
    bool preRelease = false;
};

/// Source of published language server releases
class ReleaseFeed
{
public:
    virtual ~ReleaseFeed() {}

    /// The newest release of `repository` matching `options`. Fails with ExtensionErrorKind::ReleaseLookup
    virtual Result<GithubRelease> latestRelease(const std::string& repository, const GithubReleaseOptions& options) = 0;
};

/// Picks the first release in a GitHub `GET /repos/{owner}/{repo}/releases` listing that matches `options`.
/// GitHub lists releases newest first
Result<GithubRelease> selectLatestRelease(const json& releases, const GithubReleaseOptions& options);

/// URL listing the releases of `repository`, with the largest page GitHub allows so that a run of
/// pre-releases does not push the newest stable release off the first page
std::string releasesUrl(std::string apiUrl, const std::string& repository);

/// Queries the GitHub REST API
class GithubReleaseFeed : public ReleaseFeed
{
    std::string apiUrl;

public:
    explicit GithubReleaseFeed(std::string apiUrl = "https://api.github.com");

    Result<GithubRelease> latestRelease(const std::string& repository, const GithubReleaseOptions& options) override;
};
