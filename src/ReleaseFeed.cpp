#include "Extension/ReleaseFeed.hpp"
#include "Extension/Http.hpp"

static ExtensionError lookupError(const std::string& message)
{
    return makeError(ExtensionErrorKind::ReleaseLookup, message);
}

Result<GithubRelease> selectLatestRelease(const json& releases, const GithubReleaseOptions& options)
{
    if (!releases.is_array())
        return lookupError("unexpected response from release feed: expected a list of releases");

    try
    {
        for (const auto& release : releases)
        {
            if (release.value("draft", false))
                continue;
            if (release.value("prerelease", false) != options.preRelease)
                continue;

            GithubRelease result{release.at("tag_name").get<std::string>()};
            if (auto assets = release.find("assets"); assets != release.end() && assets->is_array())
            {
                for (const auto& asset : *assets)
                    result.assets.push_back(
                        GithubReleaseAsset{asset.at("name").get<std::string>(), asset.at("browser_download_url").get<std::string>()});
            }

            if (options.requireAssets && result.assets.empty())
                continue;

            return result;
        }
    }
    catch (const json::exception& e)
    {
        return lookupError(std::string("malformed release listing: ") + e.what());
    }

    return lookupError("no release found matching the given options");
}

std::string releasesUrl(std::string apiUrl, const std::string& repository)
{
    while (!apiUrl.empty() && apiUrl.back() == '/')
        apiUrl.pop_back();
    return apiUrl + "/repos/" + repository + "/releases?per_page=100";
}

GithubReleaseFeed::GithubReleaseFeed(std::string apiUrl)
    : apiUrl(std::move(apiUrl))
{
}

Result<GithubRelease> GithubReleaseFeed::latestRelease(const std::string& repository, const GithubReleaseOptions& options)
{
    std::string url = releasesUrl(apiUrl, repository);

    Http::Response response;
    if (auto error = Http::get(url, {"Accept: application/vnd.github+json", "X-GitHub-Api-Version: 2022-11-28"}, response))
        return lookupError(*error);

    if (response.statusCode >= 400)
        return lookupError("failed to fetch releases for " + repository + ": HTTP " + std::to_string(response.statusCode));

    json releases = json::parse(response.body, nullptr, /* allow_exceptions= */ false);
    if (releases.is_discarded())
        return lookupError("failed to parse release listing for " + repository);

    auto release = selectLatestRelease(releases, options);
    if (!release)
        return lookupError(release.error().message + " in " + repository);
    return release;
}
