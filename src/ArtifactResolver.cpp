#include "Extension/ArtifactResolver.hpp"
#include "FileUtils.hpp"

#include <algorithm>
#include <utility>

ArtifactResolver::ArtifactResolver(BaseHost* host, ReleaseFeed* releaseFeed, Downloader* downloader, ExtensionConfiguration config)
    : host(host)
    , releaseFeed(releaseFeed)
    , downloader(downloader)
    , config(std::move(config))
{
    if (auto valid = validateConfiguration(this->config); !valid)
        configError = valid.error();
}

static std::string inWorkDirectory(const std::string& workDirectory, const std::string& name)
{
    if (workDirectory.empty())
        return name;
    return FileUtils::joinPaths(workDirectory, name);
}

std::string ArtifactResolver::artifactPath() const
{
    return inWorkDirectory(config.workDirectory, config.assetName);
}

std::string ArtifactResolver::stagingPath() const
{
    return inWorkDirectory(config.workDirectory, config.stagingDirectory);
}

std::optional<std::string> ArtifactResolver::cachedPath() const
{
    std::lock_guard<std::mutex> guard(cacheMutex);
    return cachedArtifactPath;
}

void ArtifactResolver::setCachedPath(const std::string& path)
{
    std::lock_guard<std::mutex> guard(cacheMutex);
    cachedArtifactPath = path;
}

Result<std::string> ArtifactResolver::resolve(const LanguageServerId& languageServerId)
{
    if (configError)
        return *configError;

    std::lock_guard<std::mutex> guard(resolveMutex);

    if (auto cached = cachedPath(); cached && FileUtils::isFile(*cached))
        return *cached;

    // Installed by a previous session
    std::string path = artifactPath();
    if (FileUtils::isFile(path))
    {
        setCachedPath(path);
        return path;
    }

    auto installed = install(languageServerId);
    if (installed)
        setCachedPath(installed.value());
    return installed;
}

Result<std::string> ArtifactResolver::install(const LanguageServerId& languageServerId)
{
    host->setInstallationStatus(languageServerId, {InstallationStatusKind::CheckingForUpdate});

    auto release = releaseFeed->latestRelease(config.repository, GithubReleaseOptions{/* requireAssets= */ true, config.preRelease});
    if (!release)
        return release.error();

    const auto& assets = release.value().assets;
    auto asset = std::find_if(assets.begin(), assets.end(),
        [&](const GithubReleaseAsset& candidate)
        {
            return candidate.name == config.assetName;
        });
    if (asset == assets.end())
        return makeError(
            ExtensionErrorKind::AssetNotFound, "no " + config.assetName + " asset found in release " + release.value().version);

    host->sendLogMessage(lsp::MessageType::Info, "installing " + config.assetName + " from release " + release.value().version);
    host->setInstallationStatus(languageServerId, {InstallationStatusKind::Downloading});

    // Contents of a staging directory left behind by an interrupted install are stale
    std::string staging = stagingPath();
    if (FileUtils::exists(staging))
    {
        if (auto error = FileUtils::removeAll(staging))
            host->sendLogMessage(lsp::MessageType::Warning, "failed to clear stale staging directory '" + staging + "': " + *error);
    }
    if (auto error = FileUtils::createDirectories(staging))
        return makeError(ExtensionErrorKind::Download, "failed to create staging directory '" + staging + "': " + *error);

    host->sendLogMessage(lsp::MessageType::Log, "downloading " + asset->downloadUrl);
    auto downloaded = downloader->downloadFile(asset->downloadUrl, staging, DownloadedFileType::Zip);
    if (!downloaded)
        return makeError(ExtensionErrorKind::Download, "failed to download " + config.assetName + ": " + downloaded.error().message);

    std::optional<std::string> extracted = std::nullopt;
    bool listed = FileUtils::traverseDirectory(staging,
        [&](const std::string& name)
        {
            if (!extracted)
                extracted = name;
        });
    if (!listed)
        return makeError(ExtensionErrorKind::ExtractedFileNotFound, "failed to list downloaded files in '" + staging + "'");
    if (!extracted)
        return makeError(ExtensionErrorKind::ExtractedFileNotFound, "downloaded " + config.assetName + " not found in '" + staging + "'");

    std::string path = artifactPath();
    if (auto error = FileUtils::renameFile(*extracted, path))
        return makeError(ExtensionErrorKind::Install, "failed to move " + *extracted + " to " + path + ": " + *error);

    if (auto error = FileUtils::removeAll(staging))
        host->sendLogMessage(lsp::MessageType::Warning, "failed to remove staging directory '" + staging + "': " + *error);

    if (!FileUtils::isFile(path))
        return makeError(ExtensionErrorKind::Install, "installed language server is missing from " + path);

    host->sendLogMessage(lsp::MessageType::Info, "installed language server to " + path);
    host->setInstallationStatus(languageServerId, {InstallationStatusKind::None});
    return path;
}
