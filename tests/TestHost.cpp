#include "TestHost.h"


#include <filesystem>
#include <fstream>

void TestHost::setInstallationStatus(const LanguageServerId& languageServerId, const LanguageServerInstallationStatus& status)
{
    statusQueue.emplace_back(languageServerId, status);
    if (onStatus)
        onStatus(status);
}

void TestHost::sendLogMessage(const lsp::MessageType& type, const std::string& message)
{
    logQueue.emplace_back(type, message);
}

std::vector<InstallationStatusKind> TestHost::statusKinds() const
{
    std::vector<InstallationStatusKind> kinds;
    for (const auto& [_, status] : statusQueue)
        kinds.push_back(status.kind);
    return kinds;
}

TestReleaseFeed::TestReleaseFeed()
    : response(makeRelease("v25.04.0", {"language-server-all.jar"}))
{
}

Result<GithubRelease> TestReleaseFeed::latestRelease(const std::string& repository, const GithubReleaseOptions& options)
{
    requests.emplace_back(repository, options);
    return response;
}

Status TestDownloader::downloadFile(const std::string& url, const std::string& destination, DownloadedFileType fileType)
{
    requests.push_back(Request{url, destination, fileType});

    if (failure)
        return makeError(ExtensionErrorKind::Download, *failure);

    for (const auto& [name, contents] : files)
    {
        std::filesystem::path target = std::filesystem::path(destination) / name;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream file(target, std::ios::binary);
        file << contents;
    }

    if (afterDownload)
        afterDownload(destination);

    return Unit{};
}

GithubRelease makeRelease(const std::string& version, const std::vector<std::string>& assetNames)
{
    GithubRelease release{version};
    for (const auto& name : assetNames)
        release.assets.push_back(
            GithubReleaseAsset{name, "https://github.com/nextflow-io/language-server/releases/download/" + version + "/" + name});
    return release;
}
