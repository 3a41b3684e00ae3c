#pragma once

#include "Extension/Downloader.hpp"
#include "Extension/Host.hpp"
#include "Extension/ReleaseFeed.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class TestHost : public BaseHost
{
public:
    std::vector<std::pair<LanguageServerId, LanguageServerInstallationStatus>> statusQueue;
    std::vector<std::pair<lsp::MessageType, std::string>> logQueue;
    /// Runs on every status change, after it is recorded
    std::function<void(const LanguageServerInstallationStatus& status)> onStatus;

    void setInstallationStatus(const LanguageServerId& languageServerId, const LanguageServerInstallationStatus& status) override;
    void sendLogMessage(const lsp::MessageType& type, const std::string& message) override;

    std::vector<InstallationStatusKind> statusKinds() const;
};

/// Serves a fixed release, or a fixed error, without touching the network
class TestReleaseFeed : public ReleaseFeed
{
public:
    Result<GithubRelease> response;
    std::vector<std::pair<std::string, GithubReleaseOptions>> requests;

    TestReleaseFeed();

    Result<GithubRelease> latestRelease(const std::string& repository, const GithubReleaseOptions& options) override;
};

/// "Extracts" a configurable set of files into the destination directory
class TestDownloader : public Downloader
{
public:
    /// Files written to the destination, relative to it, with their contents
    std::vector<std::pair<std::string, std::string>> files{{"language-server-all.jar", "jar contents"}};
    /// When set, the download fails with this message and nothing is written
    std::optional<std::string> failure = std::nullopt;
    /// Runs after files are written
    std::function<void(const std::string& destination)> afterDownload;

    struct Request
    {
        std::string url;
        std::string destination;
        DownloadedFileType fileType;
    };
    std::vector<Request> requests;

    Status downloadFile(const std::string& url, const std::string& destination, DownloadedFileType fileType) override;
};

GithubRelease makeRelease(const std::string& version, const std::vector<std::string>& assetNames);
