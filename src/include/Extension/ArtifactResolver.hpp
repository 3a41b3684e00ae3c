#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "Extension/Downloader.hpp"
#include "Extension/Errors.hpp"
#include "Extension/ExtensionConfiguration.hpp"
#include "Extension/Host.hpp"
#include "Extension/ReleaseFeed.hpp"

/// Locates the language server jar, installing it from the latest release the first time it is needed.
/// The installed jar is never upgraded: a new release is only picked up once the jar is deleted
class ArtifactResolver
{
    BaseHost* host;
    ReleaseFeed* releaseFeed;
    Downloader* downloader;
    ExtensionConfiguration config;

    /// Set when `config` would make an install unsafe. Every resolution fails with it
    std::optional<ExtensionError> configError = std::nullopt;

    /// Serializes resolutions. Host callbacks run while it is held, so it never guards state they may read
    std::mutex resolveMutex;
    mutable std::mutex cacheMutex;
    /// Path of the artifact once it has been found or installed
    std::optional<std::string> cachedArtifactPath = std::nullopt;

public:
    ArtifactResolver(BaseHost* host, ReleaseFeed* releaseFeed, Downloader* downloader, ExtensionConfiguration config = {});

    /// Returns the path of the installed artifact. Only downloads when the artifact is missing from disk.
    /// Concurrent callers are serialized. Host callbacks may call cachedPath(), but must not resolve again
    Result<std::string> resolve(const LanguageServerId& languageServerId);

    std::optional<std::string> cachedPath() const;

    /// The fixed location the artifact is installed to
    std::string artifactPath() const;
    std::string stagingPath() const;

private:
    void setCachedPath(const std::string& path);
    Result<std::string> install(const LanguageServerId& languageServerId);
};
