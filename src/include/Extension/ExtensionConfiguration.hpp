#pragma once
#include <string>
#include "Protocol/Base.hpp"

#include "Extension/Errors.hpp"

struct ExtensionConfiguration
{
    /// The GitHub repository (owner/name) the language server is released from
    std::string repository = "nextflow-io/language-server";
    /// Name of the release asset, which is also the file name of the installed artifact
    std::string assetName = "language-server-all.jar";
    /// Directory that the release asset is extracted into before being moved into place
    std::string stagingDirectory = "jar-download";
    /// Base directory for the artifact and staging directory. Empty means the current working directory
    std::string workDirectory = "";
    /// The java launcher used to start the server, relative to the extension directory
    std::string javaPath = "./bin/java";
    std::string releasesApiUrl = "https://api.github.com";
    /// Whether to install from pre-releases instead of stable releases
    bool preRelease = false;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(
    ExtensionConfiguration, repository, assetName, stagingDirectory, workDirectory, javaPath, releasesApiUrl, preRelease);

/// Checks that the asset and staging directory names stay inside the work directory and do not overlap,
/// since the staging directory is recursively removed during an install
Status validateConfiguration(const ExtensionConfiguration& config);

Result<ExtensionConfiguration> parseConfiguration(const std::string& contents);
