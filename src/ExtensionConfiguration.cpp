#include "Extension/ExtensionConfiguration.hpp"
#include "FileUtils.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

/// Path components of a relative path, without empty and "." components
static std::vector<std::string_view> significantComponents(const std::string& name)
{
    std::vector<std::string_view> components;
    for (std::string_view component : FileUtils::splitPath(name))
        if (!component.empty() && component != ".")
            components.push_back(component);
    return components;
}

static bool isWorkDirectoryItself(const std::string& name)
{
    return significantComponents(name).empty();
}

/// Whether one path is the other, or is nested inside it
static bool overlaps(const std::string& lhs, const std::string& rhs)
{
    auto lhsComponents = significantComponents(lhs);
    auto rhsComponents = significantComponents(rhs);
    size_t common = std::min(lhsComponents.size(), rhsComponents.size());
    return std::equal(lhsComponents.begin(), lhsComponents.begin() + common, rhsComponents.begin());
}

Status validateConfiguration(const ExtensionConfiguration& config)
{
    if (!FileUtils::isContainedRelativePath(config.assetName) || isWorkDirectoryItself(config.assetName))
        return makeError(ExtensionErrorKind::Configuration, "assetName must be a file name inside the work directory, got '" + config.assetName + "'");

    if (!FileUtils::isContainedRelativePath(config.stagingDirectory) || isWorkDirectoryItself(config.stagingDirectory))
        return makeError(ExtensionErrorKind::Configuration,
            "stagingDirectory must be a directory inside the work directory, got '" + config.stagingDirectory + "'");

    if (overlaps(config.stagingDirectory, config.assetName))
        return makeError(ExtensionErrorKind::Configuration, "stagingDirectory and assetName must not contain one another");

    return Unit{};
}

Result<ExtensionConfiguration> parseConfiguration(const std::string& contents)
{
    try
    {
        auto settings = json::parse(contents);
        if (settings.is_null())
            return ExtensionConfiguration{};
        if (!settings.is_object())
            return makeError(ExtensionErrorKind::Configuration, "settings must be a JSON object");

        auto config = settings.get<ExtensionConfiguration>();
        if (auto valid = validateConfiguration(config); !valid)
            return valid.error();
        return config;
    }
    catch (const json::exception& e)
    {
        return makeError(ExtensionErrorKind::Configuration, std::string("failed to parse settings: ") + e.what());
    }
}
