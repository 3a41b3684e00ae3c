#include "Extension/Errors.hpp"

const char* toString(ExtensionErrorKind kind)
{
    switch (kind)
    {
    case ExtensionErrorKind::ReleaseLookup:
        return "ReleaseLookupError";
    case ExtensionErrorKind::AssetNotFound:
        return "AssetNotFoundError";
    case ExtensionErrorKind::Download:
        return "DownloadError";
    case ExtensionErrorKind::ExtractedFileNotFound:
        return "ExtractedFileNotFoundError";
    case ExtensionErrorKind::Install:
        return "InstallError";
    case ExtensionErrorKind::Configuration:
        return "ConfigurationError";
    }
    return "UnknownError";
}
