#pragma once

#include <iostream>

#include "Extension/Host.hpp"

static std::string getMessageTypeString(const lsp::MessageType& type)
{
    switch (type)
    {
    case lsp::MessageType::Error:
        return "ERROR";
    case lsp::MessageType::Warning:
        return "WARN";
    case lsp::MessageType::Info:
        return "INFO";
    case lsp::MessageType::Log:
        return "LOG";
    }
    return "LOG";
}

static std::string getInstallationStatusString(const LanguageServerInstallationStatus& status)
{
    switch (status.kind)
    {
    case InstallationStatusKind::None:
        return "ready";
    case InstallationStatusKind::CheckingForUpdate:
        return "checking for update";
    case InstallationStatusKind::Downloading:
        return "downloading";
    case InstallationStatusKind::Failed:
        return "failed: " + status.message.value_or("unknown error");
    }
    return "unknown";
}

/// Host used when running from the command line. Everything is reported on stderr so stdout only carries results
struct CliHost : public BaseHost
{
    /// Whether LOG level messages are printed
    bool verbose = false;

    void setInstallationStatus(const LanguageServerId& languageServerId, const LanguageServerInstallationStatus& status) override
    {
        std::cerr << "[" << languageServerId << "] " << getInstallationStatusString(status) << '\n';
    }

    void sendLogMessage(const lsp::MessageType& type, const std::string& message) override
    {
        if (type == lsp::MessageType::Log && !verbose)
            return;
        std::cerr << "[" << getMessageTypeString(type) << "] " << message << '\n';
    }
};
