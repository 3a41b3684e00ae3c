#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Protocol/Base.hpp"
#include "Protocol/Window.hpp"

using LanguageServerId = std::string;

enum struct InstallationStatusKind
{
    None,
    CheckingForUpdate,
    Downloading,
    Failed,
};

struct LanguageServerInstallationStatus
{
    InstallationStatusKind kind = InstallationStatusKind::None;
    /// Only set when kind is Failed
    std::optional<std::string> message = std::nullopt;

    static LanguageServerInstallationStatus failed(std::string message)
    {
        return LanguageServerInstallationStatus{InstallationStatusKind::Failed, std::move(message)};
    }

    bool operator==(const LanguageServerInstallationStatus& rhs) const
    {
        return kind == rhs.kind && message == rhs.message;
    }
};

/// The command a host should spawn to start a language server
struct Command
{
    std::string command;
    std::vector<std::string> args{};
    std::vector<std::pair<std::string, std::string>> env{};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Command, command, args, env)

/// Channel back into the editor hosting the extension. Every call is advisory: nothing is returned
struct BaseHost
{
    virtual ~BaseHost() {}

    virtual void setInstallationStatus(const LanguageServerId& languageServerId, const LanguageServerInstallationStatus& status) = 0;

    virtual void sendLogMessage(const lsp::MessageType& type, const std::string& message) = 0;
};
