#include "Extension/Extension.hpp"

#include <utility>

NextflowExtension::NextflowExtension(BaseHost* host, ReleaseFeed* releaseFeed, Downloader* downloader, ExtensionConfiguration config)
    : host(host)
    , config(config)
    , resolver(host, releaseFeed, downloader, std::move(config))
{
}

Result<Command> NextflowExtension::languageServerCommand(const LanguageServerId& languageServerId)
{
    auto jarPath = resolver.resolve(languageServerId);
    if (!jarPath)
    {
        const ExtensionError& error = jarPath.error();
        host->sendLogMessage(lsp::MessageType::Error, std::string("failed to install language server (") + toString(error.kind) + "): " + error.message);
        host->setInstallationStatus(languageServerId, LanguageServerInstallationStatus::failed(error.message));
        return error;
    }

    return Command{config.javaPath, {"-jar", jarPath.value()}, {}};
}

std::optional<CodeLabel> NextflowExtension::labelForCompletion(const LanguageServerId&, const lsp::CompletionItem& completion) const
{
    return ::labelForCompletion(completion);
}
