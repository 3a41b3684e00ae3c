#pragma once

#include <optional>

#include "Protocol/Completion.hpp"
#include "Extension/ArtifactResolver.hpp"
#include "Extension/CodeLabel.hpp"
#include "Extension/Errors.hpp"
#include "Extension/Host.hpp"

/// Entry points a host editor calls into a language extension
class Extension
{
public:
    virtual ~Extension() {}

    /// The command used to start the language server identified by `languageServerId`
    virtual Result<Command> languageServerCommand(const LanguageServerId& languageServerId) = 0;

    /// A custom label for a completion item, or std::nullopt to use the host's default
    virtual std::optional<CodeLabel> labelForCompletion(const LanguageServerId&, const lsp::CompletionItem&) const
    {
        return std::nullopt;
    }
};

/// Runs the Nextflow language server jar on the java runtime bundled with the extension
class NextflowExtension : public Extension
{
    BaseHost* host;
    ExtensionConfiguration config;
    ArtifactResolver resolver;

public:
    NextflowExtension(BaseHost* host, ReleaseFeed* releaseFeed, Downloader* downloader, ExtensionConfiguration config = {});

    Result<Command> languageServerCommand(const LanguageServerId& languageServerId) override;
    std::optional<CodeLabel> labelForCompletion(const LanguageServerId& languageServerId, const lsp::CompletionItem& completion) const override;

    const ArtifactResolver& artifactResolver() const
    {
        return resolver;
    }
};
