#pragma once

#include <string>
#include <optional>
#include "Protocol/Base.hpp"

namespace lsp
{
enum struct CompletionItemKind
{
    Text = 1,
    Method = 2,
    Function = 3,
    Constructor = 4,
    Field = 5,
    Variable = 6,
    Class = 7,
    Interface = 8,
    Module = 9,
    Property = 10,
    Unit = 11,
    Value = 12,
    Enum = 13,
    Keyword = 14,
    Snippet = 15,
    Color = 16,
    File = 17,
    Reference = 18,
    Folder = 19,
    EnumMember = 20,
    Constant = 21,
    Struct = 22,
    Event = 23,
    Operator = 24,
    TypeParameter = 25,
};

struct CompletionItemLabelDetails
{
    std::optional<std::string> detail = std::nullopt;
    std::optional<std::string> description = std::nullopt;
};
NLOHMANN_DEFINE_OPTIONAL(CompletionItemLabelDetails, detail, description);

/// The subset of an LSP completion item that the host forwards for label rendering.
/// For the Nextflow language server, `detail` carries the import path of classes and enums
struct CompletionItem
{
    std::string label;
    std::optional<CompletionItemLabelDetails> labelDetails = std::nullopt;
    std::optional<CompletionItemKind> kind = std::nullopt;
    std::optional<std::string> detail = std::nullopt;
    std::optional<std::string> sortText = std::nullopt;
    std::optional<std::string> filterText = std::nullopt;
    std::optional<std::string> insertText = std::nullopt;
};
NLOHMANN_DEFINE_OPTIONAL(CompletionItem, label, labelDetails, kind, detail, sortText, filterText, insertText);
} // namespace lsp
