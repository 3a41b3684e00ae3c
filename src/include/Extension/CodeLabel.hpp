#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Protocol/Base.hpp"
#include "Protocol/Completion.hpp"

/// Half-open byte range [start, end) into CodeLabel::code
struct CodeRange
{
    size_t start = 0;
    size_t end = 0;

    bool operator==(const CodeRange& rhs) const
    {
        return start == rhs.start && end == rhs.end;
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CodeRange, start, end)

/// Text that is displayed as-is instead of being highlighted as code
struct CodeLabelLiteral
{
    std::string text;
    /// Name of a highlight to style the text with. The host's default style is used if empty
    std::optional<std::string> highlightName = std::nullopt;

    bool operator==(const CodeLabelLiteral& rhs) const
    {
        return text == rhs.text && highlightName == rhs.highlightName;
    }
};
NLOHMANN_DEFINE_OPTIONAL(CodeLabelLiteral, text, highlightName)

using CodeLabelSpan = std::variant<CodeRange, CodeLabelLiteral>;

inline CodeLabelSpan codeRangeSpan(size_t start, size_t end)
{
    return CodeRange{start, end};
}

inline CodeLabelSpan literalSpan(std::string text, std::optional<std::string> highlightName = std::nullopt)
{
    return CodeLabelLiteral{std::move(text), std::move(highlightName)};
}

/// How a completion item is displayed by the host: `code` is syntax highlighted, and `spans` select
/// which parts of it (and which extra literal text) are shown, in order
struct CodeLabel
{
    std::string code;
    std::vector<CodeLabelSpan> spans{};
    /// Range of `code` used to fuzzy-match against what the user typed
    CodeRange filterRange{};
};

void to_json(json& j, const CodeLabelSpan& span);
void to_json(json& j, const CodeLabel& label);

/// Produces the label the host should display for a completion item.
/// Returns std::nullopt when the host should fall back to its own rendering
std::optional<CodeLabel> labelForCompletion(const lsp::CompletionItem& completion);
