#include "Extension/CodeLabel.hpp"

void to_json(json& j, const CodeLabelSpan& span)
{
    if (auto range = std::get_if<CodeRange>(&span))
        j = json{{"codeRange", *range}};
    else if (auto literal = std::get_if<CodeLabelLiteral>(&span))
        j = json{{"literal", *literal}};
}

void to_json(json& j, const CodeLabel& label)
{
    json spans = json::array();
    for (const auto& span : label.spans)
    {
        json item;
        to_json(item, span);
        spans.emplace_back(std::move(item));
    }

    j = json{
        {"code", label.code},
        {"spans", spans},
        {"filterRange", label.filterRange},
    };
}

std::optional<CodeLabel> labelForCompletion(const lsp::CompletionItem& completion)
{
    if (!completion.kind)
        return std::nullopt;

    const std::string& label = completion.label;

    switch (*completion.kind)
    {
    case lsp::CompletionItemKind::Class:
    case lsp::CompletionItemKind::Enum:
    case lsp::CompletionItemKind::Interface:
    {
        // Types are shown with the package they are imported from
        if (!completion.detail)
            return std::nullopt;

        CodeLabel result{label + " variable"};
        result.spans.emplace_back(codeRangeSpan(0, label.size()));
        result.spans.emplace_back(literalSpan(" (import " + *completion.detail + ")"));
        result.filterRange = CodeRange{0, label.size()};
        return result;
    }
    case lsp::CompletionItemKind::Method:
    {
        CodeLabel result{label + "()"};
        result.spans.emplace_back(codeRangeSpan(0, result.code.size()));
        result.filterRange = CodeRange{0, label.size()};
        return result;
    }
    case lsp::CompletionItemKind::Variable:
    {
        // Highlight as a declaration, but only display the name itself
        static const std::string prefix = "def ";

        CodeLabel result{prefix + label};
        result.spans.emplace_back(codeRangeSpan(prefix.size(), result.code.size()));
        result.filterRange = CodeRange{0, label.size()};
        return result;
    }
    default:
        return std::nullopt;
    }
}
