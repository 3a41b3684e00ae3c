#pragma once

namespace lsp
{
enum struct MessageType
{
    Error = 1,
    Warning = 2,
    Info = 3,
    Log = 4,
};
} // namespace lsp
