#pragma once

#include <string>
#include <utility>
#include <variant>

enum struct ExtensionErrorKind
{
    /// The release feed could not be reached, or no release matched
    ReleaseLookup,
    /// The release exists but does not carry the expected asset
    AssetNotFound,
    /// Transfer or decompression of an asset failed
    Download,
    /// The downloaded archive did not contain a regular file
    ExtractedFileNotFound,
    /// The extracted file could not be moved into place
    Install,
    /// The extension settings could not be read
    Configuration,
};

const char* toString(ExtensionErrorKind kind);

struct ExtensionError
{
    ExtensionErrorKind kind;
    std::string message;
};

/// Either a value or the reason it could not be produced
template<typename T>
class Result
{
    std::variant<T, ExtensionError> storage;

public:
    Result(T value)
        : storage(std::move(value))
    {
    }

    Result(ExtensionError error)
        : storage(std::move(error))
    {
    }

    bool ok() const
    {
        return std::holds_alternative<T>(storage);
    }

    explicit operator bool() const
    {
        return ok();
    }

    const T& value() const
    {
        return std::get<T>(storage);
    }

    T& value()
    {
        return std::get<T>(storage);
    }

    const ExtensionError& error() const
    {
        return std::get<ExtensionError>(storage);
    }
};

/// Result of an operation which produces no value
struct Unit
{
};

using Status = Result<Unit>;

inline ExtensionError makeError(ExtensionErrorKind kind, std::string message)
{
    return ExtensionError{kind, std::move(message)};
}
