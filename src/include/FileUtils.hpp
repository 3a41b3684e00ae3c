#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <functional>
#include <vector>

namespace FileUtils
{
bool isAbsolutePath(std::string_view path);

std::optional<std::string> readFile(const std::string& name);

bool exists(const std::string& path);
/// Whether `path` is a regular file. Symbolic links are not followed
bool isFile(const std::string& path);
bool isDirectory(const std::string& path);

/// Calls `callback` with the full path of every regular file directly inside `path`, in no particular order.
/// Returns false if the directory could not be read
bool traverseDirectory(const std::string& path, const std::function<void(const std::string& name)>& callback);

/// Creates `path` and any missing parents. An already existing directory is not an error.
/// Returns the error description on failure
std::optional<std::string> createDirectories(const std::string& path);
/// Recursively removes `path`. Returns the error description on failure
std::optional<std::string> removeAll(const std::string& path);
/// Moves `from` to `to`, replacing `to` if it is a file. Returns the error description on failure
std::optional<std::string> renameFile(const std::string& from, const std::string& to);

std::vector<std::string_view> splitPath(std::string_view path);
std::string joinPaths(std::string_view lhs, std::string_view rhs);
/// Whether a relative path stays inside the directory it is resolved against
bool isContainedRelativePath(std::string_view path);
} // namespace FileUtils
