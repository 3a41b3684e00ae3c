#include "FileUtils.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace FileUtils
{
bool isAbsolutePath(std::string_view path)
{
#ifdef _WIN32
    // Must either begin with "X:/", "X:\", "/", or "\", where X is a drive letter
    return (path.size() >= 3 && isalpha(path[0]) && path[1] == ':' && (path[2] == '/' || path[2] == '\\')) ||
           (path.size() >= 1 && (path[0] == '/' || path[0] == '\\'));
#else
    return path.size() >= 1 && path[0] == '/';
#endif
}

std::optional<std::string> readFile(const std::string& name)
{
    FILE* file = fopen(name.c_str(), "rb");
    if (!file)
        return std::nullopt;

    fseek(file, 0, SEEK_END);
    long length = ftell(file);
    if (length < 0)
    {
        fclose(file);
        return std::nullopt;
    }
    fseek(file, 0, SEEK_SET);

    std::string result(length, 0);

    size_t read = fread(result.data(), 1, length, file);
    fclose(file);

    if (read != size_t(length))
        return std::nullopt;

    return result;
}

bool exists(const std::string& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool isFile(const std::string& path)
{
    std::error_code ec;
    return fs::is_regular_file(fs::symlink_status(path, ec));
}

bool isDirectory(const std::string& path)
{
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(path, ec));
}

bool traverseDirectory(const std::string& path, const std::function<void(const std::string& name)>& callback)
{
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec)
        return false;

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return false;

        // Skip symbolic links, only regular files count
        if (it->is_symlink(ec) || !it->is_regular_file(ec))
            continue;

        callback(it->path().generic_string());
    }

    return !ec;
}

std::optional<std::string> createDirectories(const std::string& path)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
        return ec.message();
    if (!isDirectory(path))
        return "'" + path + "' exists and is not a directory";
    return std::nullopt;
}

std::optional<std::string> removeAll(const std::string& path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        return ec.message();
    return std::nullopt;
}

std::optional<std::string> renameFile(const std::string& from, const std::string& to)
{
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec)
        return ec.message();
    return std::nullopt;
}

std::vector<std::string_view> splitPath(std::string_view path)
{
    std::vector<std::string_view> components;

    size_t pos = 0;
    size_t nextPos = path.find_first_of("\\/", pos);

    while (nextPos != std::string::npos)
    {
        components.push_back(path.substr(pos, nextPos - pos));
        pos = nextPos + 1;
        nextPos = path.find_first_of("\\/", pos);
    }
    components.push_back(path.substr(pos));

    return components;
}

std::string joinPaths(std::string_view lhs, std::string_view rhs)
{
    std::string result = std::string(lhs);
    if (!result.empty() && result.back() != '/' && result.back() != '\\')
        result += '/';
    result += rhs;
    return result;
}

bool isContainedRelativePath(std::string_view path)
{
    if (path.empty() || isAbsolutePath(path))
        return false;

    for (std::string_view component : splitPath(path))
        if (component == "..")
            return false;

    return true;
}
} // namespace FileUtils
