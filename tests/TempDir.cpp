#include "TempDir.h"

#include <fstream>
#include <stdexcept>
#include <system_error>

TempDir::TempDir(const std::string& name)
    : fullPath(std::filesystem::temp_directory_path() / ("nextflow-ls-bridge-" + name))
{
    std::filesystem::remove_all(fullPath);
    std::filesystem::create_directories(fullPath);
    // Note: on macOS, TEMPDIR points to /var/, but it's a symlink to /private/var
    fullPath = std::filesystem::canonical(fullPath);
}

TempDir::~TempDir()
{
    std::error_code ec;
    std::filesystem::remove_all(fullPath, ec);
}

std::string TempDir::path() const
{
    return fullPath.generic_string();
}

std::string TempDir::child(const std::filesystem::path& child_path) const
{
    if (child_path.is_absolute())
        throw std::invalid_argument("child path must be relative: " + child_path.generic_string());

    return (fullPath / child_path).generic_string();
}

std::string TempDir::write_child(const std::filesystem::path& child_path, const std::string& contents)
{
    std::filesystem::path child_location = child(child_path);
    std::filesystem::create_directories(child_location.parent_path());

    std::ofstream file(child_location, std::ios::binary);
    file << contents;
    file.close();

    return child_location.generic_string();
}

std::string TempDir::make_directory(const std::filesystem::path& child_path)
{
    std::filesystem::path child_location = child(child_path);
    std::filesystem::create_directories(child_location);
    return child_location.generic_string();
}
