#include "doctest.h"
#include "FileUtils.hpp"
#include "TempDir.h"

#include <algorithm>

TEST_SUITE_BEGIN("FileUtils");

TEST_CASE("isFile only accepts regular files")
{
    TempDir dir("fileutils-isfile");
    std::string file = dir.write_child("file.txt", "contents");
    std::string directory = dir.make_directory("folder");

    CHECK(FileUtils::isFile(file));
    CHECK_FALSE(FileUtils::isFile(directory));
    CHECK_FALSE(FileUtils::isFile(dir.child("missing.txt")));
    CHECK(FileUtils::isDirectory(directory));
    CHECK(FileUtils::exists(directory));
    CHECK_FALSE(FileUtils::exists(dir.child("missing.txt")));
}

TEST_CASE("traverseDirectory lists regular files directly inside the directory")
{
    TempDir dir("fileutils-traverse");
    dir.write_child("a.jar", "a");
    dir.write_child("b.jar", "b");
    dir.write_child("nested/c.jar", "c");

    std::vector<std::string> files;
    CHECK(FileUtils::traverseDirectory(dir.path(),
        [&](const std::string& name)
        {
            files.push_back(name);
        }));

    std::sort(files.begin(), files.end());
    CHECK_EQ(files, (std::vector<std::string>{dir.child("a.jar"), dir.child("b.jar")}));
}

TEST_CASE("traverseDirectory fails on a missing directory")
{
    TempDir dir("fileutils-traverse-missing");
    CHECK_FALSE(FileUtils::traverseDirectory(dir.child("missing"), [](const std::string&) {}));
}

TEST_CASE("createDirectories is idempotent")
{
    TempDir dir("fileutils-mkdir");
    CHECK_FALSE(FileUtils::createDirectories(dir.child("a/b")));
    CHECK_FALSE(FileUtils::createDirectories(dir.child("a/b")));
    CHECK(FileUtils::isDirectory(dir.child("a/b")));

    dir.write_child("file", "");
    CHECK(FileUtils::createDirectories(dir.child("file")));
}

TEST_CASE("renameFile moves a file and replaces an existing one")
{
    TempDir dir("fileutils-rename");
    std::string from = dir.write_child("staging/server.jar", "new");
    std::string to = dir.write_child("server.jar", "old");

    CHECK_FALSE(FileUtils::renameFile(from, to));
    CHECK_EQ(FileUtils::readFile(to), "new");
    CHECK_FALSE(FileUtils::exists(from));

    CHECK(FileUtils::renameFile(dir.child("missing.jar"), to));
}

TEST_CASE("removeAll removes nested contents")
{
    TempDir dir("fileutils-remove");
    dir.write_child("staging/nested/file", "x");

    CHECK_FALSE(FileUtils::removeAll(dir.child("staging")));
    CHECK_FALSE(FileUtils::exists(dir.child("staging")));
    CHECK_FALSE(FileUtils::removeAll(dir.child("staging")));
}

TEST_CASE("isContainedRelativePath")
{
    CHECK(FileUtils::isContainedRelativePath("server.jar"));
    CHECK(FileUtils::isContainedRelativePath("lib/server.jar"));
    CHECK(FileUtils::isContainedRelativePath("./server.jar"));
    CHECK_FALSE(FileUtils::isContainedRelativePath(""));
    CHECK_FALSE(FileUtils::isContainedRelativePath("/etc/passwd"));
    CHECK_FALSE(FileUtils::isContainedRelativePath("../server.jar"));
    CHECK_FALSE(FileUtils::isContainedRelativePath("lib/../../server.jar"));
}

TEST_CASE("joinPaths")
{
    CHECK_EQ(FileUtils::joinPaths("work", "server.jar"), "work/server.jar");
    CHECK_EQ(FileUtils::joinPaths("work/", "server.jar"), "work/server.jar");
    CHECK_EQ(FileUtils::joinPaths("", "server.jar"), "server.jar");
}

TEST_SUITE_END();
