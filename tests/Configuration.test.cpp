#include "doctest.h"
#include "Extension/ExtensionConfiguration.hpp"

TEST_SUITE_BEGIN("Configuration");

TEST_CASE("an empty settings object uses the defaults")
{
    auto config = parseConfiguration("{}");
    REQUIRE(config.ok());
    CHECK_EQ(config.value().repository, "nextflow-io/language-server");
    CHECK_EQ(config.value().assetName, "language-server-all.jar");
    CHECK_EQ(config.value().stagingDirectory, "jar-download");
    CHECK_EQ(config.value().workDirectory, "");
    CHECK_EQ(config.value().javaPath, "./bin/java");
    CHECK_EQ(config.value().releasesApiUrl, "https://api.github.com");
    CHECK_FALSE(config.value().preRelease);
}

TEST_CASE("null settings use the defaults")
{
    auto config = parseConfiguration("null");
    REQUIRE(config.ok());
    CHECK_EQ(config.value().assetName, "language-server-all.jar");
}

TEST_CASE("settings override individual defaults")
{
    auto config = parseConfiguration(R"({"javaPath": "/usr/bin/java", "preRelease": true, "somethingElse": 1})");
    REQUIRE(config.ok());
    CHECK_EQ(config.value().javaPath, "/usr/bin/java");
    CHECK(config.value().preRelease);
    CHECK_EQ(config.value().repository, "nextflow-io/language-server");
}

TEST_CASE("invalid settings are configuration errors")
{
    auto syntax = parseConfiguration("{\"javaPath\": ");
    REQUIRE_FALSE(syntax.ok());
    CHECK_EQ(syntax.error().kind, ExtensionErrorKind::Configuration);

    auto notAnObject = parseConfiguration("[1, 2]");
    REQUIRE_FALSE(notAnObject.ok());
    CHECK_EQ(notAnObject.error().kind, ExtensionErrorKind::Configuration);

    auto wrongType = parseConfiguration(R"({"preRelease": "yes"})");
    REQUIRE_FALSE(wrongType.ok());
    CHECK_EQ(wrongType.error().kind, ExtensionErrorKind::Configuration);
}

TEST_CASE("staging directories that would remove the work directory are rejected")
{
    for (const char* staging : {"", ".", "./", "./.", "/tmp/staging", "../staging", "nested/../../staging"})
    {
        ExtensionConfiguration config;
        config.stagingDirectory = staging;

        auto status = validateConfiguration(config);
        REQUIRE_FALSE(status.ok());
        CHECK_EQ(status.error().kind, ExtensionErrorKind::Configuration);
    }

    auto parsed = parseConfiguration(R"({"stagingDirectory": ""})");
    REQUIRE_FALSE(parsed.ok());
    CHECK_EQ(parsed.error().kind, ExtensionErrorKind::Configuration);
}

TEST_CASE("the staging directory must not contain the artifact")
{
    ExtensionConfiguration sameName;
    sameName.stagingDirectory = "language-server-all.jar";
    CHECK_FALSE(validateConfiguration(sameName).ok());

    ExtensionConfiguration sameNameDotted;
    sameNameDotted.stagingDirectory = "./language-server-all.jar/";
    CHECK_FALSE(validateConfiguration(sameNameDotted).ok());

    ExtensionConfiguration nestedAsset;
    nestedAsset.stagingDirectory = "lib";
    nestedAsset.assetName = "lib/server.jar";
    CHECK_FALSE(validateConfiguration(nestedAsset).ok());

    auto parsed = parseConfiguration(R"({"stagingDirectory": "server.jar", "assetName": "server.jar"})");
    REQUIRE_FALSE(parsed.ok());
    CHECK_EQ(parsed.error().kind, ExtensionErrorKind::Configuration);
}

TEST_CASE("asset names must stay inside the work directory")
{
    for (const char* asset : {"", ".", "/usr/lib/server.jar", "../server.jar"})
    {
        ExtensionConfiguration config;
        config.assetName = asset;
        CHECK_FALSE(validateConfiguration(config).ok());
    }
}

TEST_CASE("nested staging directories and assets are accepted")
{
    ExtensionConfiguration config;
    config.stagingDirectory = "cache/jar-download";
    config.assetName = "server/language-server-all.jar";
    CHECK(validateConfiguration(config).ok());

    CHECK(validateConfiguration(ExtensionConfiguration{}).ok());
}

TEST_SUITE_END();
