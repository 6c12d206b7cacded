#include "rhythmlink/rhythm/RhythmConfig.hpp"

#include "ScopedEnvVar.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace rhythmlink::rhythm {
namespace {

using test_helpers::ScopedEnvVar;

std::filesystem::path makeConfigHome(const std::string& name) {
    const auto base = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(base, ec);
    std::filesystem::create_directories(base / "rhythmlink", ec);
    return base;
}

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

TEST(RhythmConfigTest, EmptyObjectYieldsDefaults) {
    const auto config = parseRhythmConfig("{}");
    ASSERT_TRUE(config.has_value()) << config.error();

    EXPECT_FALSE(config->refineStacksOnRecompute);
    EXPECT_EQ(config->crossSlurMaxPitchDelta, 0);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 40);
    EXPECT_EQ(config->logLevel, common::LogLevel::Info);
    EXPECT_TRUE(config->logFile.empty());
}

TEST(RhythmConfigTest, ParsesEveryField) {
    const auto config = parseRhythmConfig(R"({
        "refineStacksOnRecompute": true,
        "crossSlurMaxPitchDelta": 2,
        "crossSlurMaxOrdinateDelta": 15,
        "logLevel": "DEBUG",
        "logFile": "/tmp/rhythmlink.log"
    })");
    ASSERT_TRUE(config.has_value()) << config.error();

    EXPECT_TRUE(config->refineStacksOnRecompute);
    EXPECT_EQ(config->crossSlurMaxPitchDelta, 2);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 15);
    EXPECT_EQ(config->logLevel, common::LogLevel::Debug);
    EXPECT_EQ(config->logFile, std::filesystem::path("/tmp/rhythmlink.log"));
}

TEST(RhythmConfigTest, NegativeTolerancesAreClamped) {
    const auto config = parseRhythmConfig(R"({"crossSlurMaxPitchDelta": -3, "crossSlurMaxOrdinateDelta": -1})");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->crossSlurMaxPitchDelta, 0);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 0);
}

TEST(RhythmConfigTest, MistypedValuesKeepDefaults) {
    const auto config = parseRhythmConfig(R"({"refineStacksOnRecompute": "yes", "crossSlurMaxOrdinateDelta": 2.5})");
    ASSERT_TRUE(config.has_value());

    EXPECT_FALSE(config->refineStacksOnRecompute);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 40);
}

TEST(RhythmConfigTest, MalformedJsonIsAnError) {
    const auto config = parseRhythmConfig("{ not valid json");
    ASSERT_FALSE(config.has_value());
    EXPECT_FALSE(config.error().empty());
}

TEST(RhythmConfigTest, NonObjectRootIsAnError) {
    EXPECT_FALSE(parseRhythmConfig("[1, 2]").has_value());
}

TEST(RhythmConfigTest, UnknownLogLevelIsAnError) {
    const auto config = parseRhythmConfig(R"({"logLevel": "verbose"})");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("verbose"), std::string::npos);
}

TEST(RhythmConfigTest, MissingFileIsAnError) {
    const auto config = loadRhythmConfigFile(std::filesystem::temp_directory_path() / "rhythmlink-no-such-config.json");
    EXPECT_FALSE(config.has_value());
}

TEST(RhythmConfigTest, LoadsConfigFile) {
    const auto base = makeConfigHome("rhythmlink-cfg-file");
    const auto path = base / "config.json";
    writeFile(path, R"({"crossSlurMaxOrdinateDelta": 25})");

    const auto config = loadRhythmConfigFile(path);
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 25);

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, UserOverridesAreMergedOverBundledConfig) {
    const auto base = makeConfigHome("rhythmlink-cfg-override");
    writeFile(base / "rhythmlink" / "rhythm_overrides.json",
              R"({"refineStacksOnRecompute": true, "crossSlurMaxOrdinateDelta": 12})");

    ScopedEnvVar env("XDG_CONFIG_HOME", base.string());
    const auto config = loadRhythmConfig();
    ASSERT_TRUE(config.has_value()) << config.error();

    EXPECT_TRUE(config->refineStacksOnRecompute);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 12);
    EXPECT_EQ(config->crossSlurMaxPitchDelta, 0);

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, NullOverrideRestoresDefault) {
    const auto base = makeConfigHome("rhythmlink-cfg-null");
    writeFile(base / "rhythmlink" / "rhythm_overrides.json", R"({"crossSlurMaxOrdinateDelta": null})");

    ScopedEnvVar env("XDG_CONFIG_HOME", base.string());
    const auto config = loadRhythmConfig();
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 40);

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, MalformedOverrideIsAnError) {
    const auto base = makeConfigHome("rhythmlink-cfg-badjson");
    writeFile(base / "rhythmlink" / "rhythm_overrides.json", "{ not valid json");

    ScopedEnvVar env("XDG_CONFIG_HOME", base.string());
    EXPECT_FALSE(loadRhythmConfig().has_value());

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, NonObjectOverrideIsAnError) {
    const auto base = makeConfigHome("rhythmlink-cfg-badroot");
    writeFile(base / "rhythmlink" / "rhythm_overrides.json", "[]");

    ScopedEnvVar env("XDG_CONFIG_HOME", base.string());
    EXPECT_FALSE(loadRhythmConfig().has_value());

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, NoOverrideFileUsesBundledValues) {
    const auto base = makeConfigHome("rhythmlink-cfg-none");

    ScopedEnvVar env("XDG_CONFIG_HOME", base.string());
    const auto config = loadRhythmConfig();
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_FALSE(config->refineStacksOnRecompute);
    EXPECT_EQ(config->crossSlurMaxOrdinateDelta, 40);

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

TEST(RhythmConfigTest, InitLoggingOpensConfiguredFile) {
    const auto base = makeConfigHome("rhythmlink-cfg-log");
    RhythmConfig config;
    config.logLevel = common::LogLevel::Debug;
    config.logFile = base / "rhythm.log";

    initLogging(config);
    EXPECT_TRUE(common::Logger::isDebugEnabled());
    common::Logger::shutdown();
    common::Logger::setLevel(common::LogLevel::Info);

    std::ifstream in(config.logFile);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("Rhythm config loaded, log level debug"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(base, ec);
}

}  // namespace
}  // namespace rhythmlink::rhythm
