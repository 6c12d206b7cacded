#pragma once

#include "rhythmlink/common/Logger.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace rhythmlink::rhythm {

struct RhythmConfig {
    // Run stack-local refinement on every rebuilt stack before linking it to its neighbours.
    bool refineStacksOnRecompute = false;
    // Tolerances of the default cross-page slur linker.
    int crossSlurMaxPitchDelta = 0;
    int crossSlurMaxOrdinateDelta = 40;
    common::LogLevel logLevel = common::LogLevel::Info;
    std::filesystem::path logFile;
};

/// Parse a config document. Keys absent from the document keep their default value.
std::expected<RhythmConfig, std::string> parseRhythmConfig(std::string_view text);

std::expected<RhythmConfig, std::string> loadRhythmConfigFile(const std::filesystem::path& path);

/// Load the bundled config merged with the optional user override file.
/// A missing bundled file yields the defaults; a malformed file is an error.
std::expected<RhythmConfig, std::string> loadRhythmConfig();

/// Open the configured log file at the configured level. An empty path only sets the level.
void initLogging(const RhythmConfig& config);

}  // namespace rhythmlink::rhythm
