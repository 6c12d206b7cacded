#pragma once

#include <filesystem>

namespace rhythmlink::common {

/// Resolves the full path to the bundled rhythm config file.
/// Search order: $APPDIR/usr/share/rhythmlink/config/rhythm_config.json ->
/// <exe_dir>/config/rhythm_config.json. The first candidate is returned when none exists.
std::filesystem::path bundledRhythmConfigPath();

/// Resolves the full path to the optional user rhythm override file:
/// rhythm_overrides.json under $XDG_CONFIG_HOME/rhythmlink or ~/.config/rhythmlink on Linux,
/// under %APPDATA%/rhythmlink on Windows.
/// Returns an empty path when no user config location is available.
std::filesystem::path userRhythmOverridePath();

}  // namespace rhythmlink::common
