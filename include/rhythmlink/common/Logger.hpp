#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace rhythmlink::common {

enum class LogLevel : uint8_t {
    Info,
    Debug,
};

/// Simple logger that writes timestamped diagnostics to a file.
/// Nothing is written until init() has opened a log file.
class Logger {
public:
    static void init(const std::filesystem::path& logPath, LogLevel level = LogLevel::Info);
    static void setLevel(LogLevel level);
    [[nodiscard]] static bool isDebugEnabled();
    static void log(const std::string& message);
    static void logDebug(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace rhythmlink::common
