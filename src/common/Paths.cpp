#include "rhythmlink/common/Paths.hpp"

#include <cstdlib>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace rhythmlink::common {
namespace {

constexpr const char* kProjectDir = "rhythmlink";

std::filesystem::path executableDir() {
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf).parent_path();
#else
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf).parent_path();
#endif
}

const char* nonEmptyEnv(const char* key) {
    const char* value = std::getenv(key);
    return value != nullptr && value[0] != '\0' ? value : nullptr;
}

}  // namespace

std::filesystem::path bundledRhythmConfigPath() {
    static const std::filesystem::path exeDir = executableDir();

    std::vector<std::filesystem::path> candidates;
#ifndef _WIN32
    if (const char* appDir = nonEmptyEnv("APPDIR"); appDir != nullptr) {
        candidates.push_back(std::filesystem::path(appDir) / "usr" / "share" / kProjectDir / "config");
    }
#endif
    candidates.push_back(exeDir / "config");

    for (const auto& dir : candidates) {
        const auto path = dir / "rhythm_config.json";
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !ec) {
            return path;
        }
    }
    // Report the preferred location when nothing is installed
    return candidates.front() / "rhythm_config.json";
}

std::filesystem::path userRhythmOverridePath() {
    std::filesystem::path userDir;
#ifdef _WIN32
    if (const char* appData = nonEmptyEnv("APPDATA"); appData != nullptr) {
        userDir = std::filesystem::path(appData) / kProjectDir;
    }
#else
    if (const char* xdg = nonEmptyEnv("XDG_CONFIG_HOME"); xdg != nullptr) {
        userDir = std::filesystem::path(xdg) / kProjectDir;
    } else if (const char* home = nonEmptyEnv("HOME"); home != nullptr) {
        userDir = std::filesystem::path(home) / ".config" / kProjectDir;
    }
#endif
    return userDir.empty() ? userDir : userDir / "rhythm_overrides.json";
}

}  // namespace rhythmlink::common
