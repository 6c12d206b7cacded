#include "rhythmlink/rhythm/RhythmConfig.hpp"

#include "rhythmlink/common/Logger.hpp"
#include "rhythmlink/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <optional>
#include <system_error>

using json = nlohmann::json;

namespace rhythmlink::rhythm {
namespace {

std::expected<json, std::string> loadJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected("Cannot open " + path.string());
    }

    json parsed;
    try {
        in >> parsed;
        return parsed;
    } catch (const std::exception& e) {
        return std::unexpected("Malformed JSON in " + path.string() + ": " + e.what());
    }
}

void mergeJsonObject(json& base, const json& overrides) {
    if (!base.is_object() || !overrides.is_object()) {
        return;
    }

    for (const auto& [key, overrideValue] : overrides.items()) {
        if (overrideValue.is_null()) {
            base.erase(key);
            continue;
        }

        auto baseIt = base.find(key);
        if (baseIt != base.end() && baseIt->is_object() && overrideValue.is_object()) {
            mergeJsonObject(*baseIt, overrideValue);
            continue;
        }

        base[key] = overrideValue;
    }
}

std::string toLowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<common::LogLevel> parseLogLevel(std::string_view value) {
    const std::string level = toLowercase(std::string(value));
    if (level == "info") {
        return common::LogLevel::Info;
    }
    if (level == "debug") {
        return common::LogLevel::Debug;
    }
    return std::nullopt;
}

std::expected<RhythmConfig, std::string> parseConfigObject(const json& value) {
    if (!value.is_object()) {
        return std::unexpected("Rhythm config root must be an object");
    }

    RhythmConfig config{};
    if (value.contains("refineStacksOnRecompute") && value["refineStacksOnRecompute"].is_boolean()) {
        config.refineStacksOnRecompute = value["refineStacksOnRecompute"].get<bool>();
    }
    if (value.contains("crossSlurMaxPitchDelta") && value["crossSlurMaxPitchDelta"].is_number_integer()) {
        config.crossSlurMaxPitchDelta = std::max(0, value["crossSlurMaxPitchDelta"].get<int>());
    }
    if (value.contains("crossSlurMaxOrdinateDelta") && value["crossSlurMaxOrdinateDelta"].is_number_integer()) {
        config.crossSlurMaxOrdinateDelta = std::max(0, value["crossSlurMaxOrdinateDelta"].get<int>());
    }
    if (value.contains("logLevel") && value["logLevel"].is_string()) {
        const auto level = parseLogLevel(value["logLevel"].get<std::string>());
        if (!level.has_value()) {
            return std::unexpected("Unknown logLevel: " + value["logLevel"].get<std::string>());
        }
        config.logLevel = *level;
    }
    if (value.contains("logFile") && value["logFile"].is_string()) {
        config.logFile = value["logFile"].get<std::string>();
    }
    return config;
}

}  // namespace

std::expected<RhythmConfig, std::string> parseRhythmConfig(std::string_view text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Malformed rhythm config: ") + e.what());
    }
    return parseConfigObject(parsed);
}

std::expected<RhythmConfig, std::string> loadRhythmConfigFile(const std::filesystem::path& path) {
    auto loaded = loadJsonFile(path);
    if (!loaded.has_value()) {
        return std::unexpected(loaded.error());
    }
    return parseConfigObject(*loaded);
}

std::expected<RhythmConfig, std::string> loadRhythmConfig() {
    json merged = json::object();

    const auto bundledPath = common::bundledRhythmConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(bundledPath, ec) && !ec) {
        auto bundled = loadJsonFile(bundledPath);
        if (!bundled.has_value()) {
            return std::unexpected(bundled.error());
        }
        if (!bundled->is_object()) {
            return std::unexpected("Rhythm config root must be an object: " + bundledPath.string());
        }
        merged = std::move(*bundled);
    }

    const auto overridePath = common::userRhythmOverridePath();
    if (!overridePath.empty()) {
        ec.clear();
        if (std::filesystem::exists(overridePath, ec) && !ec) {
            auto overrides = loadJsonFile(overridePath);
            if (!overrides.has_value()) {
                return std::unexpected(overrides.error());
            }
            if (!overrides->is_object()) {
                return std::unexpected("Rhythm override root must be an object: " + overridePath.string());
            }
            mergeJsonObject(merged, *overrides);
        }
    }

    return parseConfigObject(merged);
}

void initLogging(const RhythmConfig& config) {
    common::Logger::init(config.logFile, config.logLevel);
    common::Logger::log("Rhythm config loaded, log level " +
                        std::string(config.logLevel == common::LogLevel::Debug ? "debug" : "info"));
}

}  // namespace rhythmlink::rhythm
