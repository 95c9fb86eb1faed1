#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>

namespace trafficpulse::infra {

namespace {

int valueInRange(const nlohmann::json& section, const char* key, int fallback, int min, int max) {
    int value = section.value(key, fallback);
    if (value < min || value > max) {
        spdlog::warn("Config value {} = {} is outside [{}, {}], using {}", key, value, min, max,
                     fallback);
        return fallback;
    }
    return value;
}

std::string validLogLevel(const std::string& level, const std::string& fallback) {
    // from_str() maps unknown names to off
    if (level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
        spdlog::warn("Unknown log level '{}', using '{}'", level, fallback);
        return fallback;
    }
    return level;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        config_ = AgentConfig{};
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        std::error_code ec;
        std::filesystem::create_directories(configDir_, ec);
        if (ec) {
            spdlog::warn("Cannot create config directory {}: {}", configDir_.string(),
                         ec.message());
            return false;
        }

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::warn("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << toJson().dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["capture"]["interface"] = config_.captureInterface;
    j["capture"]["file"] = config_.captureFile;
    j["capture"]["snaplen"] = config_.captureSnaplen;
    j["capture"]["timeout_ms"] = config_.captureTimeoutMs;
    j["capture"]["promiscuous"] = config_.capturePromiscuous;

    j["subnets"]["local"] = config_.localSubnets;

    j["mapping"]["url"] = config_.mappingUrl;
    j["mapping"]["refresh_interval_seconds"] = config_.mappingRefreshIntervalSeconds;
    j["mapping"]["timeout_ms"] = config_.mappingTimeoutMs;

    j["metrics"]["port"] = config_.metricsPort;
    j["metrics"]["publish_interval_seconds"] = config_.publishIntervalSeconds;

    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;
    j["logging"]["max_size_mb"] = config_.logMaxSizeMb;
    j["logging"]["max_files"] = config_.logMaxFiles;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    AgentConfig defaults;

    if (j.contains("capture")) {
        const auto& c = j["capture"];
        config_.captureInterface = c.value("interface", defaults.captureInterface);
        config_.captureFile = c.value("file", defaults.captureFile);
        config_.captureSnaplen = c.value("snaplen", defaults.captureSnaplen);
        config_.captureTimeoutMs = c.value("timeout_ms", defaults.captureTimeoutMs);
        config_.capturePromiscuous = c.value("promiscuous", defaults.capturePromiscuous);
    }

    if (j.contains("subnets")) {
        config_.localSubnets = j["subnets"].value("local", defaults.localSubnets);
    }

    if (j.contains("mapping")) {
        const auto& m = j["mapping"];
        config_.mappingUrl = m.value("url", defaults.mappingUrl);
        config_.mappingRefreshIntervalSeconds =
            m.value("refresh_interval_seconds", defaults.mappingRefreshIntervalSeconds);
        config_.mappingTimeoutMs = m.value("timeout_ms", defaults.mappingTimeoutMs);
    }

    if (j.contains("metrics")) {
        const auto& m = j["metrics"];
        config_.metricsPort = static_cast<uint16_t>(
            valueInRange(m, "port", defaults.metricsPort, 1, std::numeric_limits<uint16_t>::max()));
        config_.publishIntervalSeconds =
            m.value("publish_interval_seconds", defaults.publishIntervalSeconds);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = validLogLevel(l.value("level", defaults.logLevel), defaults.logLevel);
        config_.logFile = l.value("file", defaults.logFile);
        config_.logMaxSizeMb = valueInRange(l, "max_size_mb", defaults.logMaxSizeMb, 1, 1024);
        config_.logMaxFiles = valueInRange(l, "max_files", defaults.logMaxFiles, 1, 100);
    }
}

} // namespace trafficpulse::infra
