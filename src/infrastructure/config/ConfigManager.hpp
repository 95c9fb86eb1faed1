#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace trafficpulse::infra {

/**
 * @brief Agent configuration settings.
 *
 * Defaults reproduce the built-in deployment: capture on the mapping's LAN
 * interface, account for 10.40.0.0/20, fetch mappings from the local status
 * service and serve metrics on port 59122.
 */
struct AgentConfig {
    // Capture
    std::string captureInterface;     ///< Device to capture on; empty uses the mapping's lan NIC.
    std::string captureFile;          ///< Savefile to replay instead of a live device.
    int captureSnaplen{65535};        ///< Maximum bytes captured per frame.
    int captureTimeoutMs{1000};       ///< Capture read timeout in milliseconds.
    bool capturePromiscuous{true};    ///< Enable promiscuous mode.

    // Classification
    std::vector<std::string> localSubnets{"10.40.0.0/20"}; ///< Local CIDR prefixes.

    // Mapping authority
    std::string mappingUrl{"http://localhost:32599/status"}; ///< Status document URL.
    int mappingRefreshIntervalSeconds{10}; ///< Seconds between mapping refreshes.
    int mappingTimeoutMs{5000};            ///< Mapping request timeout in milliseconds.

    // Metrics
    uint16_t metricsPort{59122};           ///< Exposition server port.
    int publishIntervalSeconds{1};         ///< Length of a reporting window.

    // Logging
    std::string logLevel{"info"};          ///< Console log level.
    std::string logFile;                   ///< Rotating log file path; empty disables it.
    int logMaxSizeMb{5};                   ///< Maximum size of one log file.
    int logMaxFiles{3};                    ///< Number of rotated log files kept.
};

/**
 * @brief Loads the agent configuration from a JSON file.
 *
 * The file is read once at startup; there is no reload.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with the defaults. A malformed file is logged
     * and the defaults are kept.
     *
     * @return True if loaded (or created) successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AgentConfig& config() { return config_; }
    const AgentConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AgentConfig config_;
};

} // namespace trafficpulse::infra
