#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace SandSim {

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for the grid core and the runner so that a noisy
 * subsystem can be silenced without losing the others.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>, and writes
     * a default file when neither exists.
     * @return true if the config was applied, false if already initialized.
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Get a channel logger, or the default logger if the channel is unknown.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all.
     * Examples:
     *   "grid:trace,driver:debug"
     *   "*:off,scenario:info"
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    // Convenience accessors.
    static std::shared_ptr<spdlog::logger> grid() { return get("grid"); }
    static std::shared_ptr<spdlog::logger> material() { return get("material"); }
    static std::shared_ptr<spdlog::logger> input() { return get("input"); }
    static std::shared_ptr<spdlog::logger> render() { return get("render"); }
    static std::shared_ptr<spdlog::logger> driver() { return get("driver"); }
    static std::shared_ptr<spdlog::logger> scenario() { return get("scenario"); }

    /**
     * @brief Parse a log level string ("trace", "warn", "off", ...) to enum.
     * Unknown strings map to info.
     */
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    /**
     * @brief Built-in configuration, also written out when no config file exists.
     */
    static nlohmann::json defaultConfig();

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers();

    /**
     * @brief Load JSON config from file, with .local override support.
     * Exits on error if the file exists but cannot be read or parsed.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static bool createDefaultConfigFile(const std::string& path);

    static void applyConfig(const nlohmann::json& config);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace SandSim
