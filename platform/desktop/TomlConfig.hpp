/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop simulator
 *
 * Simple line-based parser for the flat subset of TOML the simulator uses:
 * section headers, `key = value` pairs, quoted strings, integers, floats,
 * booleans and `#` comments.
 *
 * Supported Sections:
 * - [nrf_cloud]: API key, device id, REST host
 * - [simulation]: telemetry cadences and sensor models
 * - [storage]: credential directory
 * - [diagnostics]: observation windows for --diag
 *
 * Environment variables NRF_CLOUD_API_KEY and NRF_DEVICE_ID override the
 * file so secrets can stay out of it.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "Errors.hpp"
#include "SimulatorConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace nrfsim {

/**
 * @brief TOML configuration loader and validator
 *
 * Unknown sections and keys are ignored with a warning. Malformed numbers
 * and failed validation raise ConfigError naming the offending key.
 */
class TomlConfig {
public:
    using EnvLookup = std::function<std::string(const char*)>;

    /**
     * @brief Load a configuration file, then apply environment overrides
     * @param filename Path to the TOML file; a missing file leaves defaults in place
     * @throws ConfigError if a value is malformed
     * @note Call validate() before using the result
     */
    static SimulatorConfig loadFromFile(const std::string& filename, const EnvLookup& env = systemEnv) {
        SimulatorConfig config;
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << std::endl;
        } else {
            std::stringstream content;
            content << file.rdbuf();
            config = parse(content.str());
        }

        applyEnvironment(config, env);
        return config;
    }

    /**
     * @brief Parse TOML text into a configuration
     * @throws ConfigError if a value is malformed
     */
    static SimulatorConfig parse(const std::string& content) {
        SimulatorConfig config;
        std::istringstream input(content);

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Handle section headers
            if (line[0] == '[') {
                if (line.back() != ']') {
                    throw ConfigError("Malformed section header on line " + std::to_string(lineNumber));
                }
                currentSection = line.substr(1, line.length() - 2);
                trim(currentSection);
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw ConfigError("Expected key = value on line " + std::to_string(lineNumber));
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            apply(config, currentSection, key, value);
        }

        return config;
    }

    /// NRF_CLOUD_API_KEY and NRF_DEVICE_ID win over file values
    static void applyEnvironment(SimulatorConfig& config, const EnvLookup& env) {
        std::string apiKey = env("NRF_CLOUD_API_KEY");
        std::string deviceId = env("NRF_DEVICE_ID");

        if (!apiKey.empty()) config.apiKey = apiKey;
        if (!deviceId.empty()) config.deviceId = deviceId;
    }

    /**
     * @brief Check the configuration is usable
     * @throws ConfigError describing the first problem found
     */
    static void validate(const SimulatorConfig& config) {
        if (config.apiKey.empty()) {
            throw ConfigError("nrf_cloud.api_key is required (or set NRF_CLOUD_API_KEY)");
        }
        if (config.deviceId.empty()) {
            throw ConfigError("nrf_cloud.device_id must not be empty");
        }
        if (config.apiHost.compare(0, 8, "https://") != 0) {
            throw ConfigError("nrf_cloud.api_host must be an https:// URL");
        }
        if (config.locationIntervalSeconds <= 0) {
            throw ConfigError("simulation.location_interval_seconds must be positive");
        }
        if (config.temperatureIntervalSeconds <= 0) {
            throw ConfigError("simulation.temperature_interval_seconds must be positive");
        }
        if (config.temperatureVariation < 0.0) {
            throw ConfigError("simulation.temperature_variation must not be negative");
        }
        if (config.maxJitterMeters < 1.0) {
            throw ConfigError("simulation.max_jitter_meters must be at least 1");
        }
        if (config.observationSeconds <= 0 || config.postSubscribeSeconds <= 0) {
            throw ConfigError("diagnostics windows must be positive");
        }
    }

    static std::string systemEnv(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
    }

private:
    static void apply(SimulatorConfig& config, const std::string& section,
                      const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "nrf_cloud") {
            if (key == "api_key") {
                config.apiKey = value;
            } else if (key == "device_id") {
                config.deviceId = value;
            } else if (key == "api_host") {
                config.apiHost = value;
                while (!config.apiHost.empty() && config.apiHost.back() == '/') {
                    config.apiHost.pop_back();
                }
            } else {
                warnUnknown(name);
            }
        } else if (section == "simulation") {
            if (key == "location_interval_seconds") {
                config.locationIntervalSeconds = toInt(name, value);
            } else if (key == "temperature_interval_seconds") {
                config.temperatureIntervalSeconds = toInt(name, value);
            } else if (key == "temperature_base") {
                config.temperatureBase = toDouble(name, value);
            } else if (key == "temperature_variation") {
                config.temperatureVariation = toDouble(name, value);
            } else if (key == "max_jitter_meters") {
                config.maxJitterMeters = toDouble(name, value);
            } else if (key == "counter_enable") {
                config.counterEnable = toBool(name, value);
            } else if (key == "app_version") {
                config.appVersion = value;
            } else {
                warnUnknown(name);
            }
        } else if (section == "storage") {
            if (key == "certs_dir") {
                config.certsDir = value;
            } else {
                warnUnknown(name);
            }
        } else if (section == "diagnostics") {
            if (key == "observation_seconds") {
                config.observationSeconds = toInt(name, value);
            } else if (key == "post_subscribe_seconds") {
                config.postSubscribeSeconds = toInt(name, value);
            } else {
                warnUnknown(name);
            }
        } else {
            warnUnknown(name);
        }
    }

    static int toInt(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            int result = std::stoi(value, &used);
            if (used != value.size()) {
                throw ConfigError(name + " must be an integer, got \"" + value + "\"");
            }
            return result;
        } catch (const std::logic_error&) {
            throw ConfigError(name + " must be an integer, got \"" + value + "\"");
        }
    }

    static double toDouble(const std::string& name, const std::string& value) {
        try {
            size_t used = 0;
            double result = std::stod(value, &used);
            if (used != value.size()) {
                throw ConfigError(name + " must be a number, got \"" + value + "\"");
            }
            return result;
        } catch (const std::logic_error&) {
            throw ConfigError(name + " must be a number, got \"" + value + "\"");
        }
    }

    static bool toBool(const std::string& name, const std::string& value) {
        if (value == "true") return true;
        if (value == "false") return false;
        throw ConfigError(name + " must be true or false, got \"" + value + "\"");
    }

    static void warnUnknown(const std::string& name) {
        std::cerr << "[Config] Warning: ignoring unknown key " << name << std::endl;
    }

    /**
     * @brief Drop a trailing # comment that is not inside a quoted string
     * @param line Line to strip (modified in place)
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.resize(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace nrfsim
