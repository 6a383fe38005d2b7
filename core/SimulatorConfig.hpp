#pragma once

#include <chrono>
#include <string>

namespace nrfsim {

/**
 * @brief Tunables for one simulated device
 *
 * Defaults match a freshly generated simulator.toml; only the API key has no
 * usable default.
 */
struct SimulatorConfig {
    // [nrf_cloud]
    std::string apiKey;                                 ///< Secret, never logged
    std::string deviceId = "kid-gps-sim-001";
    std::string apiHost = "https://api.nrfcloud.com";

    // [simulation]
    int locationIntervalSeconds = 300;
    int temperatureIntervalSeconds = 300;
    double temperatureBase = 22.0;                      ///< Celsius
    double temperatureVariation = 5.0;                  ///< Diurnal amplitude, Celsius
    double maxJitterMeters = 15.0;
    bool counterEnable = false;
    std::string appVersion = "0.0.1";

    // [storage]
    std::string certsDir = "certs";

    // [diagnostics]
    int observationSeconds = 10;
    int postSubscribeSeconds = 3;

    bool hasApiKey() const { return !apiKey.empty(); }
};

} // namespace nrfsim
