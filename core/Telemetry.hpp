#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace nrfsim {

enum class AppId {
    Gnss,
    Temp,
    Alert,
    Count,
    Device,
    Modem
};

struct GnssFix {
    double lat = 0.0;
    double lon = 0.0;
    double acc = 0.0;
};

struct Temperature {
    double celsius = 0.0;
};

struct Alert {
    int type = 0;
    int value = 0;
    std::string description;
};

struct Counter {
    std::int64_t value = 0;
};

// Device-side copy of the cloud shadow settings
struct ShadowConfig {
    bool counterEnable = false;
    int locationInterval = 300;
};

struct DeviceInfo {
    std::string appVersion;
    ShadowConfig config;
};

struct ModemResponse {
    std::string response;
};

using TelemetryData = std::variant<GnssFix, Temperature, Alert, Counter, DeviceInfo, ModemResponse>;

struct TelemetryMessage {
    std::int64_t ts = 0;
    TelemetryData data;

    AppId appId() const;
};

std::string appIdToString(AppId id);

TelemetryMessage makeGnss(std::int64_t ts, const GnssFix& fix);
TelemetryMessage makeTemperature(std::int64_t ts, double celsius);
TelemetryMessage makeAlert(std::int64_t ts, int type, int value, const std::string& description);
TelemetryMessage makeCounter(std::int64_t ts, std::int64_t value);
TelemetryMessage makeDeviceInfo(std::int64_t ts, const std::string& appVersion, const ShadowConfig& config);
TelemetryMessage makeModemResponse(std::int64_t ts, const std::string& response);

} // namespace nrfsim
