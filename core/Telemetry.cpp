#include "Telemetry.hpp"

namespace nrfsim {

namespace {

struct AppIdVisitor {
    AppId operator()(const GnssFix&) const { return AppId::Gnss; }
    AppId operator()(const Temperature&) const { return AppId::Temp; }
    AppId operator()(const Alert&) const { return AppId::Alert; }
    AppId operator()(const Counter&) const { return AppId::Count; }
    AppId operator()(const DeviceInfo&) const { return AppId::Device; }
    AppId operator()(const ModemResponse&) const { return AppId::Modem; }
};

} // namespace

AppId TelemetryMessage::appId() const {
    return std::visit(AppIdVisitor{}, data);
}

std::string appIdToString(AppId id) {
    switch (id) {
        case AppId::Gnss: return "GNSS";
        case AppId::Temp: return "TEMP";
        case AppId::Alert: return "ALERT";
        case AppId::Count: return "COUNT";
        case AppId::Device: return "DEVICE";
        case AppId::Modem: return "MODEM";
        default: return "UNKNOWN";
    }
}

TelemetryMessage makeGnss(std::int64_t ts, const GnssFix& fix) {
    return TelemetryMessage{ts, fix};
}

TelemetryMessage makeTemperature(std::int64_t ts, double celsius) {
    return TelemetryMessage{ts, Temperature{celsius}};
}

TelemetryMessage makeAlert(std::int64_t ts, int type, int value, const std::string& description) {
    return TelemetryMessage{ts, Alert{type, value, description}};
}

TelemetryMessage makeCounter(std::int64_t ts, std::int64_t value) {
    return TelemetryMessage{ts, Counter{value}};
}

TelemetryMessage makeDeviceInfo(std::int64_t ts, const std::string& appVersion, const ShadowConfig& config) {
    return TelemetryMessage{ts, DeviceInfo{appVersion, config}};
}

TelemetryMessage makeModemResponse(std::int64_t ts, const std::string& response) {
    return TelemetryMessage{ts, ModemResponse{response}};
}

} // namespace nrfsim
