#pragma once

#include "Telemetry.hpp"
#include "DeviceSessionContext.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nrfsim {

// Inbound cloud-to-device envelope
struct ControlMessage {
    std::string appId;
    std::string messageType;
    nlohmann::json data;
};

// Fields a CONFIG message may carry; absent fields stay unset
struct ShadowConfigUpdate {
    std::optional<bool> counterEnable;
    std::optional<int> locationInterval;

    bool empty() const { return !counterEnable && !locationInterval; }
};

class JsonCodec {
public:
    // Wire payloads keep appId, ts, data order
    static std::string serialize(const TelemetryMessage& message);
    static nlohmann::ordered_json messageToJson(const TelemetryMessage& message);

    static nlohmann::json connectionInfoToJson(const std::string& deviceId, const ConnectionInfo& info);
    static ConnectionInfo jsonToConnectionInfo(const nlohmann::json& json);

    static DeviceStatus jsonToDeviceStatus(const std::string& deviceId, const std::string& body);

    static nlohmann::json shadowConfigToJson(const ShadowConfig& config);

    // std::nullopt for payloads that are not a JSON object
    static std::optional<ControlMessage> parseControlMessage(const std::string& payload);
    static ShadowConfigUpdate jsonToShadowConfigUpdate(const nlohmann::json& data);
};

} // namespace nrfsim
