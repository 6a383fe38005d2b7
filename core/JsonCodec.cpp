#include "JsonCodec.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace nrfsim {

namespace {

struct DataEncoder {
    nlohmann::ordered_json& j;

    void operator()(const GnssFix& fix) const {
        nlohmann::ordered_json data;
        data["lat"] = fix.lat;
        data["lon"] = fix.lon;
        data["acc"] = fix.acc;
        j["data"] = data;
    }

    void operator()(const Temperature& temp) const {
        j["data"] = temp.celsius;
    }

    void operator()(const Alert& alert) const {
        nlohmann::ordered_json data;
        data["type"] = alert.type;
        data["value"] = alert.value;
        data["description"] = alert.description;
        j["data"] = data;
    }

    void operator()(const Counter& counter) const {
        j["data"] = counter.value;
    }

    void operator()(const DeviceInfo& info) const {
        nlohmann::ordered_json data;
        data["networkInfo"] = {
            {"networkCode", "10"},
            {"areaCode", "1234"},
            {"mccmnc", "44010"},
            {"ipAddress", "10.0.0.1"},
            {"cellID", "ABCD1234"},
            {"rsrp", -85}
        };
        data["simInfo"] = {
            {"iccid", "8981100000000000000"},
            {"imsi", "440100000000000"}
        };
        data["appVersion"] = info.appVersion;
        data["config"] = JsonCodec::shadowConfigToJson(info.config);
        j["data"] = data;
    }

    void operator()(const ModemResponse& modem) const {
        j["data"] = modem.response;
    }
};

std::string dumpOrEmpty(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        return "";
    }
    return json[key].dump();
}

} // namespace

std::string JsonCodec::serialize(const TelemetryMessage& message) {
    return messageToJson(message).dump();
}

nlohmann::ordered_json JsonCodec::messageToJson(const TelemetryMessage& message) {
    nlohmann::ordered_json j;
    AppId id = message.appId();

    j["appId"] = appIdToString(id);
    if (id == AppId::Device || id == AppId::Modem) {
        j["messageType"] = "DATA";
    }
    j["ts"] = message.ts;

    std::visit(DataEncoder{j}, message.data);
    return j;
}

nlohmann::json JsonCodec::connectionInfoToJson(const std::string& deviceId, const ConnectionInfo& info) {
    nlohmann::json j;
    j["device_id"] = deviceId;
    j["mqtt_host"] = info.brokerHost;
    j["mqtt_port"] = info.brokerPort;
    j["topic_prefix"] = info.topicPrefix;
    j["stage"] = info.stage;
    j["topic_d2c"] = info.telemetryTopic;
    j["topic_c2d"] = info.controlTopic;
    return j;
}

ConnectionInfo JsonCodec::jsonToConnectionInfo(const nlohmann::json& json) {
    ConnectionInfo info;
    info.brokerHost = json.value("mqtt_host", "");
    auto port = json.find("mqtt_port");
    if (port != json.end()) {
        // Anything that is not a TCP port leaves 0, which isComplete() rejects
        info.brokerPort = 0;
        if (port->is_number_unsigned()) {
            auto value = port->get<std::uint64_t>();
            if (value >= 1 && value <= std::numeric_limits<std::uint16_t>::max()) {
                info.brokerPort = static_cast<std::uint16_t>(value);
            }
        } else if (port->is_number_integer()) {
            auto value = port->get<std::int64_t>();
            if (value >= 1 && value <= std::numeric_limits<std::uint16_t>::max()) {
                info.brokerPort = static_cast<std::uint16_t>(value);
            }
        }
    }
    info.topicPrefix = json.value("topic_prefix", "");
    info.stage = json.value("stage", "");
    info.telemetryTopic = json.value("topic_d2c", "");
    info.controlTopic = json.value("topic_c2d", "");
    return info;
}

DeviceStatus JsonCodec::jsonToDeviceStatus(const std::string& deviceId, const std::string& body) {
    DeviceStatus status;
    status.deviceId = deviceId;
    status.rawBody = body;

    auto json = nlohmann::json::parse(body);
    status.deviceId = json.value("id", deviceId);
    status.stateJson = dumpOrEmpty(json, "state");
    status.firmwareJson = dumpOrEmpty(json, "firmware");

    if (json.contains("tags") && json["tags"].is_array()) {
        for (const auto& tag : json["tags"]) {
            if (tag.is_string()) {
                status.tags.push_back(tag.get<std::string>());
            }
        }
    }

    return status;
}

nlohmann::json JsonCodec::shadowConfigToJson(const ShadowConfig& config) {
    nlohmann::json j;
    j["counterEnable"] = config.counterEnable;
    j["locationInterval"] = config.locationInterval;
    return j;
}

std::optional<ControlMessage> JsonCodec::parseControlMessage(const std::string& payload) {
    auto json = nlohmann::json::parse(payload, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    ControlMessage message;
    if (json.contains("appId") && json["appId"].is_string()) {
        message.appId = json["appId"].get<std::string>();
    }
    if (json.contains("messageType") && json["messageType"].is_string()) {
        message.messageType = json["messageType"].get<std::string>();
    }
    if (json.contains("data")) {
        message.data = json["data"];
    }
    return message;
}

ShadowConfigUpdate JsonCodec::jsonToShadowConfigUpdate(const nlohmann::json& data) {
    ShadowConfigUpdate update;
    if (!data.is_object()) {
        return update;
    }

    if (data.contains("counterEnable") && data["counterEnable"].is_boolean()) {
        update.counterEnable = data["counterEnable"].get<bool>();
    }

    // The cloud sends the interval as a number or a numeric string
    if (data.contains("locationInterval")) {
        const auto& interval = data["locationInterval"];
        std::optional<double> seconds;
        if (interval.is_number()) {
            seconds = interval.get<double>();
        } else if (interval.is_string()) {
            const std::string text = interval.get<std::string>();
            try {
                std::size_t used = 0;
                double parsed = std::stod(text, &used);
                if (used == text.size()) {
                    seconds = parsed;
                }
            } catch (const std::logic_error&) {
                seconds.reset();
            }
        }
        // Only whole seconds in (0, INT_MAX] are usable
        if (seconds && std::isfinite(*seconds) && *seconds >= 1.0 &&
            *seconds <= static_cast<double>(std::numeric_limits<int>::max())) {
            update.locationInterval = static_cast<int>(*seconds);
        }
    }
    return update;
}

} // namespace nrfsim
