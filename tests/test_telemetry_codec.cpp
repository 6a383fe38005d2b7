#include <gtest/gtest.h>
#include "../core/JsonCodec.hpp"
#include "../core/Telemetry.hpp"
#include <nlohmann/json.hpp>

using namespace nrfsim;

namespace {
constexpr std::int64_t kTs = 1700000000000;
}

TEST(TelemetryCodecTest, GnssWireFormat) {
    GnssFix fix;
    fix.lat = 35.6812;
    fix.lon = 139.7671;
    fix.acc = 10.5;

    EXPECT_EQ(JsonCodec::serialize(makeGnss(kTs, fix)),
              R"({"appId":"GNSS","ts":1700000000000,"data":{"lat":35.6812,"lon":139.7671,"acc":10.5}})");
}

TEST(TelemetryCodecTest, TemperatureWireFormat) {
    EXPECT_EQ(JsonCodec::serialize(makeTemperature(kTs, 22.5)),
              R"({"appId":"TEMP","ts":1700000000000,"data":22.5})");
}

TEST(TelemetryCodecTest, AlertWireFormat) {
    EXPECT_EQ(JsonCodec::serialize(makeAlert(kTs, 0, 0, "Button pressed")),
              R"({"appId":"ALERT","ts":1700000000000,"data":{"type":0,"value":0,"description":"Button pressed"}})");
}

TEST(TelemetryCodecTest, CounterWireFormat) {
    EXPECT_EQ(JsonCodec::serialize(makeCounter(kTs, 42)),
              R"({"appId":"COUNT","ts":1700000000000,"data":42})");
}

TEST(TelemetryCodecTest, ModemResponseCarriesMessageType) {
    EXPECT_EQ(JsonCodec::serialize(makeModemResponse(kTs, "mfw_nrf91x1_2.0.2")),
              R"({"appId":"MODEM","messageType":"DATA","ts":1700000000000,"data":"mfw_nrf91x1_2.0.2"})");
}

TEST(TelemetryCodecTest, DeviceInfoReportsVersionAndConfig) {
    ShadowConfig config;
    config.counterEnable = true;
    config.locationInterval = 60;

    std::string payload = JsonCodec::serialize(makeDeviceInfo(kTs, "0.0.1", config));
    EXPECT_EQ(payload.rfind(R"({"appId":"DEVICE","messageType":"DATA","ts":1700000000000,"data":)", 0), 0u);

    auto json = nlohmann::json::parse(payload);
    EXPECT_EQ(json["data"]["appVersion"], "0.0.1");
    EXPECT_EQ(json["data"]["config"]["counterEnable"], true);
    EXPECT_EQ(json["data"]["config"]["locationInterval"], 60);
    EXPECT_TRUE(json["data"]["networkInfo"].is_object());
    EXPECT_TRUE(json["data"]["simInfo"].contains("iccid"));
}

TEST(TelemetryCodecTest, AppIdFollowsPayloadType) {
    EXPECT_EQ(makeGnss(kTs, GnssFix{}).appId(), AppId::Gnss);
    EXPECT_EQ(makeCounter(kTs, 1).appId(), AppId::Count);
    EXPECT_EQ(appIdToString(AppId::Temp), "TEMP");
    EXPECT_EQ(appIdToString(AppId::Device), "DEVICE");
}

TEST(TelemetryCodecTest, ParsesControlMessage) {
    auto message = JsonCodec::parseControlMessage(
        R"({"appId":"MODEM","messageType":"CMD","data":"AT+CGMR"})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->appId, "MODEM");
    EXPECT_EQ(message->messageType, "CMD");
    EXPECT_EQ(message->data, "AT+CGMR");
}

TEST(TelemetryCodecTest, RejectsNonObjectControlPayloads) {
    EXPECT_FALSE(JsonCodec::parseControlMessage("not json").has_value());
    EXPECT_FALSE(JsonCodec::parseControlMessage("[1,2,3]").has_value());
    EXPECT_FALSE(JsonCodec::parseControlMessage("").has_value());

    auto partial = JsonCodec::parseControlMessage(R"({"appId":42})");
    ASSERT_TRUE(partial.has_value());
    EXPECT_TRUE(partial->appId.empty());
}

TEST(TelemetryCodecTest, ShadowUpdateAcceptsNumericStrings) {
    auto update = JsonCodec::jsonToShadowConfigUpdate(
        nlohmann::json::parse(R"({"locationInterval":"60","counterEnable":true})"));
    ASSERT_TRUE(update.locationInterval.has_value());
    EXPECT_EQ(*update.locationInterval, 60);
    ASSERT_TRUE(update.counterEnable.has_value());
    EXPECT_TRUE(*update.counterEnable);

    auto numeric = JsonCodec::jsonToShadowConfigUpdate(nlohmann::json::parse(R"({"locationInterval":120})"));
    EXPECT_EQ(numeric.locationInterval.value_or(0), 120);
    EXPECT_FALSE(numeric.counterEnable.has_value());
}

TEST(TelemetryCodecTest, ShadowUpdateIgnoresUnusableFields) {
    auto update = JsonCodec::jsonToShadowConfigUpdate(
        nlohmann::json::parse(R"({"locationInterval":"soon","counterEnable":"yes","other":1})"));
    EXPECT_TRUE(update.empty());

    EXPECT_TRUE(JsonCodec::jsonToShadowConfigUpdate(nlohmann::json("text")).empty());
}

TEST(TelemetryCodecTest, ShadowUpdateRejectsOutOfRangeIntervals) {
    for (const char* body : {R"({"locationInterval":1e12})", R"({"locationInterval":-5})",
                             R"({"locationInterval":0})", R"({"locationInterval":"300abc"})",
                             R"({"locationInterval":"1e12"})", R"({"locationInterval":"-5"})",
                             R"({"locationInterval":""})"}) {
        auto update = JsonCodec::jsonToShadowConfigUpdate(nlohmann::json::parse(body));
        EXPECT_FALSE(update.locationInterval.has_value()) << body;
    }

    auto largest = JsonCodec::jsonToShadowConfigUpdate(nlohmann::json{{"locationInterval", 2147483647}});
    EXPECT_EQ(largest.locationInterval.value_or(0), 2147483647);
}

TEST(TelemetryCodecTest, DeviceStatusCollectsTags) {
    DeviceStatus status = JsonCodec::jsonToDeviceStatus(
        "dev-1", R"({"id":"dev-1","state":{"reported":{}},"tags":["simulator",7,"kids"]})");
    EXPECT_EQ(status.deviceId, "dev-1");
    EXPECT_EQ(status.stateJson, R"({"reported":{}})");
    EXPECT_TRUE(status.firmwareJson.empty());
    ASSERT_EQ(status.tags.size(), 2u);
    EXPECT_EQ(status.tags[1], "kids");
}
