#include <gtest/gtest.h>
#include "TomlConfig.hpp"
#include "TestSupport.hpp"
#include <fstream>
#include <map>

using namespace nrfsim;

namespace {

TomlConfig::EnvLookup envFrom(std::map<std::string, std::string> values) {
    return [values](const char* name) {
        auto it = values.find(name);
        return it == values.end() ? std::string() : it->second;
    };
}

SimulatorConfig validConfig() {
    SimulatorConfig config;
    config.apiKey = "test-key";
    return config;
}

} // namespace

TEST(TomlConfigTest, ParsesAllSections) {
    SimulatorConfig config = TomlConfig::parse(R"(
# simulator settings
[nrf_cloud]
api_key = "abc123"
device_id = "kid-gps-sim-042"
api_host = "https://api.example.com/"

[simulation]
location_interval_seconds = 60
temperature_interval_seconds = 120
temperature_base = 18.5
temperature_variation = 3
max_jitter_meters = 25.0
counter_enable = true
app_version = "1.2.3"

[storage]
certs_dir = "/var/lib/nrfsim"

[diagnostics]
observation_seconds = 20
post_subscribe_seconds = 5
)");

    EXPECT_EQ(config.apiKey, "abc123");
    EXPECT_EQ(config.deviceId, "kid-gps-sim-042");
    EXPECT_EQ(config.apiHost, "https://api.example.com");
    EXPECT_EQ(config.locationIntervalSeconds, 60);
    EXPECT_EQ(config.temperatureIntervalSeconds, 120);
    EXPECT_DOUBLE_EQ(config.temperatureBase, 18.5);
    EXPECT_DOUBLE_EQ(config.temperatureVariation, 3.0);
    EXPECT_DOUBLE_EQ(config.maxJitterMeters, 25.0);
    EXPECT_TRUE(config.counterEnable);
    EXPECT_EQ(config.appVersion, "1.2.3");
    EXPECT_EQ(config.certsDir, "/var/lib/nrfsim");
    EXPECT_EQ(config.observationSeconds, 20);
    EXPECT_EQ(config.postSubscribeSeconds, 5);
}

TEST(TomlConfigTest, EmptyInputKeepsDefaults) {
    SimulatorConfig config = TomlConfig::parse("");
    EXPECT_TRUE(config.apiKey.empty());
    EXPECT_EQ(config.deviceId, "kid-gps-sim-001");
    EXPECT_EQ(config.locationIntervalSeconds, 300);
    EXPECT_EQ(config.certsDir, "certs");
}

TEST(TomlConfigTest, HashInsideQuotesIsNotAComment) {
    SimulatorConfig config = TomlConfig::parse(R"(
[nrf_cloud]
api_key = "key#with#hashes"   # trailing comment
)");
    EXPECT_EQ(config.apiKey, "key#with#hashes");
}

TEST(TomlConfigTest, UnknownKeysAreIgnored) {
    SimulatorConfig config = TomlConfig::parse(R"(
[nrf_cloud]
region = "eu"
[extras]
colour = "blue"
[simulation]
location_interval_seconds = 30
)");
    EXPECT_EQ(config.locationIntervalSeconds, 30);
}

TEST(TomlConfigTest, MalformedValuesNameTheKey) {
    try {
        TomlConfig::parse("[simulation]\nlocation_interval_seconds = 5min\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("simulation.location_interval_seconds"), std::string::npos);
    }

    EXPECT_THROW(TomlConfig::parse("[simulation]\ncounter_enable = yes\n"), ConfigError);
    EXPECT_THROW(TomlConfig::parse("[simulation]\ntemperature_base = warm\n"), ConfigError);
    EXPECT_THROW(TomlConfig::parse("[simulation\n"), ConfigError);
    EXPECT_THROW(TomlConfig::parse("[simulation]\njust a line\n"), ConfigError);
}

TEST(TomlConfigTest, EnvironmentOverridesFile) {
    SimulatorConfig config = TomlConfig::parse("[nrf_cloud]\napi_key = \"from-file\"\ndevice_id = \"file-dev\"\n");
    TomlConfig::applyEnvironment(config, envFrom({{"NRF_CLOUD_API_KEY", "from-env"}}));

    EXPECT_EQ(config.apiKey, "from-env");
    EXPECT_EQ(config.deviceId, "file-dev");

    TomlConfig::applyEnvironment(config, envFrom({{"NRF_DEVICE_ID", "env-dev"}}));
    EXPECT_EQ(config.apiKey, "from-env");
    EXPECT_EQ(config.deviceId, "env-dev");
}

TEST(TomlConfigTest, MissingFileFallsBackToEnvironment) {
    testsupport::TempDir dir;
    SimulatorConfig config = TomlConfig::loadFromFile((dir.path() / "absent.toml").string(),
                                                      envFrom({{"NRF_CLOUD_API_KEY", "env-key"}}));
    EXPECT_EQ(config.apiKey, "env-key");
    EXPECT_EQ(config.locationIntervalSeconds, 300);
    EXPECT_NO_THROW(TomlConfig::validate(config));
}

TEST(TomlConfigTest, LoadsFromFile) {
    testsupport::TempDir dir;
    auto path = dir.path() / "simulator.toml";
    std::ofstream(path) << "[nrf_cloud]\napi_key = \"file-key\"\n[simulation]\ncounter_enable = true\n";

    SimulatorConfig config = TomlConfig::loadFromFile(path.string(), envFrom({}));
    EXPECT_EQ(config.apiKey, "file-key");
    EXPECT_TRUE(config.counterEnable);
}

TEST(TomlConfigTest, ValidateRejectsUnusableConfig) {
    EXPECT_NO_THROW(TomlConfig::validate(validConfig()));

    EXPECT_THROW(TomlConfig::validate(SimulatorConfig{}), ConfigError);

    auto config = validConfig();
    config.apiHost = "http://api.nrfcloud.com";
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);

    config = validConfig();
    config.locationIntervalSeconds = 0;
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);

    config = validConfig();
    config.temperatureIntervalSeconds = -5;
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);

    config = validConfig();
    config.maxJitterMeters = 0.5;
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);

    config = validConfig();
    config.deviceId.clear();
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);

    config = validConfig();
    config.observationSeconds = 0;
    EXPECT_THROW(TomlConfig::validate(config), ConfigError);
}
