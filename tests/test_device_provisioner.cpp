#include <gtest/gtest.h>
#include "../core/DeviceProvisioner.hpp"
#include "../core/Errors.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/FakeHttpClient.hpp"
#include "../crypto/OpenSslCredentialGenerator.hpp"
#include "TestSupport.hpp"
#include <filesystem>
#include <memory>

using namespace nrfsim;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {
const std::string kAccountUrl = "https://api.test/v1/account";
const std::string kDevicesUrl = "https://api.test/v1/devices";
const std::string kDeviceUrl = "https://api.test/v1/devices/dev-1";
const std::string kAccountBody = R"({"mqttEndpoint":"mqtt.test.example","mqttTopicPrefix":"prod/tenant/"})";
}

class DeviceProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<sim::FakeHttpClient>();
        http_->respond("GET", CertificateStore::kRootCaUrl, 200,
                       OpenSslCredentialGenerator().generate("Test Root CA").certificatePem);
        sleeper_ = std::make_shared<testsupport::RecordingSleeper>();

        certificates_ = std::make_shared<CertificateStore>(
            dir_.path(), std::make_shared<OpenSslCredentialGenerator>(), http_);
        cache_ = std::make_shared<ConnectionInfoCache>(dir_.path());
        provisioner_ = std::make_shared<DeviceProvisioner>(
            certificates_, std::make_shared<CloudDirectory>("https://api.test", "test-key", http_),
            cache_, std::make_shared<adapters::DefaultPolicyEngine>());
        auto sleeper = sleeper_;
        provisioner_->setSleeper([sleeper](std::chrono::milliseconds delay) { (*sleeper)(delay); });
    }

    void cloudAccepts() {
        http_->respond("GET", kAccountUrl, 200, kAccountBody);
        http_->respond("POST", kDevicesUrl, 201);
        http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1"})");
    }

    DeviceIdentity identity_{"dev-1", "test-key"};
    testsupport::TempDir dir_;
    std::shared_ptr<sim::FakeHttpClient> http_;
    std::shared_ptr<testsupport::RecordingSleeper> sleeper_;
    std::shared_ptr<CertificateStore> certificates_;
    std::shared_ptr<ConnectionInfoCache> cache_;
    std::shared_ptr<DeviceProvisioner> provisioner_;
};

TEST_F(DeviceProvisionerTest, FirstRunGeneratesRegistersAndCaches) {
    cloudAccepts();
    auto context = provisioner_->provision(identity_);

    ASSERT_TRUE(context->connectionInfo().has_value());
    EXPECT_EQ(context->connectionInfo()->brokerHost, "mqtt.test.example");
    EXPECT_EQ(context->connectionInfo()->telemetryTopic, "prod/tenant/m/d/dev-1/d2c");
    EXPECT_EQ(context->connectionInfo()->stage, "prod");
    EXPECT_FALSE(context->bundle().certificatePem.empty());

    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 1);
    EXPECT_TRUE(fs::exists(cache_->pathFor("dev-1")));
}

TEST_F(DeviceProvisionerTest, SecondRunUsesCacheWithoutRegistering) {
    cloudAccepts();
    auto first = provisioner_->provision(identity_);
    auto second = provisioner_->provision(identity_);

    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 1);
    EXPECT_EQ(first->bundle().certificatePem, second->bundle().certificatePem);
    ASSERT_TRUE(second->connectionInfo().has_value());
    EXPECT_EQ(second->connectionInfo()->controlTopic, "prod/tenant/m/d/dev-1/+/r");
}

TEST_F(DeviceProvisionerTest, TransientRegistrationFailureIsRetried) {
    http_->respond("GET", kAccountUrl, 200, kAccountBody);
    http_->respond("POST", kDevicesUrl, 500, R"({"message":"try later"})");
    http_->respond("POST", kDevicesUrl, 201);
    http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1"})");

    auto context = provisioner_->provision(identity_);

    EXPECT_TRUE(context->connectionInfo().has_value());
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 2);
    auto delays = sleeper_->delays();
    ASSERT_EQ(delays.size(), 1u);
    EXPECT_EQ(delays[0], 1000ms);
}

TEST_F(DeviceProvisionerTest, RegistrationGivesUpAfterThreeAttempts) {
    http_->respond("GET", kAccountUrl, 200, kAccountBody);
    http_->respond("POST", kDevicesUrl, 503);

    EXPECT_THROW(provisioner_->provision(identity_), DirectoryError);
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 3);
    EXPECT_FALSE(fs::exists(cache_->pathFor("dev-1")));
}

TEST_F(DeviceProvisionerTest, BadApiKeyIsNotRetried) {
    http_->respond("GET", kAccountUrl, 401, R"({"message":"Unauthorized"})");

    try {
        provisioner_->provision(identity_);
        FAIL() << "expected DirectoryError";
    } catch (const DirectoryError& e) {
        EXPECT_EQ(e.statusCode(), 401);
    }
    EXPECT_EQ(http_->requestCount("GET", kAccountUrl), 1);
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 0);
    EXPECT_TRUE(sleeper_->delays().empty());
}

TEST_F(DeviceProvisionerTest, NewCredentialsInvalidateStaleRouting) {
    ConnectionInfo stale = testsupport::testRouting();
    stale.brokerHost = "mqtt.stale.example";
    cache_->save("dev-1", stale);
    cloudAccepts();

    auto context = provisioner_->provision(identity_);

    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 1);
    ASSERT_TRUE(context->connectionInfo().has_value());
    EXPECT_EQ(context->connectionInfo()->brokerHost, "mqtt.test.example");
}

TEST_F(DeviceProvisionerTest, AttachExistingNeedsPersistedCredentials) {
    EXPECT_THROW(provisioner_->attachExisting(identity_), ProvisioningError);
    EXPECT_EQ(http_->requestCount("GET", CertificateStore::kRootCaUrl), 0);
}

TEST_F(DeviceProvisionerTest, AttachExistingDoesNotRegister) {
    certificates_->createAndPersist("dev-1");

    auto context = provisioner_->attachExisting(identity_);

    EXPECT_FALSE(context->connectionInfo().has_value());
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 0);
}

TEST_F(DeviceProvisionerTest, LookupRoutingIsReadOnly) {
    http_->respond("GET", kAccountUrl, 200, kAccountBody);
    http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1"})");

    ConnectionInfo info = provisioner_->lookupRouting("dev-1");

    EXPECT_TRUE(info.isComplete());
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 0);
}
