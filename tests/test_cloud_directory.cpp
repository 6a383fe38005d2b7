#include <gtest/gtest.h>
#include "../core/CloudDirectory.hpp"
#include "../core/Errors.hpp"
#include "../core/sim/FakeHttpClient.hpp"
#include <algorithm>
#include <memory>

using namespace nrfsim;

namespace {

const std::string kAccountUrl = "https://api.test/v1/account";
const std::string kDevicesUrl = "https://api.test/v1/devices";
const std::string kDeviceUrl = "https://api.test/v1/devices/dev-1";
const std::string kCertPem = "-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n";

} // namespace

class CloudDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<sim::FakeHttpClient>();
        directory_ = std::make_unique<CloudDirectory>("https://api.test/", "test-key", http_);
        http_->respond("GET", kAccountUrl, 200,
                       R"({"mqttEndpoint":"mqtt.test.example","mqttTopicPrefix":"prod/tenant/"})");
    }

    HttpRequest lastRequest(const std::string& method, const std::string& url) const {
        auto requests = http_->requests();
        auto it = std::find_if(requests.rbegin(), requests.rend(), [&](const HttpRequest& r) {
            return r.method == method && r.url == url;
        });
        return it == requests.rend() ? HttpRequest{} : *it;
    }

    std::shared_ptr<sim::FakeHttpClient> http_;
    std::unique_ptr<CloudDirectory> directory_;
};

TEST_F(CloudDirectoryTest, RegistrationUsesShadowTopics) {
    http_->respond("POST", kDevicesUrl, 202);
    http_->respond("GET", kDeviceUrl, 200,
                   R"({"id":"dev-1","state":{"desired":{"pairing":{"topics":{)"
                   R"("d2c":"prod/tenant/m/d/dev-1/d2c","c2d":"prod/tenant/m/d/dev-1/+/r"}}}}})");

    ConnectionInfo info = directory_->registerDevice("dev-1", kCertPem);

    EXPECT_EQ(info.brokerHost, "mqtt.test.example");
    EXPECT_EQ(info.brokerPort, 8883);
    EXPECT_EQ(info.topicPrefix, "prod/tenant/");
    EXPECT_EQ(info.stage, "prod");
    EXPECT_EQ(info.telemetryTopic, "prod/tenant/m/d/dev-1/d2c");
    EXPECT_EQ(info.controlTopic, "prod/tenant/m/d/dev-1/+/r");
    EXPECT_TRUE(info.isComplete());
}

TEST_F(CloudDirectoryTest, RegistrationUploadsOnlyTheCertificate) {
    http_->respond("POST", kDevicesUrl, 202);
    http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1"})");

    directory_->registerDevice("dev-1", kCertPem);

    HttpRequest upload = lastRequest("POST", kDevicesUrl);
    EXPECT_EQ(upload.body,
              "dev-1,,simulator,,\"-----BEGIN CERTIFICATE-----\nMIIB\n-----END CERTIFICATE-----\n\"");
    EXPECT_EQ(upload.headers["Authorization"], "Bearer test-key");
    EXPECT_EQ(upload.headers["Content-Type"], "application/octet-stream");
    EXPECT_EQ(upload.body.find("PRIVATE KEY"), std::string::npos);
}

TEST_F(CloudDirectoryTest, ExistingDeviceCountsAsRegistered) {
    http_->respond("POST", kDevicesUrl, 409, R"({"message":"exists"})");
    http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1"})");

    ConnectionInfo info;
    ASSERT_NO_THROW(info = directory_->registerDevice("dev-1", kCertPem));
    EXPECT_TRUE(info.isComplete());
}

TEST_F(CloudDirectoryTest, MissingShadowTopicsFallBackToPrefix) {
    http_->respond("POST", kDevicesUrl, 202);
    http_->respond("GET", kDeviceUrl, 200, R"({"id":"dev-1","state":{"desired":{}}})");

    ConnectionInfo info = directory_->registerDevice("dev-1", kCertPem);

    EXPECT_EQ(info.telemetryTopic, "prod/tenant/m/d/dev-1/d2c");
    EXPECT_EQ(info.controlTopic, "prod/tenant/m/d/dev-1/+/r");
}

TEST_F(CloudDirectoryTest, ServerErrorCarriesStatus) {
    http_->respond("POST", kDevicesUrl, 500, "boom");

    try {
        directory_->registerDevice("dev-1", kCertPem);
        FAIL() << "expected DirectoryError";
    } catch (const DirectoryError& e) {
        EXPECT_EQ(e.statusCode(), 500);
        EXPECT_EQ(e.body(), "boom");
        EXPECT_EQ(e.stage(), "directory");
    }
}

TEST_F(CloudDirectoryTest, BadApiKeyFailsAtAccountLookup) {
    http_->respond("GET", kAccountUrl, 401, R"({"message":"Unauthorized"})");

    try {
        directory_->registerDevice("dev-1", kCertPem);
        FAIL() << "expected DirectoryError";
    } catch (const DirectoryError& e) {
        EXPECT_EQ(e.statusCode(), 401);
    }
    EXPECT_EQ(http_->requestCount("POST", kDevicesUrl), 0);
}

TEST_F(CloudDirectoryTest, FetchStatusParsesDeviceRecord) {
    http_->respond("GET", kDeviceUrl, 200,
                   R"({"id":"dev-1","state":{"reported":{}},"firmware":{"app":"0.0.1"},"tags":["simulator"]})");

    DeviceStatus status = directory_->fetchStatus("dev-1");
    EXPECT_EQ(status.deviceId, "dev-1");
    EXPECT_EQ(status.firmwareJson, R"({"app":"0.0.1"})");
    ASSERT_EQ(status.tags.size(), 1u);
    EXPECT_EQ(status.tags[0], "simulator");
    EXPECT_FALSE(status.rawBody.empty());
}

TEST_F(CloudDirectoryTest, FetchStatusReportsUnknownDevice) {
    http_->respond("GET", kDeviceUrl, 404, R"({"message":"Not found"})");

    try {
        directory_->fetchStatus("dev-1");
        FAIL() << "expected DirectoryError";
    } catch (const DirectoryError& e) {
        EXPECT_EQ(e.statusCode(), 404);
    }
}

TEST_F(CloudDirectoryTest, DeviceIdIsEscapedInRequestPath) {
    const std::string escapedUrl = "https://api.test/v1/devices/kid%20sim%2F01%3Fx~a.b_c-d";
    http_->respond("GET", escapedUrl, 200, R"({"id":"kid sim/01?x~a.b_c-d"})");

    DeviceStatus status = directory_->fetchStatus("kid sim/01?x~a.b_c-d");

    EXPECT_EQ(status.deviceId, "kid sim/01?x~a.b_c-d");
    EXPECT_EQ(http_->requestCount("GET", escapedUrl), 1);
    EXPECT_EQ(http_->requestCount("GET", "https://api.test/v1/devices/kid sim/01?x~a.b_c-d"), 0);
}

TEST_F(CloudDirectoryTest, TimeoutIsStatusZero) {
    http_->failWith("GET", kDeviceUrl, "timed out");

    try {
        directory_->fetchStatus("dev-1");
        FAIL() << "expected DirectoryError";
    } catch (const DirectoryError& e) {
        EXPECT_EQ(e.statusCode(), 0);
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
}

TEST_F(CloudDirectoryTest, InvalidJsonIsDirectoryError) {
    http_->respond("GET", kAccountUrl, 200, "<html>");
    EXPECT_THROW(directory_->fetchAccount(), DirectoryError);
}

TEST(CloudDirectoryStage, FirstPrefixSegment) {
    EXPECT_EQ(CloudDirectory::stageFromPrefix("prod/tenant/"), "prod");
    EXPECT_EQ(CloudDirectory::stageFromPrefix("beta"), "beta");
    EXPECT_EQ(CloudDirectory::stageFromPrefix(""), "");
}
