#pragma once

#include "../core/DeviceSessionContext.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace nrfsim::testsupport {

// Scratch directory removed with the object
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("nrfsim-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline ConnectionInfo testRouting(const std::string& deviceId = "dev-1") {
    ConnectionInfo info;
    info.brokerHost = "mqtt.test.example";
    info.brokerPort = 8883;
    info.topicPrefix = "prod/tenant/";
    info.stage = "prod";
    info.telemetryTopic = "prod/tenant/m/d/" + deviceId + "/d2c";
    info.controlTopic = "prod/tenant/m/d/" + deviceId + "/+/r";
    return info;
}

inline CertificateBundle testBundle(const std::filesystem::path& dir, const std::string& deviceId = "dev-1") {
    CertificateBundle bundle;
    bundle.privateKeyPem = "key";
    bundle.certificatePem = "cert";
    bundle.rootCaPem = "ca";
    bundle.keyPath = (dir / (deviceId + ".key.pem")).string();
    bundle.certPath = (dir / (deviceId + ".cert.pem")).string();
    bundle.caPath = (dir / "AmazonRootCA1.pem").string();
    return bundle;
}

inline std::shared_ptr<DeviceSessionContext> makeContext(const TempDir& dir, bool withRouting,
                                                         const std::string& deviceId = "dev-1") {
    auto cache = std::make_shared<ConnectionInfoCache>(dir.path());
    auto context = std::make_shared<DeviceSessionContext>(DeviceIdentity{deviceId, "test-key"},
                                                          testBundle(dir.path(), deviceId), cache);
    if (withRouting) {
        context->saveConnectionInfo(testRouting(deviceId));
    }
    return context;
}

// Sleeper that records requested delays instead of sleeping
class RecordingSleeper {
public:
    void operator()(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_.push_back(delay);
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace nrfsim::testsupport
