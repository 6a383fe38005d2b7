#include "DeviceSessionContext.hpp"
#include "Errors.hpp"
#include "JsonCodec.hpp"
#include "OwnerOnlyFile.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace nrfsim {

ConnectionInfoCache::ConnectionInfoCache(fs::path directory)
    : directory_(std::move(directory)) {
}

fs::path ConnectionInfoCache::pathFor(const std::string& deviceId) const {
    return directory_ / (deviceId + ".mqtt_info.json");
}

std::optional<ConnectionInfo> ConnectionInfoCache::load(const std::string& deviceId) const {
    fs::path path = pathFor(deviceId);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Certs] Cannot read " << path.string() << ", discarding" << std::endl;
        invalidate(deviceId);
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Certs] Corrupt connection cache " << path.string()
                  << " (" << e.what() << "), discarding" << std::endl;
        file.close();
        invalidate(deviceId);
        return std::nullopt;
    }
    file.close();

    auto owner = json.is_object() ? json.find("device_id") : json.end();
    if (owner == json.end() || !owner->is_string() || owner->get<std::string>() != deviceId) {
        std::cout << "[Certs] Cached connection info belongs to another device, discarding" << std::endl;
        invalidate(deviceId);
        return std::nullopt;
    }

    ConnectionInfo info;
    try {
        info = JsonCodec::jsonToConnectionInfo(json);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Certs] Invalid connection cache field: " << e.what() << std::endl;
        invalidate(deviceId);
        return std::nullopt;
    }

    if (!info.isComplete()) {
        std::cout << "[Certs] Cached connection info incomplete, discarding" << std::endl;
        invalidate(deviceId);
        return std::nullopt;
    }

    return info;
}

void ConnectionInfoCache::save(const std::string& deviceId, const ConnectionInfo& info) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw ProvisioningError("Cannot create " + directory_.string() + ": " + ec.message());
    }

    writeOwnerOnlyFile(pathFor(deviceId), JsonCodec::connectionInfoToJson(deviceId, info).dump(2) + "\n");
}

void ConnectionInfoCache::invalidate(const std::string& deviceId) const {
    std::error_code ec;
    fs::remove(pathFor(deviceId), ec);
    if (ec) {
        std::cerr << "[Certs] Could not remove connection cache: " << ec.message() << std::endl;
    }
}

DeviceSessionContext::DeviceSessionContext(DeviceIdentity identity,
                                           CertificateBundle bundle,
                                           std::shared_ptr<ConnectionInfoCache> cache)
    : identity_(std::move(identity))
    , bundle_(std::move(bundle))
    , cache_(std::move(cache)) {
}

std::optional<ConnectionInfo> DeviceSessionContext::connectionInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectionInfo_;
}

bool DeviceSessionContext::loadConnectionInfo() {
    auto cached = cache_->load(identity_.deviceId);
    std::lock_guard<std::mutex> lock(mutex_);
    connectionInfo_ = cached;
    return connectionInfo_.has_value();
}

void DeviceSessionContext::saveConnectionInfo(const ConnectionInfo& info) {
    cache_->save(identity_.deviceId, info);
    std::lock_guard<std::mutex> lock(mutex_);
    connectionInfo_ = info;
}

void DeviceSessionContext::invalidateConnectionInfo() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connectionInfo_.reset();
    }
    cache_->invalidate(identity_.deviceId);
    std::cout << "[Session] Cached connection info invalidated for "
              << identity_.deviceId << std::endl;
}

} // namespace nrfsim
