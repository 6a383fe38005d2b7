/**
 * @file DeviceSessionContext.hpp
 * @brief Device identity, credentials and cached broker routing for one session
 *
 * The context is built once at startup (identity from configuration, bundle
 * from CertificateStore, routing from the cache or CloudDirectory) and handed
 * to SessionManager and the runners. All file access for the routing cache
 * goes through ConnectionInfoCache; nothing else reads or writes it.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nrfsim {

/// Immutable for the process lifetime; supplied by configuration
struct DeviceIdentity {
    std::string deviceId;
    std::string apiKey;             ///< Secret, never logged
};

/**
 * @brief PEM credentials plus the on-disk paths Paho needs for TLS
 * @note Only certificatePem ever leaves the process (during registration)
 */
struct CertificateBundle {
    std::string privateKeyPem;
    std::string certificatePem;
    std::string rootCaPem;
    std::string keyPath;
    std::string certPath;
    std::string caPath;
};

/// Broker routing assigned by the cloud directory
struct ConnectionInfo {
    std::string brokerHost;
    std::uint16_t brokerPort = 8883;
    std::string topicPrefix;        ///< e.g. "prod/<tenant>/"
    std::string stage;              ///< First segment of the prefix, e.g. "prod"
    std::string telemetryTopic;     ///< d2c
    std::string controlTopic;       ///< c2d subscription filter

    bool isComplete() const {
        return !brokerHost.empty() && brokerPort != 0 && !telemetryTopic.empty() && !controlTopic.empty();
    }
};

/// Read-only device record from the REST status endpoint
struct DeviceStatus {
    std::string deviceId;
    std::string stateJson;
    std::string firmwareJson;
    std::vector<std::string> tags;
    std::string rawBody;
};

/**
 * @brief Per-device JSON cache of ConnectionInfo
 *
 * A cache file is only trusted when it parses, is complete and its device_id
 * matches the requested identity; anything else is deleted and reported as a
 * miss so the caller re-registers.
 */
class ConnectionInfoCache {
public:
    explicit ConnectionInfoCache(std::filesystem::path directory);

    std::optional<ConnectionInfo> load(const std::string& deviceId) const;

    /**
     * @brief Persist routing for deviceId with owner-only permissions
     * @throws ProvisioningError if the file cannot be written
     */
    void save(const std::string& deviceId, const ConnectionInfo& info) const;

    void invalidate(const std::string& deviceId) const;

    std::filesystem::path pathFor(const std::string& deviceId) const;

private:
    std::filesystem::path directory_;
};

/**
 * @brief Explicit session state shared by SessionManager and the runners
 *
 * Thread-safe: the reconnect worker may invalidate or replace routing while
 * the event loop reads it.
 */
class DeviceSessionContext {
public:
    DeviceSessionContext(DeviceIdentity identity,
                         CertificateBundle bundle,
                         std::shared_ptr<ConnectionInfoCache> cache);

    DeviceSessionContext(const DeviceSessionContext&) = delete;
    DeviceSessionContext& operator=(const DeviceSessionContext&) = delete;

    const DeviceIdentity& identity() const { return identity_; }
    const CertificateBundle& bundle() const { return bundle_; }

    std::optional<ConnectionInfo> connectionInfo() const;

    /// Load routing from the cache; returns false on a miss
    bool loadConnectionInfo();

    /// Adopt freshly registered routing and persist it
    void saveConnectionInfo(const ConnectionInfo& info);

    /// Drop routing in memory and on disk so the next connect re-registers
    void invalidateConnectionInfo();

private:
    DeviceIdentity identity_;
    CertificateBundle bundle_;
    std::shared_ptr<ConnectionInfoCache> cache_;

    mutable std::mutex mutex_;
    std::optional<ConnectionInfo> connectionInfo_;
};

} // namespace nrfsim
