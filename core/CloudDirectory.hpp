/**
 * @file CloudDirectory.hpp
 * @brief nRF Cloud device-management REST client
 *
 * Every call is a single synchronous request with a bounded timeout. A
 * timeout or a non-2xx status raises DirectoryError; retrying is the
 * caller's decision.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "DeviceSessionContext.hpp"
#include "IHttpClient.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace nrfsim {

/// Account-level broker routing from GET /v1/account
struct AccountInfo {
    std::string mqttEndpoint;
    std::string mqttTopicPrefix;
};

class CloudDirectory {
public:
    static constexpr std::uint16_t kBrokerPort = 8883;

    CloudDirectory(std::string apiHost,
                   std::string apiKey,
                   std::shared_ptr<IHttpClient> http,
                   std::chrono::milliseconds timeout = std::chrono::seconds(30));

    /**
     * @brief Upload the certificate and resolve the device's broker routing
     *
     * Idempotent: a device that already exists (HTTP 409) is treated as a
     * re-registration. Only the certificate is sent.
     *
     * @throws DirectoryError on timeout, non-2xx, or an unusable response body
     */
    ConnectionInfo registerDevice(const std::string& deviceId, const std::string& certificatePem);

    /// @throws DirectoryError on timeout, non-2xx (404 when the device is unknown)
    DeviceStatus fetchStatus(const std::string& deviceId);

    AccountInfo fetchAccount();

    /// Topics from the device shadow, falling back to the account prefix
    ConnectionInfo resolveRouting(const std::string& deviceId, const AccountInfo& account);

    static std::string stageFromPrefix(const std::string& topicPrefix);

private:
    HttpResponse execute(HttpRequest request, const std::string& label);
    std::string url(const std::string& path) const;

    std::string apiHost_;
    std::string apiKey_;
    std::shared_ptr<IHttpClient> http_;
    std::chrono::milliseconds timeout_;
};

} // namespace nrfsim
