/**
 * @file DeviceProvisioner.hpp
 * @brief Startup bootstrap: credentials, registration and routing for one device
 *
 * Composes CertificateStore, CloudDirectory and ConnectionInfoCache into a
 * ready DeviceSessionContext.
 *
 * Provisioning workflow:
 * 1. Load the cached bundle, or generate and persist a new one
 * 2. Load cached routing for the device id
 * 3. Register (certificate upload + routing lookup) when there is no routing
 *    or the certificate was just generated
 * 4. Persist the routing so the next run skips registration
 *
 * Registration is retried with the policy engine's registration policy.
 * Authentication failures (401/403) are not retried: a bad API key will not
 * get better.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "CertificateStore.hpp"
#include "CloudDirectory.hpp"
#include "DeviceSessionContext.hpp"
#include "ports/IRetryPolicy.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace nrfsim {

class DeviceProvisioner {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    DeviceProvisioner(std::shared_ptr<CertificateStore> certificates,
                      std::shared_ptr<CloudDirectory> directory,
                      std::shared_ptr<ConnectionInfoCache> cache,
                      std::shared_ptr<ports::IPolicyEngine> policies);

    /// Replace the backoff sleep (tests)
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * @brief Full bootstrap for normal mode
     * @throws ProvisioningError on credential failures
     * @throws DirectoryError once registration retries are spent
     */
    std::shared_ptr<DeviceSessionContext> provision(const DeviceIdentity& identity);

    /**
     * @brief Bootstrap for diagnostics: existing credentials only, nothing generated
     *
     * Cached routing is loaded when present; otherwise the session resolves
     * it through lookupRouting() at connect time.
     *
     * @throws ProvisioningError if the device has no persisted credentials
     */
    std::shared_ptr<DeviceSessionContext> attachExisting(const DeviceIdentity& identity);

    /**
     * @brief Upload the certificate and resolve routing, with retries
     * @throws DirectoryError from the last attempt
     */
    ConnectionInfo registerWithRetry(const std::string& deviceId, const std::string& certificatePem);

    /// Read-only routing resolution (no certificate upload)
    ConnectionInfo lookupRouting(const std::string& deviceId);

private:
    std::shared_ptr<CertificateStore> certificates_;
    std::shared_ptr<CloudDirectory> directory_;
    std::shared_ptr<ConnectionInfoCache> cache_;
    std::shared_ptr<ports::IPolicyEngine> policies_;
    Sleeper sleeper_;
};

} // namespace nrfsim
