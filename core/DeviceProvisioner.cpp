#include "DeviceProvisioner.hpp"
#include "Errors.hpp"
#include <iostream>
#include <thread>

namespace nrfsim {

DeviceProvisioner::DeviceProvisioner(std::shared_ptr<CertificateStore> certificates,
                                     std::shared_ptr<CloudDirectory> directory,
                                     std::shared_ptr<ConnectionInfoCache> cache,
                                     std::shared_ptr<ports::IPolicyEngine> policies)
    : certificates_(std::move(certificates))
    , directory_(std::move(directory))
    , cache_(std::move(cache))
    , policies_(std::move(policies))
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
}

std::shared_ptr<DeviceSessionContext> DeviceProvisioner::provision(const DeviceIdentity& identity) {
    bool generated = false;
    auto bundle = certificates_->loadOrNone(identity.deviceId);
    if (bundle) {
        std::cout << "[Certs] Using existing credentials for " << identity.deviceId << std::endl;
    } else {
        std::cout << "[Certs] No credentials for " << identity.deviceId << ", generating" << std::endl;
        bundle = certificates_->createAndPersist(identity.deviceId);
        generated = true;
    }

    auto context = std::make_shared<DeviceSessionContext>(identity, *bundle, cache_);

    if (generated) {
        // Routing cached for an older certificate is no longer valid
        context->invalidateConnectionInfo();
    } else if (context->loadConnectionInfo()) {
        std::cout << "[API] Using cached connection info for " << identity.deviceId << std::endl;
        return context;
    }

    ConnectionInfo info = registerWithRetry(identity.deviceId, bundle->certificatePem);
    context->saveConnectionInfo(info);
    return context;
}

std::shared_ptr<DeviceSessionContext> DeviceProvisioner::attachExisting(const DeviceIdentity& identity) {
    auto bundle = certificates_->loadOrNone(identity.deviceId);
    if (!bundle) {
        throw ProvisioningError("No credentials found for " + identity.deviceId +
                                ". Run without --diag first to provision.");
    }

    auto context = std::make_shared<DeviceSessionContext>(identity, *bundle, cache_);
    if (!context->loadConnectionInfo()) {
        std::cout << "[API] No cached connection info, routing will be looked up at connect" << std::endl;
    }
    return context;
}

ConnectionInfo DeviceProvisioner::registerWithRetry(const std::string& deviceId,
                                                    const std::string& certificatePem) {
    const ports::RetryPolicy& policy = policies_->getRegistrationPolicy();

    for (int attempt = 1; ; ++attempt) {
        try {
            std::cout << "[API] Registering " << deviceId << " (attempt " << attempt << "/"
                      << policy.maxAttempts() << ")" << std::endl;
            return directory_->registerDevice(deviceId, certificatePem);
        } catch (const DirectoryError& e) {
            std::cerr << "[API] Registration failed: " << e.what() << std::endl;

            bool authFailure = e.statusCode() == 401 || e.statusCode() == 403;
            if (authFailure || !policy.shouldRetry(attempt)) {
                throw;
            }

            auto delay = policy.getBackoffDelay(attempt);
            std::cout << "[API] Retrying registration in " << delay.count() << " ms" << std::endl;
            sleeper_(delay);
        }
    }
}

ConnectionInfo DeviceProvisioner::lookupRouting(const std::string& deviceId) {
    return directory_->resolveRouting(deviceId, directory_->fetchAccount());
}

} // namespace nrfsim
