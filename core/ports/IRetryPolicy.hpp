#pragma once

#include <chrono>

namespace nrfsim::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;

    // Delay before the given 1-based attempt
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
    virtual int maxAttempts() const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    // Broker reconnect after an unexpected disconnect
    virtual const RetryPolicy& getReconnectPolicy() const = 0;

    // REST registration at the provisioning call site
    virtual const RetryPolicy& getRegistrationPolicy() const = 0;

    // Consecutive publish failures tolerated before a reconnect is forced
    virtual int publishFailureThreshold() const = 0;
};

} // namespace nrfsim::ports
