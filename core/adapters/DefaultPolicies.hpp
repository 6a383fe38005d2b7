#pragma once

#include "../ports/IRetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace nrfsim::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::seconds(60),
                                int maxAttempts = 10)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        if (attemptCount < 1) {
            attemptCount = 1;
        }
        double scaled = static_cast<double>(baseDelay_.count()) * std::pow(multiplier_, attemptCount - 1);
        if (scaled >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(scaled));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

    int maxAttempts() const override {
        return maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine()
        : reconnectPolicy_()
        , registrationPolicy_(std::chrono::milliseconds(1000), 2.0, std::chrono::seconds(60), 3) {}

    DefaultPolicyEngine(ExponentialBackoffRetryPolicy reconnect,
                        ExponentialBackoffRetryPolicy registration,
                        int publishFailureThreshold)
        : reconnectPolicy_(reconnect)
        , registrationPolicy_(registration)
        , publishFailureThreshold_(publishFailureThreshold) {}

    const ports::RetryPolicy& getReconnectPolicy() const override {
        return reconnectPolicy_;
    }

    const ports::RetryPolicy& getRegistrationPolicy() const override {
        return registrationPolicy_;
    }

    int publishFailureThreshold() const override {
        return publishFailureThreshold_;
    }

private:
    ExponentialBackoffRetryPolicy reconnectPolicy_;
    ExponentialBackoffRetryPolicy registrationPolicy_;
    int publishFailureThreshold_ = 3;
};

} // namespace nrfsim::adapters
