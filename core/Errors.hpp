/**
 * @file Errors.hpp
 * @brief Exception taxonomy for provisioning, directory, transport and diagnostics
 *
 * Every failure surfaced by the domain core derives from SimulatorError so the
 * CLI can report the failing stage with a single catch site. Adapters below the
 * domain (Paho, HTTP) keep reporting failures through bool returns and
 * callbacks; the domain translates them into these types.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <stdexcept>
#include <string>

namespace nrfsim {

/**
 * @brief Base for all simulator errors
 *
 * Carries a stage label ("provisioning", "directory", ...) used by the CLI to
 * tell the operator which phase failed.
 */
class SimulatorError : public std::runtime_error {
public:
    SimulatorError(const std::string& stage, const std::string& message)
        : std::runtime_error(message), stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

/// Credential generation, cache corruption or trust-anchor fetch failure (fatal)
class ProvisioningError : public SimulatorError {
public:
    explicit ProvisioningError(const std::string& message)
        : SimulatorError("provisioning", message) {}
};

/// REST failure: timeout (statusCode 0) or non-2xx response
class DirectoryError : public SimulatorError {
public:
    DirectoryError(int statusCode, const std::string& body, const std::string& message)
        : SimulatorError("directory", message), statusCode_(statusCode), body_(body) {}

    int statusCode() const { return statusCode_; }
    const std::string& body() const { return body_; }

private:
    int statusCode_;
    std::string body_;
};

/// Transport failure after the bounded reconnect budget is spent
class ConnectionError : public SimulatorError {
public:
    explicit ConnectionError(const std::string& message)
        : SimulatorError("connection", message) {}
};

/// Publish attempted outside Connected, or rejected by the transport (transient)
class PublishError : public SimulatorError {
public:
    explicit PublishError(const std::string& message)
        : SimulatorError("publish", message) {}
};

/// A diagnostic step failed; expected outcome, not a process-level failure
class DiagnosticStepError : public SimulatorError {
public:
    DiagnosticStepError(const std::string& step, const std::string& message)
        : SimulatorError("diagnostics", message), step_(step) {}

    const std::string& step() const { return step_; }

private:
    std::string step_;
};

/// Missing or invalid configuration value
class ConfigError : public SimulatorError {
public:
    explicit ConfigError(const std::string& message)
        : SimulatorError("configuration", message) {}
};

} // namespace nrfsim
