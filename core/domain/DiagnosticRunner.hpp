#pragma once

#include "../CloudDirectory.hpp"
#include "../Errors.hpp"
#include "../SessionManager.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nrfsim::domain {

enum class DiagnosticStep {
    DeviceStatus,       ///< REST reachability and device existence
    TransportCheck,     ///< TLS connect, held open without subscribing
    ControlSubscribe    ///< Authorization to receive c2d commands
};

const char* diagnosticStepToString(DiagnosticStep step);

struct DiagnosticSettings {
    std::chrono::seconds observationWindow{10};
    std::chrono::seconds postSubscribeWindow{3};
    std::chrono::milliseconds pollInterval{1000};
};

struct StepResult {
    DiagnosticStep step = DiagnosticStep::DeviceStatus;
    bool passed = false;
    std::string detail;
};

struct DiagnosticReport {
    std::vector<StepResult> steps;          ///< Attempted steps only, in order
    std::optional<DiagnosticStep> rootCause;
    std::string rootCauseMessage;

    bool passed() const { return !rootCause.has_value(); }
    bool attempted(DiagnosticStep step) const;
};

/**
 * Ordered connectivity checks: device status, transport, control subscribe.
 * Each step runs only if the previous one passed; the first failure becomes
 * the report's root cause and the remaining steps are skipped.
 *
 * The session should be built with autoReconnect off so a drop during the
 * observation window surfaces instead of being repaired.
 */
class DiagnosticRunner {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    DiagnosticRunner(std::shared_ptr<CloudDirectory> directory,
                     std::shared_ptr<SessionManager> session,
                     std::string deviceId,
                     DiagnosticSettings settings = {});

    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    DiagnosticReport run();

private:
    // Each step throws DiagnosticStepError on failure
    std::string checkDeviceStatus();
    std::string checkTransport();
    std::string checkControlSubscribe();

    // Poll the session once per interval; throws if it drops
    void observe(std::chrono::milliseconds window, const std::string& step, const std::string& dropHint);

    std::shared_ptr<CloudDirectory> directory_;
    std::shared_ptr<SessionManager> session_;
    std::string deviceId_;
    DiagnosticSettings settings_;
    Sleeper sleeper_;
};

} // namespace nrfsim::domain
