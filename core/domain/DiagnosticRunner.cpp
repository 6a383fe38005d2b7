#include "DiagnosticRunner.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace nrfsim::domain {

const char* diagnosticStepToString(DiagnosticStep step) {
    switch (step) {
        case DiagnosticStep::DeviceStatus: return "device status";
        case DiagnosticStep::TransportCheck: return "transport";
        case DiagnosticStep::ControlSubscribe: return "control subscribe";
        default: return "unknown";
    }
}

bool DiagnosticReport::attempted(DiagnosticStep step) const {
    return std::any_of(steps.begin(), steps.end(),
                       [step](const StepResult& result) { return result.step == step; });
}

DiagnosticRunner::DiagnosticRunner(std::shared_ptr<CloudDirectory> directory,
                                   std::shared_ptr<SessionManager> session,
                                   std::string deviceId,
                                   DiagnosticSettings settings)
    : directory_(std::move(directory))
    , session_(std::move(session))
    , deviceId_(std::move(deviceId))
    , settings_(settings)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
}

DiagnosticReport DiagnosticRunner::run() {
    std::cout << "[DIAG] Running connection diagnostics for " << deviceId_ << std::endl;

    const std::vector<std::pair<DiagnosticStep, std::string (DiagnosticRunner::*)()>> steps = {
        {DiagnosticStep::DeviceStatus, &DiagnosticRunner::checkDeviceStatus},
        {DiagnosticStep::TransportCheck, &DiagnosticRunner::checkTransport},
        {DiagnosticStep::ControlSubscribe, &DiagnosticRunner::checkControlSubscribe},
    };

    DiagnosticReport report;
    int number = 1;
    for (const auto& entry : steps) {
        std::cout << std::endl << "[DIAG] Step " << number++ << ": "
                  << diagnosticStepToString(entry.first) << std::endl;

        StepResult result;
        result.step = entry.first;
        try {
            result.detail = (this->*entry.second)();
            result.passed = true;
            std::cout << "[DIAG] PASS: " << result.detail << std::endl;
        } catch (const DiagnosticStepError& e) {
            result.detail = e.what();
            std::cout << "[DIAG] FAIL: " << result.detail << std::endl;
            report.steps.push_back(result);
            report.rootCause = entry.first;
            report.rootCauseMessage = result.detail;
            break;
        }
        report.steps.push_back(result);
    }

    if (session_->isConnected()) {
        session_->disconnect();
    }

    std::cout << std::endl;
    if (report.passed()) {
        std::cout << "[DIAG] All " << report.steps.size() << " steps passed" << std::endl;
    } else {
        std::cout << "[DIAG] Root cause: " << diagnosticStepToString(*report.rootCause)
                  << " - " << report.rootCauseMessage << std::endl;
    }
    std::cout << "[DIAG] Diagnostics complete." << std::endl;
    return report;
}

std::string DiagnosticRunner::checkDeviceStatus() {
    const std::string step = diagnosticStepToString(DiagnosticStep::DeviceStatus);
    DeviceStatus status;
    try {
        status = directory_->fetchStatus(deviceId_);
    } catch (const DirectoryError& e) {
        if (e.statusCode() == 404) {
            throw DiagnosticStepError(step, "Device " + deviceId_ +
                                      " not found on nRF Cloud; it may need to be re-provisioned");
        }
        if (e.statusCode() == 0) {
            throw DiagnosticStepError(step, std::string("REST API unreachable: ") + e.what());
        }
        throw DiagnosticStepError(step, "API error: HTTP " + std::to_string(e.statusCode()));
    }

    std::cout << "[DIAG]   State: " << (status.stateJson.empty() ? "{}" : status.stateJson) << std::endl;
    std::cout << "[DIAG]   Firmware: " << (status.firmwareJson.empty() ? "{}" : status.firmwareJson) << std::endl;
    std::cout << "[DIAG]   Tags: [";
    for (std::size_t i = 0; i < status.tags.size(); ++i) {
        std::cout << (i ? ", " : "") << status.tags[i];
    }
    std::cout << "]" << std::endl;
    std::cout << "[DIAG]   Full response: " << status.rawBody.substr(0, 500) << std::endl;

    return "Device " + status.deviceId + " found on nRF Cloud";
}

std::string DiagnosticRunner::checkTransport() {
    const std::string step = diagnosticStepToString(DiagnosticStep::TransportCheck);
    try {
        session_->connect();
    } catch (const ConnectionError& e) {
        throw DiagnosticStepError(step, std::string("Connection failed: ") + e.what());
    }

    observe(settings_.observationWindow, step,
            "Connection dropped WITHOUT any subscribe/publish; suggests a certificate or IoT policy issue");

    return "Connection stable for " + std::to_string(settings_.observationWindow.count()) +
           "s without subscribing";
}

std::string DiagnosticRunner::checkControlSubscribe() {
    const std::string step = diagnosticStepToString(DiagnosticStep::ControlSubscribe);
    try {
        session_->subscribeControlTopic();
    } catch (const ConnectionError& e) {
        throw DiagnosticStepError(step, std::string("Subscribe failed: ") + e.what() +
                                  "; the issue is likely topic permissions");
    }

    observe(settings_.postSubscribeWindow, step,
            "Connection dropped after subscribing; the issue is likely topic permissions");

    return "Subscribed to the c2d topic and still connected";
}

void DiagnosticRunner::observe(std::chrono::milliseconds window, const std::string& step,
                               const std::string& dropHint) {
    auto interval = std::max(settings_.pollInterval, std::chrono::milliseconds(1));
    auto elapsed = std::chrono::milliseconds(0);

    while (elapsed < window) {
        sleeper_(interval);
        elapsed += interval;

        bool connected = session_->isConnected();
        std::cout << "[DIAG] " << std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                  << "s - Connection: " << (connected ? "OK" : "DISCONNECTED") << std::endl;

        if (!connected) {
            throw DiagnosticStepError(step, dropHint + " (" +
                                      disconnectCauseToString(session_->lastDisconnectCause()) + ": " +
                                      session_->lastDisconnectReason() + ")");
        }
    }
}

} // namespace nrfsim::domain
