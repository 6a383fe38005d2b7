#pragma once

#include "../IClock.hpp"
#include "../JsonCodec.hpp"
#include "../RouteInterpolator.hpp"
#include "../SessionManager.hpp"
#include "../Telemetry.hpp"
#include "../TemperatureModel.hpp"
#include "../ports/IRetryPolicy.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace nrfsim::domain {

/**
 * Time-driven telemetry on top of SessionManager.
 *
 * Cadences (all measured on the clock's monotonic time from start()):
 * - GNSS every locationInterval, plus COUNT alongside it when counterEnable is set
 * - TEMP every temperatureInterval
 *
 * Manual sends publish immediately and leave the cadence deadlines alone.
 * A failed publish is logged and counted; after the policy's threshold of
 * consecutive failures the session is pushed onto its reconnect path.
 */
class TelemetryScheduler {
public:
    TelemetryScheduler(std::shared_ptr<SessionManager> session,
                       std::shared_ptr<IClock> clock,
                       std::shared_ptr<RouteInterpolator> route,
                       std::shared_ptr<TemperatureModel> temperature,
                       std::shared_ptr<ports::IPolicyEngine> policies,
                       ShadowConfig shadow,
                       std::chrono::seconds temperatureInterval);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Fire every cadence whose deadline has passed
    void tick();

    // Time until the earliest cadence is due; zero when overdue or stopped
    std::chrono::milliseconds timeUntilNextDue() const;

    bool sendGnss();
    bool sendTemperature();
    bool sendAlert(int type, int value, const std::string& description);
    bool sendCounter();
    bool sendDeviceInfo(const std::string& appVersion);
    bool sendModemResponse(const std::string& response);

    // Apply a cloud CONFIG update; a new location interval restarts that cadence from now
    void applyConfig(const ShadowConfigUpdate& update);

    const ShadowConfig& shadow() const { return shadow_; }
    std::int64_t counter() const { return counter_; }
    int consecutiveFailures() const { return consecutiveFailures_; }
    double routeElapsedSeconds() const;

    // Route position now, without jitter
    PositionSample currentRoutePosition() const;
    const RouteInterpolator& route() const { return *route_; }

private:
    bool publish(const TelemetryMessage& message, const char* tag);
    void fireLocationCadence();
    void fireTemperatureCadence();

    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<RouteInterpolator> route_;
    std::shared_ptr<TemperatureModel> temperature_;
    std::shared_ptr<ports::IPolicyEngine> policies_;

    ShadowConfig shadow_;
    std::chrono::seconds temperatureInterval_;

    bool running_ = false;
    std::chrono::steady_clock::time_point routeStart_;
    std::chrono::steady_clock::time_point nextLocationDue_;
    std::chrono::steady_clock::time_point nextTemperatureDue_;

    std::int64_t counter_ = 0;
    int consecutiveFailures_ = 0;
};

} // namespace nrfsim::domain
