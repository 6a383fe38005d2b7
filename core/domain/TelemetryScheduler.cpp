#include "TelemetryScheduler.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace nrfsim::domain {

namespace {

std::chrono::steady_clock::duration toDuration(std::chrono::seconds seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(seconds);
}

} // namespace

TelemetryScheduler::TelemetryScheduler(std::shared_ptr<SessionManager> session,
                                       std::shared_ptr<IClock> clock,
                                       std::shared_ptr<RouteInterpolator> route,
                                       std::shared_ptr<TemperatureModel> temperature,
                                       std::shared_ptr<ports::IPolicyEngine> policies,
                                       ShadowConfig shadow,
                                       std::chrono::seconds temperatureInterval)
    : session_(std::move(session))
    , clock_(std::move(clock))
    , route_(std::move(route))
    , temperature_(std::move(temperature))
    , policies_(std::move(policies))
    , shadow_(shadow)
    , temperatureInterval_(temperatureInterval) {
    if (shadow_.locationInterval <= 0 || temperatureInterval_.count() <= 0) {
        throw ConfigError("Telemetry intervals must be positive");
    }
    route_->setSegmentSeconds(static_cast<double>(shadow_.locationInterval) * RouteInterpolator::kStepsPerSegment);
}

void TelemetryScheduler::start() {
    auto now = clock_->monotonic();
    routeStart_ = now;
    nextLocationDue_ = now + toDuration(std::chrono::seconds(shadow_.locationInterval));
    nextTemperatureDue_ = now + toDuration(temperatureInterval_);
    consecutiveFailures_ = 0;
    running_ = true;

    std::cout << "[Simulator] Telemetry started: GNSS every " << shadow_.locationInterval
              << "s, TEMP every " << temperatureInterval_.count() << "s" << std::endl;
}

void TelemetryScheduler::stop() {
    if (!running_) return;
    running_ = false;
    std::cout << "[Simulator] Telemetry timers cancelled" << std::endl;
}

void TelemetryScheduler::tick() {
    if (!running_) return;

    auto now = clock_->monotonic();

    if (now >= nextLocationDue_) {
        fireLocationCadence();
        nextLocationDue_ += toDuration(std::chrono::seconds(shadow_.locationInterval));
        if (nextLocationDue_ <= now) {
            nextLocationDue_ = now + toDuration(std::chrono::seconds(shadow_.locationInterval));
        }
    }

    if (now >= nextTemperatureDue_) {
        fireTemperatureCadence();
        nextTemperatureDue_ += toDuration(temperatureInterval_);
        if (nextTemperatureDue_ <= now) {
            nextTemperatureDue_ = now + toDuration(temperatureInterval_);
        }
    }
}

std::chrono::milliseconds TelemetryScheduler::timeUntilNextDue() const {
    if (!running_) {
        return std::chrono::milliseconds(0);
    }
    auto now = clock_->monotonic();
    auto next = std::min(nextLocationDue_, nextTemperatureDue_);
    if (next <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

void TelemetryScheduler::fireLocationCadence() {
    if (!session_->isConnected()) {
        std::cout << "[GNSS] Skipped, session " << sessionStateToString(session_->state()) << std::endl;
        return;
    }
    sendGnss();
    if (shadow_.counterEnable) {
        sendCounter();
    }
}

void TelemetryScheduler::fireTemperatureCadence() {
    if (!session_->isConnected()) {
        std::cout << "[TEMP] Skipped, session " << sessionStateToString(session_->state()) << std::endl;
        return;
    }
    sendTemperature();
}

double TelemetryScheduler::routeElapsedSeconds() const {
    if (!running_) {
        return 0.0;
    }
    return std::chrono::duration<double>(clock_->monotonic() - routeStart_).count();
}

PositionSample TelemetryScheduler::currentRoutePosition() const {
    return route_->basePosition(routeElapsedSeconds());
}

bool TelemetryScheduler::sendGnss() {
    PositionSample sample = route_->sample(routeElapsedSeconds());

    GnssFix fix;
    fix.lat = sample.lat;
    fix.lon = sample.lon;
    fix.acc = sample.accuracyM;

    if (!publish(makeGnss(clock_->epochMillis(), fix), "GNSS")) {
        return false;
    }

    const auto& waypoints = route_->waypoints();
    std::ostringstream line;
    line << std::fixed << std::setprecision(6)
         << "[GNSS] Sent: " << fix.lat << "N " << fix.lon << "E"
         << std::setprecision(1) << " (acc:" << fix.acc << "m) toward "
         << waypoints[sample.segmentIndex + 1].name;
    std::cout << line.str() << std::endl;
    return true;
}

bool TelemetryScheduler::sendTemperature() {
    double celsius = temperature_->sample(clock_->localHourOfDay());
    if (!publish(makeTemperature(clock_->epochMillis(), celsius), "TEMP")) {
        return false;
    }
    std::cout << "[TEMP] Sent: " << celsius << " C" << std::endl;
    return true;
}

bool TelemetryScheduler::sendAlert(int type, int value, const std::string& description) {
    if (!publish(makeAlert(clock_->epochMillis(), type, value, description), "ALERT")) {
        return false;
    }
    std::cout << "[ALERT] Sent: type=" << type << ", desc=" << description << std::endl;
    return true;
}

bool TelemetryScheduler::sendCounter() {
    std::int64_t value = counter_;
    if (!publish(makeCounter(clock_->epochMillis(), value), "COUNT")) {
        return false;
    }
    ++counter_;
    std::cout << "[COUNT] Sent: " << value << std::endl;
    return true;
}

bool TelemetryScheduler::sendDeviceInfo(const std::string& appVersion) {
    if (!publish(makeDeviceInfo(clock_->epochMillis(), appVersion, shadow_), "Device")) {
        return false;
    }
    std::cout << "[Device] Sent device info (version: " << appVersion << ")" << std::endl;
    return true;
}

bool TelemetryScheduler::sendModemResponse(const std::string& response) {
    return publish(makeModemResponse(clock_->epochMillis(), response), "AT");
}

void TelemetryScheduler::applyConfig(const ShadowConfigUpdate& update) {
    if (update.counterEnable) {
        shadow_.counterEnable = *update.counterEnable;
        std::cout << "[Config] counterEnable -> " << (shadow_.counterEnable ? "true" : "false") << std::endl;
    }

    if (update.locationInterval) {
        if (*update.locationInterval <= 0) {
            std::cerr << "[Config] Ignoring non-positive locationInterval " << *update.locationInterval << std::endl;
        } else {
            // Keep the same fraction of the loop under the new segment length
            double fraction = route_->loopDuration() > 0.0 ? routeElapsedSeconds() / route_->loopDuration() : 0.0;
            shadow_.locationInterval = *update.locationInterval;
            route_->setSegmentSeconds(static_cast<double>(shadow_.locationInterval) * RouteInterpolator::kStepsPerSegment);

            if (running_) {
                auto now = clock_->monotonic();
                double rebased = fraction * route_->loopDuration();
                routeStart_ = now - std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                        std::chrono::duration<double>(rebased));
                nextLocationDue_ = now + toDuration(std::chrono::seconds(shadow_.locationInterval));
            }
            std::cout << "[Config] locationInterval -> " << shadow_.locationInterval << "s" << std::endl;
        }
    }

    if (!update.empty()) {
        std::cout << "[Config] Updated: " << JsonCodec::shadowConfigToJson(shadow_).dump() << std::endl;
    }
}

bool TelemetryScheduler::publish(const TelemetryMessage& message, const char* tag) {
    try {
        session_->publish(message);
    } catch (const PublishError& e) {
        ++consecutiveFailures_;
        std::cerr << "[" << tag << "] Publish failed (" << consecutiveFailures_ << " in a row): "
                  << e.what() << std::endl;

        if (consecutiveFailures_ >= policies_->publishFailureThreshold()) {
            consecutiveFailures_ = 0;
            session_->requestReconnect(std::to_string(policies_->publishFailureThreshold()) +
                                       " consecutive publish failures");
        }
        return false;
    }

    consecutiveFailures_ = 0;
    return true;
}

} // namespace nrfsim::domain
