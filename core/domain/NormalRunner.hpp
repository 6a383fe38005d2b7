#pragma once

#include "../IMqttClient.hpp"
#include "../SessionManager.hpp"
#include "CommandQueue.hpp"
#include "TelemetryScheduler.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace nrfsim::domain {

/**
 * Normal operating mode: one event loop over the command queue.
 *
 * Producers are the keyboard thread, the MQTT callback thread (c2d
 * messages) and the session's reconnect worker (fatal errors); they only
 * push commands. The loop thread owns the scheduler and is the only caller
 * of its send and tick operations.
 */
class NormalRunner {
public:
    // Polled once per loop iteration; true ends the run as if Quit was pressed
    using InterruptCheck = std::function<bool()>;

    NormalRunner(std::shared_ptr<SessionManager> session,
                 std::shared_ptr<TelemetryScheduler> scheduler,
                 std::shared_ptr<CommandQueue> commands,
                 std::string deviceId,
                 std::string appVersion);

    ~NormalRunner();

    NormalRunner(const NormalRunner&) = delete;
    NormalRunner& operator=(const NormalRunner&) = delete;

    void setInterruptCheck(InterruptCheck check) { interruptCheck_ = std::move(check); }
    void setTickInterval(std::chrono::milliseconds interval) { tickInterval_ = interval; }

    /**
     * Connect, subscribe for c2d, announce the device and start the cadences.
     * @throws ConnectionError if the session cannot be established
     */
    void start();

    // One loop iteration: dispatch queued commands (waiting up to maxWait), then tick
    void pump(std::chrono::milliseconds maxWait);

    /**
     * start(), loop until Quit or interrupt, then shut down cleanly.
     * @throws ConnectionError when the session gives up reconnecting
     */
    void run();

    // Cancel timers and disconnect; idempotent
    void shutdown();

    bool isRunning() const { return running_; }

    // c2d filter is ".../m/d/<deviceId>/+/r"
    bool isControlTopic(const std::string& topic) const;

private:
    void registerHandlers();
    void handleMessage(const std::string& topic, const std::string& payload);
    void handleModemCommand(const std::string& command);
    std::string atResponse(const std::string& command) const;
    void printShadow() const;
    void printRoute() const;

    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<TelemetryScheduler> scheduler_;
    std::shared_ptr<CommandQueue> commands_;
    std::string deviceId_;
    std::string appVersion_;

    InterruptCheck interruptCheck_;
    std::chrono::milliseconds tickInterval_{1000};

    bool running_ = false;
    bool stopped_ = false;
    std::optional<std::string> fatalReason_;
};

} // namespace nrfsim::domain
