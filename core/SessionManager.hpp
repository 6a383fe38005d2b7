/**
 * @file SessionManager.hpp
 * @brief Persistent broker session: connect, publish, subscribe, reconnect
 *
 * State machine:
 * Disconnected → Connecting → Connected → Degraded → Connecting ... → Disconnected
 *
 * Connecting and Degraded both mean "an attempt owns the transport"; a second
 * connect() in either state is refused, so at most one connection attempt is
 * ever in flight. Unexpected drops move Connected to Degraded and wake the
 * reconnect worker, which retries with the reconnect policy's backoff and
 * gives up with a fatal ConnectionError once the budget is spent. A drop
 * caused by a session takeover or an authorization failure also discards the
 * cached routing, so the next attempt registers again before connecting.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "DeviceSessionContext.hpp"
#include "Errors.hpp"
#include "IMqttClient.hpp"
#include "Telemetry.hpp"
#include "ports/IRetryPolicy.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace nrfsim {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Degraded
};

const char* sessionStateToString(SessionState state);

struct SessionSettings {
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds subscribeTimeout{std::chrono::seconds(10)};
    int keepAliveSeconds = 120;
    int qos = 1;
    bool autoReconnect = true;          ///< Off for diagnostics: a drop ends the session
};

class SessionManager {
public:
    /// Registers the device and returns fresh routing; throws DirectoryError
    using RegistrationProvider = std::function<ConnectionInfo()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using StateCallback = std::function<void(SessionState from, SessionState to, const std::string& reason)>;
    using FatalCallback = std::function<void(const ConnectionError& error)>;
    using MessageHandler = std::function<void(const MqttMessage& message)>;

    SessionManager(std::shared_ptr<IMqttClient> mqtt,
                   std::shared_ptr<DeviceSessionContext> context,
                   std::shared_ptr<ports::IPolicyEngine> policies,
                   SessionSettings settings = {});

    /// Joins the reconnect worker; a pending backoff sleep runs to completion
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void setRegistrationProvider(RegistrationProvider provider);
    void setSleeper(Sleeper sleeper);
    void setStateCallback(StateCallback callback);
    void setFatalCallback(FatalCallback callback);
    void setMessageHandler(MessageHandler handler);

    /**
     * @brief Open the session with the context's bundle and routing
     *
     * Blocks until Connected. Registers first when the context has no
     * routing. Retries with the reconnect policy.
     *
     * @throws ConnectionError after the attempt budget is spent, or when
     *         another attempt is already in flight
     */
    void connect();

    /**
     * @brief Fire-and-forget publish on the telemetry topic
     * @throws PublishError if not Connected or the transport refuses the message
     */
    void publish(const TelemetryMessage& message);

    /**
     * @brief Subscribe to the cloud-to-device topic and wait for the SUBACK
     *
     * The subscription is renewed automatically after every reconnect.
     *
     * @throws ConnectionError if not Connected, denied, or unacknowledged in time
     */
    void subscribeControlTopic();

    /// Clean user-initiated disconnect; terminal, no retry
    void disconnect();

    /// Force the reconnect path from Connected (e.g. repeated publish failures)
    void requestReconnect(const std::string& reason);

    SessionState state() const;
    bool isConnected() const;
    DisconnectCause lastDisconnectCause() const;
    std::string lastDisconnectReason() const;

    /// Wait until the state equals target; false on timeout
    bool waitForState(SessionState target, std::chrono::milliseconds timeout) const;

private:
    struct Outcome {
        bool connected = false;
        DisconnectCause cause = DisconnectCause::None;
        std::string reason;
    };

    void onConnectionChanged(bool connected, DisconnectCause cause, const std::string& reason);
    void onSubscribeResult(const std::string& topic, bool granted, const std::string& reason);
    void onMessage(const MqttMessage& message);

    /// One attempt: ensure routing, initiate, wait for the outcome
    Outcome attemptOnce();
    ConnectionInfo ensureRouting();
    void transition(SessionState next, const std::string& reason);
    void notifyState(SessionState from, SessionState to, const std::string& reason);

    void workerLoop();
    void runReconnect();

    std::shared_ptr<IMqttClient> mqtt_;
    std::shared_ptr<DeviceSessionContext> context_;
    std::shared_ptr<ports::IPolicyEngine> policies_;
    SessionSettings settings_;

    RegistrationProvider registrationProvider_;
    Sleeper sleeper_;
    StateCallback stateCallback_;
    FatalCallback fatalCallback_;
    MessageHandler messageHandler_;

    mutable std::mutex mutex_;
    mutable std::condition_variable stateCv_;
    SessionState state_ = SessionState::Disconnected;
    std::optional<Outcome> outcome_;
    std::optional<std::pair<bool, std::string>> subscribeOutcome_;
    DisconnectCause lastCause_ = DisconnectCause::None;
    std::string lastReason_;
    std::string telemetryTopic_;
    std::string controlTopic_;
    bool subscribed_ = false;
    bool shutdownRequested_ = false;

    std::condition_variable workerCv_;
    bool reconnectRequested_ = false;
    bool stopWorker_ = false;
    std::thread worker_;
};

} // namespace nrfsim
