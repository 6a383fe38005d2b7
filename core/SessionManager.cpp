#include "SessionManager.hpp"
#include "JsonCodec.hpp"
#include <iostream>

namespace nrfsim {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::Degraded: return "Degraded";
        default: return "Unknown";
    }
}

SessionManager::SessionManager(std::shared_ptr<IMqttClient> mqtt,
                               std::shared_ptr<DeviceSessionContext> context,
                               std::shared_ptr<ports::IPolicyEngine> policies,
                               SessionSettings settings)
    : mqtt_(std::move(mqtt))
    , context_(std::move(context))
    , policies_(std::move(policies))
    , settings_(settings)
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {

    mqtt_->setConnectionCallback([this](bool connected, DisconnectCause cause, const std::string& reason) {
        onConnectionChanged(connected, cause, reason);
    });
    mqtt_->setSubscribeCallback([this](const std::string& topic, bool granted, const std::string& reason) {
        onSubscribeResult(topic, granted, reason);
    });
    mqtt_->setMessageCallback([this](const MqttMessage& message) {
        onMessage(message);
    });

    worker_ = std::thread(&SessionManager::workerLoop, this);
}

SessionManager::~SessionManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopWorker_ = true;
        shutdownRequested_ = true;
    }
    workerCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    mqtt_->setConnectionCallback(nullptr);
    mqtt_->setSubscribeCallback(nullptr);
    mqtt_->setMessageCallback(nullptr);
}

void SessionManager::setRegistrationProvider(RegistrationProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    registrationProvider_ = std::move(provider);
}

void SessionManager::setSleeper(Sleeper sleeper) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleeper_ = std::move(sleeper);
}

void SessionManager::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateCallback_ = std::move(callback);
}

void SessionManager::setFatalCallback(FatalCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    fatalCallback_ = std::move(callback);
}

void SessionManager::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageHandler_ = std::move(handler);
}

void SessionManager::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Connected) {
            return;
        }
        if (state_ != SessionState::Disconnected) {
            throw ConnectionError(std::string("Connection attempt already in progress (") +
                                  sessionStateToString(state_) + ")");
        }
        // Claimed under the same lock as the check: at most one attempt in flight
        shutdownRequested_ = false;
        state_ = SessionState::Connecting;
    }
    notifyState(SessionState::Disconnected, SessionState::Connecting, "connect requested");

    const ports::RetryPolicy& policy = policies_->getReconnectPolicy();
    for (int attempt = 1; ; ++attempt) {
        Outcome outcome = attemptOnce();
        if (outcome.connected) {
            notifyState(SessionState::Connecting, SessionState::Connected, outcome.reason);
            return;
        }

        std::cerr << "[Session] Connect attempt " << attempt << "/" << policy.maxAttempts()
                  << " failed: " << outcome.reason << std::endl;

        bool stop = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop = shutdownRequested_;
        }
        if (stop || !policy.shouldRetry(attempt)) {
            transition(SessionState::Disconnected, outcome.reason);
            throw ConnectionError("Could not connect after " + std::to_string(attempt) +
                                  " attempt(s): " + outcome.reason);
        }

        auto delay = policy.getBackoffDelay(attempt);
        std::cout << "[Session] Retrying in " << delay.count() << " ms" << std::endl;
        Sleeper sleeper;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sleeper = sleeper_;
        }
        sleeper(delay);
    }
}

ConnectionInfo SessionManager::ensureRouting() {
    auto cached = context_->connectionInfo();
    if (cached) {
        return *cached;
    }

    RegistrationProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = registrationProvider_;
    }
    if (!provider) {
        throw ConnectionError("No broker routing available and no way to register");
    }

    std::cout << "[Session] No valid connection info, registering device before connecting" << std::endl;
    ConnectionInfo fresh = provider();
    context_->saveConnectionInfo(fresh);
    return fresh;
}

SessionManager::Outcome SessionManager::attemptOnce() {
    ConnectionInfo info;
    try {
        info = ensureRouting();
    } catch (const SimulatorError& e) {
        Outcome failed;
        failed.cause = DisconnectCause::ConnectFailed;
        failed.reason = std::string("registration failed: ") + e.what();
        return failed;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome_.reset();
    }

    const CertificateBundle& bundle = context_->bundle();
    TlsConfig tls;
    tls.certPath = bundle.certPath;
    tls.keyPath = bundle.keyPath;
    tls.caPath = bundle.caPath;
    tls.verifyServer = true;

    if (!mqtt_->connectWithTls(info.brokerHost, info.brokerPort, context_->identity().deviceId,
                               tls, settings_.keepAliveSeconds)) {
        Outcome failed;
        failed.cause = DisconnectCause::ConnectFailed;
        failed.reason = "connect could not be initiated";
        return failed;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool arrived = stateCv_.wait_for(lock, settings_.connectTimeout, [this] { return outcome_.has_value(); });
    if (!arrived) {
        lock.unlock();
        Outcome failed;
        failed.cause = DisconnectCause::ConnectFailed;
        failed.reason = "connection timed out";
        return failed;
    }

    Outcome result = *outcome_;
    outcome_.reset();

    if (result.connected && shutdownRequested_) {
        state_ = SessionState::Disconnected;
        lock.unlock();
        mqtt_->disconnect();
        Outcome cancelled;
        cancelled.cause = DisconnectCause::ClientRequested;
        cancelled.reason = "shutdown requested";
        return cancelled;
    }

    if (result.connected) {
        // Connected is set under the same lock that consumes the outcome
        state_ = SessionState::Connected;
        telemetryTopic_ = info.telemetryTopic;
        controlTopic_ = info.controlTopic;
        lastCause_ = DisconnectCause::None;
        lastReason_.clear();
        lock.unlock();
        std::cout << "[MQTT] Connected to " << info.brokerHost << std::endl;
        std::cout << "[MQTT] d2c: " << info.telemetryTopic << std::endl;
        std::cout << "[MQTT] c2d: " << info.controlTopic << std::endl;
        return result;
    }

    lastCause_ = result.cause;
    lastReason_ = result.reason;
    lock.unlock();

    if (isIdentityConflict(result.cause)) {
        context_->invalidateConnectionInfo();
    }
    return result;
}

void SessionManager::publish(const TelemetryMessage& message) {
    std::string topic;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Connected) {
            throw PublishError(std::string("Not connected (") + sessionStateToString(state_) +
                               "), dropping " + appIdToString(message.appId()));
        }
        topic = telemetryTopic_;
    }

    std::string payload = JsonCodec::serialize(message);
    if (!mqtt_->publish(topic, payload, settings_.qos)) {
        throw PublishError("Transport refused " + appIdToString(message.appId()) + " message");
    }
}

void SessionManager::subscribeControlTopic() {
    std::string topic;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Connected) {
            throw ConnectionError(std::string("Cannot subscribe while ") + sessionStateToString(state_));
        }
        topic = controlTopic_;
        subscribeOutcome_.reset();
    }

    if (!mqtt_->subscribe(topic, settings_.qos)) {
        throw ConnectionError("Subscribe request for " + topic + " refused by the client");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = stateCv_.wait_for(lock, settings_.subscribeTimeout, [this] {
        return subscribeOutcome_.has_value() || state_ != SessionState::Connected;
    });
    if (!settled) {
        throw ConnectionError("No SUBACK for " + topic);
    }
    if (!subscribeOutcome_) {
        throw ConnectionError("Connection dropped while subscribing to " + topic);
    }

    auto result = *subscribeOutcome_;
    subscribeOutcome_.reset();
    if (!result.first) {
        throw ConnectionError("Subscription to " + topic + " denied: " + result.second);
    }
    subscribed_ = true;
    lock.unlock();

    std::cout << "[MQTT] Subscribed to: " << topic << std::endl;
}

void SessionManager::disconnect() {
    SessionState from;
    bool wasConnected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdownRequested_ = true;
        from = state_;
        wasConnected = state_ == SessionState::Connected;
        if (wasConnected) {
            state_ = SessionState::Disconnected;
            lastCause_ = DisconnectCause::ClientRequested;
            lastReason_ = "client requested";
        }
    }

    if (wasConnected) {
        mqtt_->disconnect();
        notifyState(from, SessionState::Disconnected, "client requested");
        std::cout << "[MQTT] Disconnected from nRF Cloud" << std::endl;
    } else if (from != SessionState::Disconnected) {
        std::cout << "[Session] Disconnect queued until the pending attempt settles" << std::endl;
    }
}

void SessionManager::requestReconnect(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Connected || !settings_.autoReconnect || shutdownRequested_) {
            return;
        }
        state_ = SessionState::Degraded;
        lastCause_ = DisconnectCause::NetworkLost;
        lastReason_ = reason;
    }

    std::cerr << "[Session] Forcing reconnect: " << reason << std::endl;
    // Reported as ClientRequested while Degraded, which onConnectionChanged ignores
    mqtt_->disconnect();
    notifyState(SessionState::Connected, SessionState::Degraded, reason);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnectRequested_ = true;
    }
    workerCv_.notify_one();
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SessionManager::isConnected() const {
    return state() == SessionState::Connected;
}

DisconnectCause SessionManager::lastDisconnectCause() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastCause_;
}

std::string SessionManager::lastDisconnectReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastReason_;
}

bool SessionManager::waitForState(SessionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return stateCv_.wait_for(lock, timeout, [this, target] { return state_ == target; });
}

void SessionManager::onConnectionChanged(bool connected, DisconnectCause cause, const std::string& reason) {
    SessionState next;
    bool wakeWorker = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Connecting) {
            Outcome outcome;
            outcome.connected = connected;
            outcome.cause = cause;
            outcome.reason = reason;
            outcome_ = outcome;
            stateCv_.notify_all();
            return;
        }

        // Late or duplicate notifications outside an established session
        if (connected || state_ != SessionState::Connected) {
            return;
        }

        lastCause_ = cause;
        lastReason_ = reason;

        if (isIdentityConflict(cause)) {
            context_->invalidateConnectionInfo();
        }

        if (settings_.autoReconnect && !shutdownRequested_) {
            state_ = SessionState::Degraded;
            reconnectRequested_ = true;
            wakeWorker = true;
        } else {
            state_ = SessionState::Disconnected;
        }
        next = state_;
    }

    std::cerr << "[MQTT] Unexpected disconnect (" << disconnectCauseToString(cause) << "): "
              << reason << std::endl;
    notifyState(SessionState::Connected, next, reason);
    if (wakeWorker) {
        workerCv_.notify_one();
    }
}

void SessionManager::onSubscribeResult(const std::string& topic, bool granted, const std::string& reason) {
    (void)topic;
    std::lock_guard<std::mutex> lock(mutex_);
    subscribeOutcome_ = std::make_pair(granted, reason);
    stateCv_.notify_all();
}

void SessionManager::onMessage(const MqttMessage& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = messageHandler_;
    }
    if (handler) {
        handler(message);
    } else {
        std::cout << "[MQTT] Message on " << message.topic << " (no handler)" << std::endl;
    }
}

void SessionManager::transition(SessionState next, const std::string& reason) {
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        state_ = next;
    }
    notifyState(from, next, reason);
}

void SessionManager::notifyState(SessionState from, SessionState to, const std::string& reason) {
    stateCv_.notify_all();

    std::cout << "[Session] " << sessionStateToString(from) << " -> " << sessionStateToString(to);
    if (!reason.empty()) {
        std::cout << " (" << reason << ")";
    }
    std::cout << std::endl;

    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = stateCallback_;
    }
    if (callback) {
        callback(from, to, reason);
    }
}

void SessionManager::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        workerCv_.wait(lock, [this] { return reconnectRequested_ || stopWorker_; });
        if (stopWorker_) {
            return;
        }
        reconnectRequested_ = false;
        lock.unlock();

        try {
            runReconnect();
        } catch (const std::exception& e) {
            std::cerr << "[Session] Reconnect worker error: " << e.what() << std::endl;
            transition(SessionState::Disconnected, e.what());
            FatalCallback fatal;
            {
                std::lock_guard<std::mutex> guard(mutex_);
                fatal = fatalCallback_;
            }
            if (fatal) {
                fatal(ConnectionError(std::string("Reconnect aborted: ") + e.what()));
            }
        }

        lock.lock();
    }
}

void SessionManager::runReconnect() {
    const ports::RetryPolicy& policy = policies_->getReconnectPolicy();

    for (int attempt = 1; ; ++attempt) {
        auto delay = policy.getBackoffDelay(attempt);
        std::cout << "[Session] Reconnect attempt " << attempt << "/" << policy.maxAttempts()
                  << " in " << delay.count() << " ms" << std::endl;

        Sleeper sleeper;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sleeper = sleeper_;
        }
        sleeper(delay);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdownRequested_) {
                state_ = SessionState::Disconnected;
            } else {
                state_ = SessionState::Connecting;
            }
        }
        if (state() == SessionState::Disconnected) {
            notifyState(SessionState::Degraded, SessionState::Disconnected, "shutdown during backoff");
            return;
        }
        notifyState(SessionState::Degraded, SessionState::Connecting, "reconnecting");

        Outcome outcome = attemptOnce();
        if (outcome.connected) {
            notifyState(SessionState::Connecting, SessionState::Connected, "reconnected");

            bool resubscribe = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                resubscribe = subscribed_;
            }
            if (resubscribe) {
                try {
                    subscribeControlTopic();
                } catch (const ConnectionError& e) {
                    std::cerr << "[Session] Resubscribe failed: " << e.what() << std::endl;
                }
            }
            return;
        }

        std::cerr << "[Session] Reconnect attempt " << attempt << " failed: " << outcome.reason << std::endl;

        bool stop = false;
        bool exhausted = !policy.shouldRetry(attempt);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop = shutdownRequested_;
            state_ = (stop || exhausted) ? SessionState::Disconnected : SessionState::Degraded;
        }

        if (stop) {
            notifyState(SessionState::Connecting, SessionState::Disconnected, "shutdown requested");
            return;
        }
        if (exhausted) {
            ConnectionError error("Reconnect gave up after " + std::to_string(attempt) +
                                  " attempt(s): " + outcome.reason);
            notifyState(SessionState::Connecting, SessionState::Disconnected, error.what());

            FatalCallback fatal;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fatal = fatalCallback_;
            }
            if (fatal) {
                fatal(error);
            }
            return;
        }
        notifyState(SessionState::Connecting, SessionState::Degraded, outcome.reason);
    }
}

} // namespace nrfsim
