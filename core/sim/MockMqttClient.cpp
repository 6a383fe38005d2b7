#include "MockMqttClient.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace nrfsim::sim {

bool MockMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const TlsConfig& tlsConfig,
                                    int keepAliveSeconds) {
    bool respond = false;
    bool connected = false;
    DisconnectCause cause = DisconnectCause::None;
    std::string reason = "Connected";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connectRequests_.push_back(ConnectRequest{host, port, clientId, tlsConfig, keepAliveSeconds});
        if (failConnectInitiation_) {
            return false;
        }

        ++connectsInFlight_;
        maxConcurrentConnects_ = std::max(maxConcurrentConnects_, connectsInFlight_);

        respond = respondToConnect_;
        if (!scriptedFailures_.empty()) {
            cause = scriptedFailures_.front().first;
            reason = scriptedFailures_.front().second;
            scriptedFailures_.pop_front();
        } else {
            connected = respond;
        }
        connected_ = connected;
    }

    if (respond) {
        notifyConnection(connected, cause, reason);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --connectsInFlight_;
    return true;
}

void MockMqttClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
    }
    notifyConnection(false, DisconnectCause::ClientRequested, "Disconnected");
}

bool MockMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool retained) {
    (void)retained;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_ || failPublish_) {
        return false;
    }

    MockMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.timestamp = std::chrono::steady_clock::now();

    publishedMessages_.push_back(msg);
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    SubscribeBehavior behavior;
    SubscribeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return false;

        if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
            subscriptions_.push_back(topic);
        }
        behavior = subscribeBehavior_;
        callback = subscribeCallback_;
        if (behavior == SubscribeBehavior::DropConnection) {
            connected_ = false;
        }
    }

    switch (behavior) {
        case SubscribeBehavior::Grant:
            if (callback) callback(topic, true, "granted");
            break;
        case SubscribeBehavior::Deny:
            if (callback) callback(topic, false, "Not authorized");
            break;
        case SubscribeBehavior::DropConnection:
            notifyConnection(false, DisconnectCause::NetworkLost, "Connection closed by broker");
            break;
    }
    return true;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return false;
    subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), topic),
                         subscriptions_.end());
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::setSubscribeCallback(SubscribeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribeCallback_ = std::move(callback);
}

void MockMqttClient::scriptConnectFailure(DisconnectCause cause, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    scriptedFailures_.emplace_back(cause, reason);
}

void MockMqttClient::setFailConnectInitiation(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failConnectInitiation_ = fail;
}

void MockMqttClient::setRespondToConnect(bool respond) {
    std::lock_guard<std::mutex> lock(mutex_);
    respondToConnect_ = respond;
}

void MockMqttClient::setSubscribeBehavior(SubscribeBehavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribeBehavior_ = behavior;
}

void MockMqttClient::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

void MockMqttClient::simulateConnectionLoss(DisconnectCause cause, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
    }
    notifyConnection(false, cause, reason);
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = messageCallback_;
    }
    if (callback) {
        MqttMessage msg;
        msg.topic = topic;
        msg.payload = payload;
        callback(msg);
    }
}

std::vector<MockMessage> MockMqttClient::getPublishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return publishedMessages_;
}

std::vector<MockMessage> MockMqttClient::publishedWithAppId(const std::string& appId) const {
    std::vector<MockMessage> matching;
    for (const auto& msg : getPublishedMessages()) {
        auto json = nlohmann::json::parse(msg.payload, nullptr, false);
        if (!json.is_discarded() && json.value("appId", "") == appId) {
            matching.push_back(msg);
        }
    }
    return matching;
}

void MockMqttClient::clearPublishedMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    publishedMessages_.clear();
}

std::vector<ConnectRequest> MockMqttClient::connectRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectRequests_;
}

std::vector<std::string> MockMqttClient::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

int MockMqttClient::connectCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(connectRequests_.size());
}

int MockMqttClient::maxConcurrentConnects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxConcurrentConnects_;
}

void MockMqttClient::notifyConnection(bool connected, DisconnectCause cause, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, cause, reason);
    }
}

} // namespace nrfsim::sim
