#pragma once

#include "../IMqttClient.hpp"
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace nrfsim::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos;
    std::chrono::steady_clock::time_point timestamp;
};

struct ConnectRequest {
    std::string host;
    std::uint16_t port = 0;
    std::string clientId;
    TlsConfig tls;
    int keepAliveSeconds = 0;
};

enum class SubscribeBehavior {
    Grant,
    Deny,
    DropConnection      ///< Broker closes the session instead of answering
};

/**
 * Synchronous broker stand-in. Connection outcomes are decided inside
 * connectWithTls and reported through the callback before it returns;
 * scripted failures are consumed in order. Callbacks run outside the mock's
 * lock, from whichever thread made the call.
 */
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient() = default;
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connectWithTls(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const TlsConfig& tlsConfig,
                        int keepAliveSeconds) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;
    void setSubscribeCallback(SubscribeCallback callback) override;

    // Mock-specific methods for testing
    void scriptConnectFailure(DisconnectCause cause, const std::string& reason);
    void setFailConnectInitiation(bool fail);
    void setRespondToConnect(bool respond);
    void setSubscribeBehavior(SubscribeBehavior behavior);
    void setFailPublish(bool fail);

    void simulateConnectionLoss(DisconnectCause cause, const std::string& reason);
    void injectMessage(const std::string& topic, const std::string& payload);

    std::vector<MockMessage> getPublishedMessages() const;
    std::vector<MockMessage> publishedWithAppId(const std::string& appId) const;
    void clearPublishedMessages();

    std::vector<ConnectRequest> connectRequests() const;
    std::vector<std::string> subscriptions() const;
    int connectCalls() const;
    int maxConcurrentConnects() const;

private:
    void notifyConnection(bool connected, DisconnectCause cause, const std::string& reason);

    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failPublish_ = false;
    bool failConnectInitiation_ = false;
    bool respondToConnect_ = true;
    SubscribeBehavior subscribeBehavior_ = SubscribeBehavior::Grant;

    std::deque<std::pair<DisconnectCause, std::string>> scriptedFailures_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    SubscribeCallback subscribeCallback_;

    std::vector<MockMessage> publishedMessages_;
    std::vector<std::string> subscriptions_;
    std::vector<ConnectRequest> connectRequests_;

    int connectsInFlight_ = 0;
    int maxConcurrentConnects_ = 0;
};

} // namespace nrfsim::sim
