/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Provides the IMqttClient implementation on top of the Eclipse Paho MQTT C
 * asynchronous API, speaking MQTT v5 over mutual TLS. Paho runs the network
 * loop on its own thread; every callback below is invoked there.
 *
 * @date 2025
 * @version 1.0
 *
 * @note MQTT v5: the broker's DISCONNECT reason code reaches the connection callback
 * @note No offline queue: publish() fails while disconnected
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <string>
#include <memory>
#include <mutex>
#include <cstdint>

namespace nrfsim {

/**
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Features:
 * - X.509 client-certificate authentication, server verification against the root CA
 * - DISCONNECT reason codes mapped to DisconnectCause
 * - Exactly one connection callback per transition, whichever Paho callback fires first
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     * @note Automatically disconnects if still connected
     */
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

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

    /// Map an MQTT v5 reason code to the session-level cause
    static DisconnectCause causeFromReasonCode(int reasonCode);

private:
    /// Connection timeout for a single attempt (seconds)
    static constexpr int kConnectionTimeoutSeconds = 30;

    /// Grace period for an orderly DISCONNECT (milliseconds)
    static constexpr int kDisconnectTimeoutMs = 2000;

    MQTTAsync client_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> disconnecting_{false};

    std::mutex callbackMutex_;
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    SubscribeCallback subscribeCallback_;

    std::mutex subscribeMutex_;
    std::string pendingSubscribeTopic_;

    void destroyHandle();
    void notifyUp();
    void notifyDown(DisconnectCause cause, const std::string& reason);

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData5* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData5* response);
    static void connectionLost(void* context, char* cause);
    static void onServerDisconnect(void* context, MQTTProperties* properties, enum MQTTReasonCodes reasonCode);
    static void onDisconnected(void* context, MQTTAsync_successData5* response);
    static void onSubscribed(void* context, MQTTAsync_successData5* response);
    static void onSubscribeFailure(void* context, MQTTAsync_failureData5* response);

    /**
     * @brief Validate certificate files exist and are readable
     * @return true if all certificate files are accessible, false otherwise
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace nrfsim
