/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for the nRF Cloud device gateway
 *
 * Platform-independent abstraction over an asynchronous MQTT v5 client that
 * authenticates with an X.509 client certificate. The implementation runs
 * its own network thread; callbacks arrive on that thread.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Connection state changes carry a DisconnectCause so the session layer
 *       can tell a session takeover from an ordinary network loss
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace nrfsim {

/**
 * @brief MQTT message structure for device-to-cloud and cloud-to-device communication
 * @note QoS levels: 0 (at most once), 1 (at least once)
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "prod/<tenant>/m/d/<deviceId>/d2c"
    std::string payload;            ///< JSON document
    int qos = 0;
    bool retained = false;
};

/**
 * @brief TLS configuration for X.509 certificate-based authentication
 * @note Certificate files must be PEM; the private key must match the certificate
 */
struct TlsConfig {
    std::string certPath;          ///< Client certificate (.pem)
    std::string keyPath;           ///< Private key (.pem)
    std::string caPath;            ///< Root CA certificate (.pem)
    bool verifyServer = true;
};

/// Why the connection is not (or no longer) up
enum class DisconnectCause {
    None,               ///< Connected
    ClientRequested,    ///< disconnect() was called
    NetworkLost,        ///< Socket error, keep-alive timeout, ordinary broker drop
    SessionTakenOver,   ///< Broker reason 0x8E: another client connected with our id
    NotAuthorized,      ///< Broker reason 0x86/0x87 or TLS/auth rejection
    ConnectFailed       ///< Connect attempt failed for any other reason
};

inline const char* disconnectCauseToString(DisconnectCause cause) {
    switch (cause) {
        case DisconnectCause::None: return "none";
        case DisconnectCause::ClientRequested: return "client requested";
        case DisconnectCause::NetworkLost: return "network lost";
        case DisconnectCause::SessionTakenOver: return "session taken over";
        case DisconnectCause::NotAuthorized: return "not authorized";
        case DisconnectCause::ConnectFailed: return "connect failed";
        default: return "unknown";
    }
}

/// Takeover and authorization failures mean the cached routing may be stale
inline bool isIdentityConflict(DisconnectCause cause) {
    return cause == DisconnectCause::SessionTakenOver || cause == DisconnectCause::NotAuthorized;
}

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note Platform implementations: Paho MQTT C (desktop), MockMqttClient (tests)
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, DisconnectCause cause, const std::string& reason)>;

    /// Callback function type for SUBACK outcomes
    using SubscribeCallback = std::function<void(const std::string& topic, bool granted, const std::string& reason)>;

    /**
     * @brief Connect to the broker using X.509 certificate authentication
     * @param host Broker hostname
     * @param port Broker port (8883)
     * @param clientId MQTT client id; the device id for nRF Cloud
     * @param tlsConfig Certificate paths
     * @param keepAliveSeconds Keep-alive interval
     * @return true if the attempt was initiated; the outcome arrives via the
     *         connection callback
     */
    virtual bool connectWithTls(const std::string& host, std::uint16_t port,
                                const std::string& clientId,
                                const TlsConfig& tlsConfig,
                                int keepAliveSeconds) = 0;

    /**
     * @brief Disconnect from the broker
     * @note Reported through the connection callback as ClientRequested
     */
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @return false if not connected or the client rejected the message; nothing is queued
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos = 0, bool retained = false) = 0;

    /**
     * @brief Subscribe to MQTT topic
     * @param topic Topic filter (supports wildcards)
     * @return true if the subscription request was accepted for sending
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;

    virtual bool unsubscribe(const std::string& topic) = 0;

    /// @note Called from the MQTT thread; ensure thread safety
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /// @note Called from the MQTT thread; ensure thread safety
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /// @note Called from the MQTT thread; ensure thread safety
    virtual void setSubscribeCallback(SubscribeCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace nrfsim
