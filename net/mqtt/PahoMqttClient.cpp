#include "PahoMqttClient.hpp"
#include <iostream>
#include <cstring>
#include <fstream>

namespace nrfsim {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    destroyHandle();
}

void PahoMqttClient::destroyHandle() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
}

DisconnectCause PahoMqttClient::causeFromReasonCode(int reasonCode) {
    switch (reasonCode) {
        case MQTTREASONCODE_SESSION_TAKEN_OVER:
            return DisconnectCause::SessionTakenOver;
        case MQTTREASONCODE_NOT_AUTHORIZED:
        case MQTTREASONCODE_BAD_USER_NAME_OR_PASSWORD:
        case MQTTREASONCODE_BANNED:
        case MQTTREASONCODE_CLIENT_IDENTIFIER_NOT_VALID:
            return DisconnectCause::NotAuthorized;
        default:
            return DisconnectCause::NetworkLost;
    }
}

bool PahoMqttClient::connectWithTls(const std::string& host, std::uint16_t port,
                                    const std::string& clientId,
                                    const TlsConfig& tlsConfig,
                                    int keepAliveSeconds) {

    std::cout << "[MQTT] Connecting to " << host << ":" << port << "..." << std::endl;
    std::cout << "[MQTT] Device ID: " << clientId << std::endl;

    // Validate certificate files before attempting connection
    if (!validateCertificateFiles(tlsConfig)) {
        return false;
    }

    // A previous attempt's handle cannot be reused across a new server URI
    destroyHandle();
    connected_ = false;
    disconnecting_ = false;

    std::string serverURI = "ssl://" + host + ":" + std::to_string(port);

    MQTTAsync_createOptions create_opts = MQTTAsync_createOptions_initializer5;
    int rc = MQTTAsync_createWithOptions(&client_, serverURI.c_str(), clientId.c_str(),
                                         MQTTCLIENT_PERSISTENCE_NONE, nullptr, &create_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    MQTTAsync_setDisconnected(client_, this, onServerDisconnect);

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer5;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = keepAliveSeconds;
    conn_opts.cleanstart = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.automaticReconnect = 0;   // SessionManager owns reconnect policy
    conn_opts.onSuccess5 = onConnected;
    conn_opts.onFailure5 = onConnectFailure;
    conn_opts.context = this;
    conn_opts.ssl = &ssl_opts;

    // Configure X.509 client certificate authentication
    ssl_opts.keyStore = tlsConfig.certPath.c_str();        // Client certificate (.pem)
    ssl_opts.privateKey = tlsConfig.keyPath.c_str();       // Private key (.pem)
    ssl_opts.trustStore = tlsConfig.caPath.c_str();        // Root CA certificate (.pem)
    ssl_opts.enableServerCertAuth = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.verify = tlsConfig.verifyServer ? 1 : 0;
    ssl_opts.enabledCipherSuites = nullptr;
    ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;

    rc = MQTTAsync_connect(client_, &conn_opts);

    if (rc == MQTTASYNC_SUCCESS) {
        return true;
    }
    std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
    return false;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        disconnecting_ = true;

        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer5;
        disc_opts.timeout = kDisconnectTimeoutMs;
        disc_opts.reasonCode = MQTTREASONCODE_NORMAL_DISCONNECTION;
        disc_opts.onSuccess5 = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect request failed, error code: " << rc << std::endl;
            notifyDown(DisconnectCause::ClientRequested, "Disconnect request failed");
        }
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(payload.length());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish rejected, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_ || !connected_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(subscribeMutex_);
        pendingSubscribeTopic_ = topic;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess5 = onSubscribed;
    opts.onFailure5 = onSubscribeFailure;
    opts.context = this;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!client_ || !connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::setSubscribeCallback(SubscribeCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    subscribeCallback_ = std::move(callback);
}

void PahoMqttClient::notifyUp() {
    connected_ = true;

    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(true, DisconnectCause::None, "Connected successfully");
    }
}

void PahoMqttClient::notifyDown(DisconnectCause cause, const std::string& reason) {
    // Server DISCONNECT and connectionLost can both fire for one drop
    if (!connected_.exchange(false) && cause != DisconnectCause::ConnectFailed &&
        cause != DisconnectCause::NotAuthorized) {
        return;
    }

    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(false, cause, reason);
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
    msg.qos = message->qos;
    msg.retained = message->retained != 0;

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->messageCallback_;
    }
    if (callback) {
        callback(msg);
    }
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData5* response) {
    (void)response;
    static_cast<PahoMqttClient*>(context)->notifyUp();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData5* response) {
    auto* client = static_cast<PahoMqttClient*>(context);

    DisconnectCause cause = DisconnectCause::ConnectFailed;
    std::string reason = "Connection failed";
    if (response) {
        if (response->reasonCode != MQTTREASONCODE_SUCCESS) {
            cause = causeFromReasonCode(response->reasonCode);
            if (cause == DisconnectCause::NetworkLost) {
                cause = DisconnectCause::ConnectFailed;
            }
            reason = std::string("CONNACK ") + MQTTReasonCode_toString(response->reasonCode);
        } else {
            reason = "Error code " + std::to_string(response->code);
        }
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    client->notifyDown(cause, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    std::string reason = cause ? std::string(cause) : "Connection lost";
    client->notifyDown(client->disconnecting_ ? DisconnectCause::ClientRequested
                                              : DisconnectCause::NetworkLost,
                       reason);
}

void PahoMqttClient::onServerDisconnect(void* context, MQTTProperties* properties, enum MQTTReasonCodes reasonCode) {
    (void)properties;
    auto* client = static_cast<PahoMqttClient*>(context);
    client->notifyDown(causeFromReasonCode(reasonCode),
                       std::string("Broker DISCONNECT: ") + MQTTReasonCode_toString(reasonCode));
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData5* response) {
    (void)response;
    auto* client = static_cast<PahoMqttClient*>(context);
    client->notifyDown(DisconnectCause::ClientRequested, "Disconnected");
}

void PahoMqttClient::onSubscribed(void* context, MQTTAsync_successData5* response) {
    auto* client = static_cast<PahoMqttClient*>(context);

    std::string topic;
    {
        std::lock_guard<std::mutex> lock(client->subscribeMutex_);
        topic = client->pendingSubscribeTopic_;
    }

    bool granted = true;
    std::string reason = "Granted";
    if (response && response->reasonCode >= MQTTREASONCODE_UNSPECIFIED_ERROR) {
        granted = false;
        reason = MQTTReasonCode_toString(response->reasonCode);
    }

    SubscribeCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->subscribeCallback_;
    }
    if (callback) {
        callback(topic, granted, reason);
    }
}

void PahoMqttClient::onSubscribeFailure(void* context, MQTTAsync_failureData5* response) {
    auto* client = static_cast<PahoMqttClient*>(context);

    std::string topic;
    {
        std::lock_guard<std::mutex> lock(client->subscribeMutex_);
        topic = client->pendingSubscribeTopic_;
    }

    std::string reason = "Subscribe failed";
    if (response) {
        reason = MQTTReasonCode_toString(response->reasonCode);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }

    SubscribeCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->subscribeCallback_;
    }
    if (callback) {
        callback(topic, false, reason);
    }
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    std::ifstream certFile(tlsConfig.certPath);
    if (!certFile.good()) {
        std::cerr << "[MQTT] ERROR: Certificate file not found: " << tlsConfig.certPath << std::endl;
        return false;
    }

    std::ifstream keyFile(tlsConfig.keyPath);
    if (!keyFile.good()) {
        std::cerr << "[MQTT] ERROR: Private key file not found: " << tlsConfig.keyPath << std::endl;
        return false;
    }

    std::ifstream caFile(tlsConfig.caPath);
    if (!caFile.good()) {
        std::cerr << "[MQTT] ERROR: CA file not found: " << tlsConfig.caPath << std::endl;
        return false;
    }

    return true;
}

} // namespace nrfsim
