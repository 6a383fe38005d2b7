#include <gtest/gtest.h>
#include "../core/SessionManager.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "TestSupport.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace nrfsim;
using namespace std::chrono_literals;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mqtt_ = std::make_shared<sim::MockMqttClient>();
        policies_ = std::make_shared<adapters::DefaultPolicyEngine>();
        sleeper_ = std::make_shared<testsupport::RecordingSleeper>();
        context_ = testsupport::makeContext(dir_, true);
    }

    void build(SessionSettings settings = {}) {
        session_ = std::make_shared<SessionManager>(mqtt_, context_, policies_, settings);
        auto sleeper = sleeper_;
        session_->setSleeper([sleeper](std::chrono::milliseconds delay) { (*sleeper)(delay); });
        session_->setRegistrationProvider([this]() {
            ++registrations_;
            return testsupport::testRouting();
        });
    }

    testsupport::TempDir dir_;
    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policies_;
    std::shared_ptr<testsupport::RecordingSleeper> sleeper_;
    std::shared_ptr<DeviceSessionContext> context_;
    std::atomic<int> registrations_{0};
    std::shared_ptr<SessionManager> session_;
};

TEST_F(SessionManagerTest, ConnectsWithCachedRouting) {
    build();
    session_->connect();

    EXPECT_EQ(session_->state(), SessionState::Connected);
    EXPECT_EQ(registrations_, 0);

    auto requests = mqtt_->connectRequests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].host, "mqtt.test.example");
    EXPECT_EQ(requests[0].port, 8883);
    EXPECT_EQ(requests[0].clientId, "dev-1");
    EXPECT_EQ(requests[0].tls.certPath, context_->bundle().certPath);
    EXPECT_EQ(requests[0].tls.keyPath, context_->bundle().keyPath);
    EXPECT_EQ(requests[0].tls.caPath, context_->bundle().caPath);
}

TEST_F(SessionManagerTest, RegistersWhenRoutingIsMissing) {
    context_ = testsupport::makeContext(dir_, false);
    build();
    session_->connect();

    EXPECT_EQ(registrations_, 1);
    ASSERT_TRUE(context_->connectionInfo().has_value());
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "dev-1.mqtt_info.json"));
}

TEST_F(SessionManagerTest, ConcurrentConnectStartsOneAttempt) {
    policies_ = std::make_shared<adapters::DefaultPolicyEngine>(
        adapters::ExponentialBackoffRetryPolicy(1ms, 2.0, 10ms, 1),
        adapters::ExponentialBackoffRetryPolicy(1ms, 2.0, 10ms, 1), 3);
    mqtt_->setRespondToConnect(false);

    SessionSettings settings;
    settings.connectTimeout = 300ms;
    build(settings);

    std::thread first([this]() {
        EXPECT_THROW(session_->connect(), ConnectionError);
    });

    ASSERT_TRUE(session_->waitForState(SessionState::Connecting, 2s));
    EXPECT_THROW(session_->connect(), ConnectionError);
    first.join();

    EXPECT_EQ(mqtt_->connectCalls(), 1);
    EXPECT_EQ(mqtt_->maxConcurrentConnects(), 1);
    EXPECT_EQ(session_->state(), SessionState::Disconnected);
}

TEST_F(SessionManagerTest, InitialConnectBacksOffBetweenAttempts) {
    build();
    mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");
    mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");
    mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");

    session_->connect();

    EXPECT_EQ(session_->state(), SessionState::Connected);
    EXPECT_EQ(mqtt_->connectCalls(), 4);
    auto delays = sleeper_->delays();
    ASSERT_EQ(delays.size(), 3u);
    EXPECT_EQ(delays[0], 1000ms);
    EXPECT_EQ(delays[1], 2000ms);
    EXPECT_EQ(delays[2], 4000ms);
}

TEST_F(SessionManagerTest, InitialConnectGivesUpAfterBudget) {
    policies_ = std::make_shared<adapters::DefaultPolicyEngine>(
        adapters::ExponentialBackoffRetryPolicy(1000ms, 2.0, 60s, 2),
        adapters::ExponentialBackoffRetryPolicy(1000ms, 2.0, 60s, 3), 3);
    build();
    mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");
    mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");

    EXPECT_THROW(session_->connect(), ConnectionError);
    EXPECT_EQ(session_->state(), SessionState::Disconnected);
    EXPECT_EQ(mqtt_->connectCalls(), 2);
}

TEST_F(SessionManagerTest, SessionTakeoverForcesReregistration) {
    build();
    session_->connect();
    ASSERT_EQ(registrations_, 0);

    mqtt_->simulateConnectionLoss(DisconnectCause::SessionTakenOver, "Session taken over");

    ASSERT_TRUE(session_->waitForState(SessionState::Connected, 2s));
    EXPECT_EQ(registrations_, 1);
    EXPECT_EQ(mqtt_->connectCalls(), 2);
}

TEST_F(SessionManagerTest, NetworkLossReconnectsWithCachedRouting) {
    build();
    session_->connect();

    mqtt_->simulateConnectionLoss(DisconnectCause::NetworkLost, "keep-alive timeout");

    ASSERT_TRUE(session_->waitForState(SessionState::Connected, 2s));
    EXPECT_EQ(registrations_, 0);
    auto delays = sleeper_->delays();
    ASSERT_EQ(delays.size(), 1u);
    EXPECT_EQ(delays[0], 1000ms);
}

TEST_F(SessionManagerTest, ReconnectGivesUpAfterTenAttempts) {
    build();
    std::promise<std::string> fatal;
    auto fatalFuture = fatal.get_future();
    session_->setFatalCallback([&fatal](const ConnectionError& error) {
        fatal.set_value(error.what());
    });

    session_->connect();
    for (int i = 0; i < 10; ++i) {
        mqtt_->scriptConnectFailure(DisconnectCause::NetworkLost, "unreachable");
    }
    mqtt_->simulateConnectionLoss(DisconnectCause::NetworkLost, "keep-alive timeout");

    ASSERT_EQ(fatalFuture.wait_for(5s), std::future_status::ready);
    EXPECT_NE(fatalFuture.get().find("10 attempt"), std::string::npos);
    EXPECT_TRUE(session_->waitForState(SessionState::Disconnected, 1s));
    EXPECT_EQ(mqtt_->connectCalls(), 11);

    auto delays = sleeper_->delays();
    ASSERT_EQ(delays.size(), 10u);
    EXPECT_EQ(delays[0], 1000ms);
    EXPECT_EQ(delays[5], 32000ms);
    EXPECT_EQ(delays[6], 60000ms);
    EXPECT_EQ(delays[9], 60000ms);
}

TEST_F(SessionManagerTest, CleanDisconnectDoesNotReconnect) {
    build();
    session_->connect();
    session_->disconnect();

    EXPECT_EQ(session_->state(), SessionState::Disconnected);
    EXPECT_EQ(session_->lastDisconnectCause(), DisconnectCause::ClientRequested);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(session_->state(), SessionState::Disconnected);
    EXPECT_EQ(mqtt_->connectCalls(), 1);
    EXPECT_TRUE(sleeper_->delays().empty());
}

TEST_F(SessionManagerTest, DisconnectIsAnnouncedOnce) {
    build();
    session_->connect();

    ::testing::internal::CaptureStdout();
    session_->disconnect();
    session_->disconnect();
    std::string output = ::testing::internal::GetCapturedStdout();

    const std::string line = "[MQTT] Disconnected from nRF Cloud";
    auto first = output.find(line);
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(output.find(line, first + line.size()), std::string::npos);
}

TEST_F(SessionManagerTest, DropWithoutAutoReconnectEndsSession) {
    SessionSettings settings;
    settings.autoReconnect = false;
    build(settings);
    session_->connect();

    mqtt_->simulateConnectionLoss(DisconnectCause::NotAuthorized, "Not authorized");

    EXPECT_EQ(session_->state(), SessionState::Disconnected);
    EXPECT_EQ(session_->lastDisconnectCause(), DisconnectCause::NotAuthorized);
    EXPECT_FALSE(context_->connectionInfo().has_value());
    EXPECT_EQ(mqtt_->connectCalls(), 1);
}

TEST_F(SessionManagerTest, PublishRequiresConnectedSession) {
    build();
    EXPECT_THROW(session_->publish(makeAlert(1, 0, 0, "Button pressed")), PublishError);
    EXPECT_TRUE(mqtt_->getPublishedMessages().empty());
}

TEST_F(SessionManagerTest, PublishUsesTelemetryTopic) {
    build();
    session_->connect();
    session_->publish(makeCounter(1700000000000, 3));

    auto messages = mqtt_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].topic, "prod/tenant/m/d/dev-1/d2c");
    EXPECT_EQ(messages[0].qos, 1);
    EXPECT_EQ(messages[0].payload, R"({"appId":"COUNT","ts":1700000000000,"data":3})");
}

TEST_F(SessionManagerTest, TransportRefusalIsPublishError) {
    build();
    session_->connect();
    mqtt_->setFailPublish(true);
    EXPECT_THROW(session_->publish(makeCounter(1, 0)), PublishError);
    EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionManagerTest, SubscribeGrantedRecordsControlTopic) {
    build();
    session_->connect();
    session_->subscribeControlTopic();

    auto subscriptions = mqtt_->subscriptions();
    ASSERT_EQ(subscriptions.size(), 1u);
    EXPECT_EQ(subscriptions[0], "prod/tenant/m/d/dev-1/+/r");
}

TEST_F(SessionManagerTest, SubscribeDeniedThrows) {
    build();
    session_->connect();
    mqtt_->setSubscribeBehavior(sim::SubscribeBehavior::Deny);

    EXPECT_THROW(session_->subscribeControlTopic(), ConnectionError);
    EXPECT_EQ(session_->state(), SessionState::Connected);
}

TEST_F(SessionManagerTest, SubscribeDropThrows) {
    SessionSettings settings;
    settings.autoReconnect = false;
    build(settings);
    session_->connect();
    mqtt_->setSubscribeBehavior(sim::SubscribeBehavior::DropConnection);

    EXPECT_THROW(session_->subscribeControlTopic(), ConnectionError);
    EXPECT_EQ(session_->state(), SessionState::Disconnected);
    EXPECT_EQ(session_->lastDisconnectCause(), DisconnectCause::NetworkLost);
}

TEST_F(SessionManagerTest, InboundMessagesReachHandler) {
    build();
    std::string receivedTopic;
    session_->setMessageHandler([&receivedTopic](const MqttMessage& message) {
        receivedTopic = message.topic;
    });
    session_->connect();

    mqtt_->injectMessage("prod/tenant/m/d/dev-1/cfg/r", "{}");
    EXPECT_EQ(receivedTopic, "prod/tenant/m/d/dev-1/cfg/r");
}
