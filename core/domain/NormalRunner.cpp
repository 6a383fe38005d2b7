#include "NormalRunner.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace nrfsim::domain {

namespace {

constexpr const char* kStartupDescription = "Device simulator started";
constexpr const char* kButtonDescription = "Button pressed";

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

NormalRunner::NormalRunner(std::shared_ptr<SessionManager> session,
                           std::shared_ptr<TelemetryScheduler> scheduler,
                           std::shared_ptr<CommandQueue> commands,
                           std::string deviceId,
                           std::string appVersion)
    : session_(std::move(session))
    , scheduler_(std::move(scheduler))
    , commands_(std::move(commands))
    , deviceId_(std::move(deviceId))
    , appVersion_(std::move(appVersion)) {
    registerHandlers();

    auto queue = commands_;
    session_->setMessageHandler([queue](const MqttMessage& message) {
        Command command;
        command.type = CommandType::ControlMessage;
        command.topic = message.topic;
        command.payload = message.payload;
        queue->push(std::move(command));
    });
    session_->setFatalCallback([queue](const ConnectionError& error) {
        Command command;
        command.type = CommandType::SessionFatal;
        command.payload = error.what();
        queue->push(std::move(command));
    });
}

NormalRunner::~NormalRunner() {
    session_->setMessageHandler(nullptr);
    session_->setFatalCallback(nullptr);

    for (auto type : {CommandType::SendAlert, CommandType::SendTemperature, CommandType::SendGnss,
                      CommandType::SendCounter, CommandType::PrintShadow, CommandType::PrintRoute,
                      CommandType::Quit, CommandType::ControlMessage, CommandType::SessionFatal}) {
        commands_->unsubscribe(type);
    }
}

void NormalRunner::registerHandlers() {
    commands_->subscribe(CommandType::SendAlert, [this](const Command&) {
        scheduler_->sendAlert(0, 0, kButtonDescription);
    });
    commands_->subscribe(CommandType::SendTemperature, [this](const Command&) {
        scheduler_->sendTemperature();
    });
    commands_->subscribe(CommandType::SendGnss, [this](const Command&) {
        scheduler_->sendGnss();
    });
    commands_->subscribe(CommandType::SendCounter, [this](const Command&) {
        scheduler_->sendCounter();
    });
    commands_->subscribe(CommandType::PrintShadow, [this](const Command&) {
        printShadow();
    });
    commands_->subscribe(CommandType::PrintRoute, [this](const Command&) {
        printRoute();
    });
    commands_->subscribe(CommandType::Quit, [this](const Command&) {
        std::cout << "Shutting down..." << std::endl;
        running_ = false;
    });
    commands_->subscribe(CommandType::ControlMessage, [this](const Command& command) {
        handleMessage(command.topic, command.payload);
    });
    commands_->subscribe(CommandType::SessionFatal, [this](const Command& command) {
        std::cerr << "[Session] Giving up: " << command.payload << std::endl;
        fatalReason_ = command.payload;
        running_ = false;
    });
}

void NormalRunner::start() {
    session_->connect();

    try {
        session_->subscribeControlTopic();
    } catch (const ConnectionError& e) {
        std::cerr << "[MQTT] c2d subscribe failed, cloud commands unavailable: " << e.what() << std::endl;
    }

    std::cout << std::endl
              << "============================================================" << std::endl
              << "  nRF Cloud Device Simulator Running" << std::endl
              << "  Device: " << deviceId_ << std::endl
              << "============================================================" << std::endl
              << "  Commands:" << std::endl
              << "    a - Send alert (button press)" << std::endl
              << "    t - Send temperature now" << std::endl
              << "    g - Send GPS location now" << std::endl
              << "    c - Send test counter" << std::endl
              << "    s - Print current shadow config" << std::endl
              << "    i - Print route info" << std::endl
              << "    q - Quit" << std::endl
              << "============================================================" << std::endl
              << std::endl;

    scheduler_->sendDeviceInfo(appVersion_);
    scheduler_->sendAlert(1, 0, kStartupDescription);
    scheduler_->start();

    running_ = true;
    stopped_ = false;
}

void NormalRunner::pump(std::chrono::milliseconds maxWait) {
    auto wait = std::min(maxWait, scheduler_->timeUntilNextDue());
    if (!scheduler_->isRunning()) {
        wait = maxWait;
    }
    commands_->processCommands(wait);
    if (running_) {
        scheduler_->tick();
    }
}

void NormalRunner::run() {
    start();

    while (running_) {
        if (interruptCheck_ && interruptCheck_()) {
            std::cout << "\nShutting down..." << std::endl;
            running_ = false;
            break;
        }
        pump(tickInterval_);
    }

    shutdown();

    if (fatalReason_) {
        throw ConnectionError(*fatalReason_);
    }
}

void NormalRunner::shutdown() {
    if (stopped_) return;
    stopped_ = true;
    running_ = false;

    scheduler_->stop();
    session_->disconnect();
}

bool NormalRunner::isControlTopic(const std::string& topic) const {
    return endsWith(topic, "/r") && topic.find("/m/d/" + deviceId_ + "/") != std::string::npos;
}

void NormalRunner::handleMessage(const std::string& topic, const std::string& payload) {
    auto message = JsonCodec::parseControlMessage(payload);
    if (!message) {
        std::cout << "[MQTT] Received non-JSON on " << topic << ": " << payload.substr(0, 100) << std::endl;
        return;
    }

    if (!isControlTopic(topic)) {
        std::cout << "[MQTT] Message on " << topic << ": " << payload.substr(0, 200) << std::endl;
        return;
    }

    std::cout << "[C2D] Received: appId=" << message->appId
              << ", messageType=" << message->messageType << std::endl;
    std::cout << "[C2D] Payload: " << payload.substr(0, 300) << std::endl;

    if (message->appId == "MODEM" && message->messageType == "CMD") {
        std::string command = message->data.is_string() ? message->data.get<std::string>() : "";
        std::cout << "[C2D] AT command request: " << command << std::endl;
        handleModemCommand(command);
    } else if (message->appId == "CONFIG") {
        scheduler_->applyConfig(JsonCodec::jsonToShadowConfigUpdate(message->data));
    }
}

std::string NormalRunner::atResponse(const std::string& command) const {
    const std::map<std::string, std::string> responses = {
        {"AT+CGMR", "mfw_nrf91x1_2.0.2"},
        {"AT+CGSN", deviceId_},
        {"AT%HWVERSION", "nRF9151 LACA AAA (simulator)"},
        {"AT+CIMI", "440100000000000"},
    };

    auto it = responses.find(trim(command));
    return it != responses.end() ? it->second : "ERROR";
}

void NormalRunner::handleModemCommand(const std::string& command) {
    std::string response = atResponse(command);
    if (scheduler_->sendModemResponse(response)) {
        std::cout << "[AT] Response to '" << command << "': " << response << std::endl;
    }
}

void NormalRunner::printShadow() const {
    std::cout << "[Config] " << JsonCodec::shadowConfigToJson(scheduler_->shadow()).dump(2) << std::endl;
}

void NormalRunner::printRoute() const {
    PositionSample position = scheduler_->currentRoutePosition();
    const RouteInterpolator& route = scheduler_->route();

    std::ostringstream line;
    line << std::fixed << std::setprecision(6)
         << "[Route] Segment " << position.segmentIndex + 1 << "/" << route.segmentCount()
         << " toward " << route.waypoints()[position.segmentIndex + 1].name
         << " at " << position.lat << ", " << position.lon;
    std::cout << line.str() << std::endl;
    std::cout << "[Route] Interval: " << scheduler_->shadow().locationInterval << "s" << std::endl;
}

} // namespace nrfsim::domain
