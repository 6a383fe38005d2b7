#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace nrfsim::domain {

enum class CommandType {
    SendAlert,
    SendTemperature,
    SendGnss,
    SendCounter,
    PrintShadow,
    PrintRoute,
    Quit,
    ControlMessage,     ///< Inbound c2d message, topic and payload attached
    SessionFatal        ///< Reconnect budget spent, reason attached
};

struct Command {
    CommandType type = CommandType::Quit;
    std::string topic;
    std::string payload;
};

const char* commandTypeToString(CommandType type);

// Single-key console mapping: a t g c s i q
std::optional<CommandType> commandFromKey(char key);

/**
 * Multi-producer queue drained by the event loop thread. Keyboard, MQTT
 * callbacks and the reconnect worker push; only the loop dispatches.
 */
class CommandQueue {
public:
    using Handler = std::function<void(const Command&)>;

    CommandQueue() = default;

    void push(Command command);
    void push(CommandType type);

    void subscribe(CommandType type, Handler handler);
    void unsubscribe(CommandType type);

    // Waits up to timeout for the first command, then drains and dispatches
    // everything queued. Returns the number of commands dispatched.
    std::size_t processCommands(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    std::unordered_map<CommandType, std::vector<Handler>> handlers_;
    std::queue<Command> queue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueCv_;
    bool processing_ = false;
};

} // namespace nrfsim::domain
