#include "CommandQueue.hpp"
#include <cctype>
#include <iostream>

namespace nrfsim::domain {

const char* commandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::SendAlert: return "SendAlert";
        case CommandType::SendTemperature: return "SendTemperature";
        case CommandType::SendGnss: return "SendGnss";
        case CommandType::SendCounter: return "SendCounter";
        case CommandType::PrintShadow: return "PrintShadow";
        case CommandType::PrintRoute: return "PrintRoute";
        case CommandType::Quit: return "Quit";
        case CommandType::ControlMessage: return "ControlMessage";
        case CommandType::SessionFatal: return "SessionFatal";
        default: return "Unknown";
    }
}

std::optional<CommandType> commandFromKey(char key) {
    switch (std::tolower(static_cast<unsigned char>(key))) {
        case 'a': return CommandType::SendAlert;
        case 't': return CommandType::SendTemperature;
        case 'g': return CommandType::SendGnss;
        case 'c': return CommandType::SendCounter;
        case 's': return CommandType::PrintShadow;
        case 'i': return CommandType::PrintRoute;
        case 'q': return CommandType::Quit;
        default: return std::nullopt;
    }
}

void CommandQueue::push(Command command) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push(std::move(command));
    }
    queueCv_.notify_one();
}

void CommandQueue::push(CommandType type) {
    Command command;
    command.type = type;
    push(std::move(command));
}

void CommandQueue::subscribe(CommandType type, Handler handler) {
    handlers_[type].push_back(std::move(handler));
}

void CommandQueue::unsubscribe(CommandType type) {
    handlers_.erase(type);
}

std::size_t CommandQueue::processCommands(std::chrono::milliseconds timeout) {
    if (processing_) return 0; // Handlers may not re-enter the loop

    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        queueCv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
    }

    processing_ = true;
    struct ResetFlag {
        bool& flag;
        ~ResetFlag() { flag = false; }
    } reset{processing_};

    std::size_t dispatched = 0;

    while (true) {
        Command command;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) break;

            command = std::move(queue_.front());
            queue_.pop();
        }

        auto it = handlers_.find(command.type);
        if (it == handlers_.end()) {
            std::cout << "[Simulator] No handler for " << commandTypeToString(command.type) << std::endl;
            continue;
        }

        // Copy so a handler may unsubscribe its own type
        std::vector<Handler> handlers = it->second;
        for (const auto& handler : handlers) {
            handler(command);
        }
        ++dispatched;
    }

    return dispatched;
}

std::size_t CommandQueue::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

} // namespace nrfsim::domain
