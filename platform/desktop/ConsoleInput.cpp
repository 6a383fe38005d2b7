#include "ConsoleInput.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>

namespace nrfsim {

ConsoleInput::ConsoleInput(std::shared_ptr<domain::CommandQueue> commands, int fd)
    : commands_(std::move(commands))
    , fd_(fd) {
    thread_ = std::thread(&ConsoleInput::loop, this);
}

ConsoleInput::~ConsoleInput() {
    stop();
}

void ConsoleInput::stop() {
    stopRequested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ConsoleInput::loop() {
    std::string pending;
    char buffer[256];

    while (!stopRequested_.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(kPollPeriod.count()));
        if (ready < 0 && errno != EINTR) {
            std::cerr << "[Simulator] Console poll failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (ready <= 0) {
            continue;
        }

        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[Simulator] Console read failed: " << std::strerror(errno) << std::endl;
            break;
        }
        if (n == 0) {
            std::cout << "[Simulator] stdin closed, keyboard commands disabled (Ctrl+C to stop)" << std::endl;
            break;
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline;
        bool quit = false;
        while (!quit && (newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            quit = handleLine(line);
        }
        if (quit) {
            break;
        }
    }
    running_.store(false);
}

bool ConsoleInput::handleLine(const std::string& line) {
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return false;
    }

    auto command = domain::commandFromKey(line[first]);
    if (!command) {
        std::cout << "Unknown command" << std::endl;
        return false;
    }
    commands_->push(*command);
    return *command == domain::CommandType::Quit;
}

} // namespace nrfsim
