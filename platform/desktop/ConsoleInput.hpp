/**
 * @file ConsoleInput.hpp
 * @brief Keyboard producer for the simulator's command queue
 *
 * Reads line-based input from a file descriptor on its own thread and pushes
 * the mapped command for the first non-blank key of each line. The thread
 * polls so it notices stop() within one poll period, and the destructor
 * stops and joins it on every exit path.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "domain/CommandQueue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

namespace nrfsim {

class ConsoleInput {
public:
    static constexpr std::chrono::milliseconds kPollPeriod{200};

    explicit ConsoleInput(std::shared_ptr<domain::CommandQueue> commands, int fd = STDIN_FILENO);
    ~ConsoleInput();

    ConsoleInput(const ConsoleInput&) = delete;
    ConsoleInput& operator=(const ConsoleInput&) = delete;

    void stop();

    /// False once the reader has seen quit, end of input, or stop()
    bool running() const { return running_.load(); }

private:
    void loop();
    bool handleLine(const std::string& line);

    std::shared_ptr<domain::CommandQueue> commands_;
    int fd_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{true};
    std::thread thread_;
};

} // namespace nrfsim
