#include "input/InputPoller.hpp"
#include <spdlog/spdlog.h>

InputPoller::InputPoller(ITerminal& term, InputQueue& queue, int pollMs)
    : term_(term), queue_(queue), pollMs_(pollMs) {}

InputPoller::~InputPoller() {
    stop();
}

void InputPoller::start() {
    if (running_) return;
    running_ = true;
    failed_  = false;
    thread_ = std::thread(&InputPoller::pollLoop, this);
    spdlog::debug("Input poller started ({}ms poll)", pollMs_);
}

void InputPoller::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Input poller stopped");
    }
}

void InputPoller::pollLoop() {
    try {
        while (running_) {
            std::string bytes = term_.readInput(pollMs_);

            // A quiet poll ends any pending lone ESC
            auto events = bytes.empty() ? decoder_.flush() : decoder_.feed(bytes);

            for (auto& ev : events) {
                decoded_++;
                if (!queue_.push(ev))
                    spdlog::debug("Input queue full, dropped an event");
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Input poller failed: {}", e.what());
        failed_ = true;
        running_ = false;
    }
}
