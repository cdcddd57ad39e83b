#pragma once
#include "input/InputQueue.hpp"
#include "input/KeyDecoder.hpp"
#include "term/ITerminal.hpp"
#include <atomic>
#include <string>
#include <thread>

// Background input context: waits on the terminal, decodes the bytes and
// pushes KeyEvents into the queue. Never touches the component tree.
class InputPoller {
public:
    InputPoller(ITerminal& term, InputQueue& queue, int pollMs = 50);
    ~InputPoller();

    void start();

    // Joins the thread; returns within one poll interval
    void stop();

    bool isRunning() const { return running_; }

    // Set when the thread ended because of an error
    bool failed() const { return failed_; }

    size_t eventsDecoded() const { return decoded_; }

private:
    void pollLoop();

    ITerminal&  term_;
    InputQueue& queue_;
    KeyDecoder  decoder_;
    int         pollMs_;

    std::thread thread_;
    std::atomic<bool>   running_{false};
    std::atomic<bool>   failed_{false};
    std::atomic<size_t> decoded_{0};
};
