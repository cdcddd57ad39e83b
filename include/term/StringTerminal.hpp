#pragma once
#include "term/ITerminal.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

// In-memory terminal: records everything flushed and serves scripted
// input. Used for headless runs and tests.
class StringTerminal : public ITerminal {
public:
    explicit StringTerminal(TerminalSize size = {80, 24}) : size_(size) {}

    void open() override    { open_ = true; }
    void restore() override { open_ = false; restored_++; }
    bool isOpen() const override { return open_; }

    TerminalSize size() const override {
        std::lock_guard lock(mtx_);
        return size_;
    }

    void resize(TerminalSize s) {
        std::lock_guard lock(mtx_);
        size_ = s;
    }

    void write(std::string_view bytes) override {
        std::lock_guard lock(mtx_);
        pending_.append(bytes.data(), bytes.size());
    }

    void flush() override {
        std::lock_guard lock(mtx_);
        output_ += pending_;
        lastFlush_ = pending_;
        pending_.clear();
        flushes_++;
    }

    // Queue raw bytes for readInput()
    void feedInput(const std::string& bytes) {
        {
            std::lock_guard lock(mtx_);
            input_.push_back(bytes);
        }
        cv_.notify_all();
    }

    std::string readInput(int timeoutMs) override {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                     [this] { return !input_.empty(); });
        if (input_.empty()) return {};
        std::string out = input_.front();
        input_.pop_front();
        return out;
    }

    std::string backendName() const override { return "string"; }

    // Everything flushed so far
    std::string output() const {
        std::lock_guard lock(mtx_);
        return output_;
    }

    // Bytes of the most recent flush
    std::string lastFlush() const {
        std::lock_guard lock(mtx_);
        return lastFlush_;
    }

    void clearOutput() {
        std::lock_guard lock(mtx_);
        output_.clear();
        lastFlush_.clear();
    }

    int flushCount() const {
        std::lock_guard lock(mtx_);
        return flushes_;
    }

    int restoreCount() const { return restored_; }

private:
    TerminalSize size_;
    bool open_ = false;
    int restored_ = 0;
    int flushes_  = 0;
    std::string pending_;
    std::string output_;
    std::string lastFlush_;
    std::deque<std::string> input_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};
