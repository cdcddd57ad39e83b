#pragma once
#include "term/ITerminal.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <termios.h>

// stdin/stdout tty backend using termios raw mode and poll(2)
class PosixTerminal : public ITerminal {
public:
    PosixTerminal(int inFd = 0, int outFd = 1);
    ~PosixTerminal() override;

    void open() override;
    void restore() override;
    bool isOpen() const override { return open_; }

    TerminalSize size() const override;

    void write(std::string_view bytes) override;
    void flush() override;

    std::string readInput(int timeoutMs) override;

    std::string backendName() const override { return "posix"; }

private:
    void writeAll(const std::string& data);

    int inFd_;
    int outFd_;
    std::atomic<bool> open_{false};
    bool haveSaved_ = false;
    ::termios saved_{};

    std::string outBuf_;
    std::mutex outMtx_;
};
