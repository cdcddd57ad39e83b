#pragma once
#include <string>
#include <string_view>

struct TerminalSize {
    int width  = 80;
    int height = 24;

    bool operator==(const TerminalSize& o) const {
        return width == o.width && height == o.height;
    }
    bool operator!=(const TerminalSize& o) const { return !(*this == o); }
};

// Abstract terminal backend.
// Implementations: PosixTerminal (real tty), StringTerminal (in-memory).
class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Raw mode, alternate screen, hidden cursor. Throws TerminalError.
    virtual void open() = 0;

    // Undo everything open() did; safe to call more than once
    virtual void restore() = 0;

    virtual bool isOpen() const = 0;

    virtual TerminalSize size() const = 0;

    // Output is buffered until flush(). Throws TerminalError on I/O failure.
    virtual void write(std::string_view bytes) = 0;
    virtual void flush() = 0;

    // Called from the input thread. Waits up to timeoutMs and returns the
    // raw bytes read, or an empty string on timeout.
    virtual std::string readInput(int timeoutMs) = 0;

    virtual std::string backendName() const = 0;
};
