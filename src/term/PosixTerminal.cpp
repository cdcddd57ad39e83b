#include "term/PosixTerminal.hpp"
#include "app/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {
constexpr const char* kEnterScreen = "\x1b[?1049h\x1b[?25l\x1b[2J";
constexpr const char* kLeaveScreen = "\x1b[0m\x1b[?25h\x1b[?1049l";
}

PosixTerminal::PosixTerminal(int inFd, int outFd)
    : inFd_(inFd), outFd_(outFd) {}

PosixTerminal::~PosixTerminal() {
    restore();
}

void PosixTerminal::open() {
    if (open_) return;

    if (!::isatty(inFd_))
        throw TerminalError("stdin is not a terminal");

    if (::tcgetattr(inFd_, &saved_) != 0)
        throw TerminalError(std::string("tcgetattr failed: ") + std::strerror(errno));
    haveSaved_ = true;

    ::termios raw = saved_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN]  = 0;
    raw.c_cc[VTIME] = 0;

    if (::tcsetattr(inFd_, TCSAFLUSH, &raw) != 0)
        throw TerminalError(std::string("tcsetattr failed: ") + std::strerror(errno));

    open_ = true;
    write(kEnterScreen);
    flush();
    spdlog::info("Terminal: raw mode on ({}x{})", size().width, size().height);
}

void PosixTerminal::restore() {
    if (!open_) return;
    open_ = false;

    {
        std::lock_guard lock(outMtx_);
        outBuf_ += kLeaveScreen;
        std::string data;
        data.swap(outBuf_);
        try {
            writeAll(data);
        } catch (const TerminalError& e) {
            spdlog::error("Terminal: restore write failed: {}", e.what());
        }
    }

    if (haveSaved_ && ::tcsetattr(inFd_, TCSAFLUSH, &saved_) != 0)
        spdlog::error("Terminal: tcsetattr restore failed: {}", std::strerror(errno));
    spdlog::info("Terminal: restored");
}

TerminalSize PosixTerminal::size() const {
    ::winsize ws{};
    if (::ioctl(outFd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
        return {ws.ws_col, ws.ws_row};
    return {};
}

void PosixTerminal::write(std::string_view bytes) {
    std::lock_guard lock(outMtx_);
    outBuf_.append(bytes.data(), bytes.size());
}

void PosixTerminal::flush() {
    std::string data;
    {
        std::lock_guard lock(outMtx_);
        data.swap(outBuf_);
    }
    writeAll(data);
}

void PosixTerminal::writeAll(const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(outFd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TerminalError(std::string("write failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
}

std::string PosixTerminal::readInput(int timeoutMs) {
    ::pollfd pfd{};
    pfd.fd = inFd_;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
        if (errno == EINTR) return {};
        throw TerminalError(std::string("poll failed: ") + std::strerror(errno));
    }
    if (rc == 0 || !(pfd.revents & POLLIN)) return {};

    char buf[256];
    ssize_t n = ::read(inFd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return {};
        throw TerminalError(std::string("read failed: ") + std::strerror(errno));
    }
    return std::string(buf, static_cast<size_t>(n));
}
