#include "app/Engine.hpp"
#include "app/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

Engine::Engine(ITerminal& term, EngineConfig config)
    : config_(std::move(config))
    , term_(term)
    , renderer_(term, frame_, config_.theme, config_.truecolor)
    , store_(nlohmann::json::object(), config_.historyLimit)
    , focus_(*this)
    , navigator_(*this)
    , notifications_(config_.notificationMs)
    , overlay_(notifications_)
    , inputQueue_(config_.inputQueueCapacity, config_.dropPolicy)
    , poller_(term, inputQueue_, config_.inputPollMs)
{
    auto sz = term_.size();
    frame_.resize(sz.width, sz.height);
    spdlog::debug("Engine: {} backend, {}x{}, {}ms frames",
                  term_.backendName(), sz.width, sz.height,
                  config_.frameIntervalMs);
}

Engine::~Engine() {
    poller_.stop();
    // Trees may already be gone; no blur hooks from here
    focus_.forget();
}

void Engine::requestRedraw(bool full) {
    dirty_ = true;
    if (full) fullRedraw_ = true;
}

uint64_t Engine::notify(const std::string& text, Notifications::Level level) {
    requestRedraw();
    return notifications_.push(text, level);
}

std::unique_ptr<Node> Engine::detach(Node& parent, Node* child) {
    if (child) focus_.releaseSubtree(*child);
    auto out = parent.removeChild(child);
    if (out) requestRedraw();
    return out;
}

void Engine::discard(Node& parent, Node* child) {
    navigator_.retire(detach(parent, child));
}

// ── Input dispatch ──────────────────────────────────────────────────────

bool Engine::dispatchKey(const KeyEvent& ev) {
    // Input always produces a frame
    dirty_ = true;

    if (ev.key == Key::Tab && !ev.ctrl && !ev.alt) {
        focus_.tabNavigate(ev.shift);
        return true;
    }
    if (ev.key == Key::BackTab) {
        focus_.tabNavigate(true);
        return true;
    }

    Node* dialog = navigator_.activeDialog();
    if (dialog && dialog->handleInput(*this, ev))
        return true;

    // The handler above may have closed the dialog; re-read the roots
    Node* focused = focus_.current();
    dialog = navigator_.activeDialog();
    Screen* screen = navigator_.currentScreen();

    if (focused && focused != dialog && focused != screen &&
        focused->handleInput(*this, ev))
        return true;

    if (!navigator_.hasDialog() && screen)
        return navigator_.currentScreen()->handleInput(*this, ev);

    return false;
}

// ── Frame ───────────────────────────────────────────────────────────────

bool Engine::tick() {
    auto events = inputQueue_.drain();
    for (auto& ev : events) {
        if (!running_) break;
        try {
            bool consumed = dispatchKey(ev);
            if (!consumed)
                spdlog::debug("Engine: unhandled key {}", ev.describe());
        } catch (const InitializationError& e) {
            spdlog::error("Engine: {}", e.what());
            notifications_.push(e.what(), Notifications::Level::Error);
            requestRedraw(true);
        }
        // Trees closed by that handler can go now
        navigator_.flushRetired();
    }

    housekeeping();

    if (size_t dropped = inputQueue_.takeDroppedSinceLast())
        spdlog::warn("Engine: input queue overflow, {} event(s) dropped", dropped);

    if (!dirty_) return false;

    if (fullRedraw_) renderer_.invalidate();
    lastFrame_ = renderer_.renderFrame(navigator_.currentScreen(),
                                       navigator_.activeDialog(), &overlay_);
    dirty_ = false;
    fullRedraw_ = false;
    framesRendered_++;
    return true;
}

void Engine::housekeeping() {
    navigator_.flushRetired();

    if (notifications_.expire())
        requestRedraw();

    focus_.validate();
    checkResize();
}

void Engine::checkResize() {
    auto sz = term_.size();
    if (sz.width == frame_.width() && sz.height == frame_.height()) return;

    spdlog::info("Engine: resize {}x{} -> {}x{}",
                 frame_.width(), frame_.height(), sz.width, sz.height);
    frame_.resize(sz.width, sz.height);
    requestRedraw(true);
}

// ── Lifecycle ───────────────────────────────────────────────────────────

int Engine::run() {
    int rc = 0;
    try {
        term_.open();
        requestRedraw(true);
        poller_.start();
        spdlog::info("Engine: running ({} backend)", term_.backendName());

        const auto interval = std::chrono::milliseconds(config_.frameIntervalMs);

        while (running_) {
            auto start = std::chrono::steady_clock::now();

            tick();

            if (poller_.failed())
                throw TerminalError("input poller stopped unexpectedly");

            // Sleep for the rest of the frame, never less than 1ms
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            auto sleepFor = std::max(std::chrono::milliseconds(1), interval - elapsed);
            std::this_thread::sleep_for(sleepFor);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Engine: fatal error: {}", e.what());
        lastError_ = e.what();
        rc = 1;
    }

    shutdown();
    return rc;
}

void Engine::shutdown() {
    running_ = false;
    poller_.stop();
    term_.restore();
    spdlog::info("Engine: stopped after {} frames", framesRendered_);
}
