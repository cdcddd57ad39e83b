#pragma once
#include "app/EngineConfig.hpp"
#include "app/Notifications.hpp"
#include "focus/FocusManager.hpp"
#include "input/InputPoller.hpp"
#include "input/InputQueue.hpp"
#include "nav/Navigator.hpp"
#include "render/FrameBuffer.hpp"
#include "render/Renderer.hpp"
#include "state/Store.hpp"
#include "term/ITerminal.hpp"
#include <atomic>
#include <memory>
#include <string>

// Frame loop owner and the context every hook receives.
//
// Threads: the input poller is the only other thread; it talks to the loop
// through the InputQueue. Everything else (tree, store, focus, navigator)
// is touched from the loop thread only.
class Engine {
public:
    explicit Engine(ITerminal& term, EngineConfig config = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Subsystems ──────────────────────────────────────────────────────

    Store&         store()         { return store_; }
    FocusManager&  focus()         { return focus_; }
    Navigator&     navigator()     { return navigator_; }
    Notifications& notifications() { return notifications_; }
    InputQueue&    inputQueue()    { return inputQueue_; }
    FrameBuffer&   frame()         { return frame_; }
    Renderer&      renderer()      { return renderer_; }
    ITerminal&     terminal()      { return term_; }

    const EngineConfig& config() const { return config_; }
    const Theme&        theme() const  { return config_.theme; }

    // ── Frame loop ──────────────────────────────────────────────────────

    // Marks the next tick for rendering; full repaints every cell
    void requestRedraw(bool full = false);
    bool needsRedraw() const { return dirty_; }

    // Queue a key as if typed (any thread)
    bool postKey(const KeyEvent& ev) { return inputQueue_.push(ev); }

    // Tab/Shift-Tab move focus; everything else goes to the active dialog,
    // the focused node, then the screen (not while a dialog is open).
    // Returns true once someone consumed the key.
    bool dispatchKey(const KeyEvent& ev);

    // One iteration: input, housekeeping, render. Returns true if a frame
    // was rendered.
    bool tick();

    // Opens the terminal, starts the poller and ticks until stop().
    // Returns 0 on a clean exit, 1 after a fatal error. The terminal is
    // restored either way.
    int run();

    // Safe from signal handlers and other threads
    void stop() { running_ = false; }
    bool isRunning() const { return running_; }

    // ── Helpers for handlers ────────────────────────────────────────────

    uint64_t notify(const std::string& text,
                    Notifications::Level level = Notifications::Level::Info);

    // Removes child from parent, releasing focus first if it lives there
    std::unique_ptr<Node> detach(Node& parent, Node* child);

    // detach() and destroy once the current dispatch is over, so a node
    // may remove itself from inside its own handler
    void discard(Node& parent, Node* child);

    const std::string& lastError() const { return lastError_; }
    const FrameStats&  lastFrame() const { return lastFrame_; }
    uint64_t           framesRendered() const { return framesRendered_; }

private:
    void checkResize();
    void housekeeping();
    void shutdown();

    EngineConfig config_;
    ITerminal&   term_;
    FrameBuffer  frame_;
    Renderer     renderer_;

    Store         store_;
    FocusManager  focus_;       // must outlive navigator_
    Navigator     navigator_;
    Notifications notifications_;
    NotificationArea overlay_;

    InputQueue  inputQueue_;
    InputPoller poller_;

    std::atomic<bool> running_{true};
    bool dirty_      = true;
    bool fullRedraw_ = true;

    std::string lastError_;
    FrameStats  lastFrame_;
    uint64_t    framesRendered_ = 0;
};
