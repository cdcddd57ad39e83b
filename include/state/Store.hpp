#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

struct DispatchResult {
    bool        success = false;
    std::string error;       // empty on success
};

class Store;

// Handed to action handlers. The only way to mutate store state.
class ActionContext {
public:
    nlohmann::json getState(const std::string& path = "") const;

    // Each key of partial is a dot path; changed values notify that
    // path's subscribers before this returns.
    void updateState(const nlohmann::json& partial);

    // Re-entrant: runs the nested action immediately
    DispatchResult dispatch(const std::string& name,
                            const nlohmann::json& payload = nullptr);

    const std::string& action() const { return action_; }

private:
    friend class Store;
    ActionContext(Store& store, std::string action)
        : store_(store), action_(std::move(action)) {}

    Store& store_;
    std::string action_;
};

// Reactive state container: JSON state addressed by dot paths, per-path
// subscribers, named actions and a bounded dispatch history.
// Single-threaded; owned by the frame loop.
class Store {
public:
    using SubscriptionId = uint64_t;
    using Subscriber = std::function<void(const nlohmann::json& oldValue,
                                          const nlohmann::json& newValue,
                                          const std::string& path)>;
    using ActionHandler = std::function<void(ActionContext& ctx,
                                             const nlohmann::json& payload)>;

    struct HistoryEntry {
        std::string    action;
        nlohmann::json payload;
        nlohmann::json previous;
        nlohmann::json next;
        std::chrono::system_clock::time_point at;
    };

    explicit Store(nlohmann::json initial = nlohmann::json::object(),
                   size_t historyLimit = 100);

    // Whole state for an empty path; null when any segment is missing
    nlohmann::json getState(const std::string& path = "") const;

    // Calls handler once right away with (null, current, path)
    SubscriptionId subscribe(const std::string& path, Subscriber handler);

    // Unknown ids are ignored
    void unsubscribe(SubscriptionId id);

    // Re-registering a name replaces the previous handler
    void registerAction(const std::string& name, ActionHandler handler);
    bool hasAction(const std::string& name) const;

    // Never throws for handler failures
    DispatchResult dispatch(const std::string& name,
                            const nlohmann::json& payload = nullptr);

    const std::deque<HistoryEntry>& history() const { return history_; }
    void clearHistory() { history_.clear(); }
    size_t historyLimit() const { return historyLimit_; }

    size_t subscriberCount(const std::string& path) const;

private:
    friend class ActionContext;

    void updateState(const nlohmann::json& partial);
    void assign(const std::string& path, const nlohmann::json& value);
    void notify(const std::string& path, const nlohmann::json& oldValue,
                const nlohmann::json& newValue);
    void appendHistory(HistoryEntry entry);

    struct Subscription {
        SubscriptionId id;
        Subscriber     handler;
    };

    nlohmann::json state_;
    std::unordered_map<std::string, std::vector<Subscription>> subscribers_;
    std::unordered_map<SubscriptionId, std::string> subscriptionPaths_;
    std::unordered_map<std::string, ActionHandler> actions_;
    std::deque<HistoryEntry> history_;
    size_t historyLimit_;
    SubscriptionId nextId_ = 1;
};
