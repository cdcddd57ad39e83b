#include "state/Store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) dot = path.size();
        parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool isIndex(const std::string& s) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s)
        if (c < '0' || c > '9') return false;
    return true;
}

} // namespace

// ── ActionContext ───────────────────────────────────────────────────────

nlohmann::json ActionContext::getState(const std::string& path) const {
    return store_.getState(path);
}

void ActionContext::updateState(const nlohmann::json& partial) {
    store_.updateState(partial);
}

DispatchResult ActionContext::dispatch(const std::string& name,
                                       const nlohmann::json& payload) {
    spdlog::debug("Store: '{}' dispatches nested '{}'", action_, name);
    return store_.dispatch(name, payload);
}

// ── Store ───────────────────────────────────────────────────────────────

Store::Store(nlohmann::json initial, size_t historyLimit)
    : state_(std::move(initial))
    , historyLimit_(historyLimit)
{
    if (!state_.is_object())
        state_ = nlohmann::json::object();
}

nlohmann::json Store::getState(const std::string& path) const {
    if (path.empty()) return state_;

    const nlohmann::json* cur = &state_;
    for (auto& seg : splitPath(path)) {
        if (cur->is_object()) {
            auto it = cur->find(seg);
            if (it == cur->end()) return nullptr;
            cur = &*it;
        } else if (cur->is_array() && isIndex(seg)) {
            size_t idx = std::stoul(seg);
            if (idx >= cur->size()) return nullptr;
            cur = &(*cur)[idx];
        } else {
            return nullptr;
        }
    }
    return *cur;
}

Store::SubscriptionId Store::subscribe(const std::string& path, Subscriber handler) {
    SubscriptionId id = nextId_++;
    subscribers_[path].push_back({id, handler});
    subscriptionPaths_[id] = path;

    try {
        handler(nullptr, getState(path), path);
    } catch (const std::exception& e) {
        spdlog::error("Store: subscriber on '{}' threw on initial call: {}",
                      path, e.what());
    } catch (...) {
        spdlog::error("Store: subscriber on '{}' threw a non-standard exception on initial call",
                      path);
    }
    return id;
}

void Store::unsubscribe(SubscriptionId id) {
    auto it = subscriptionPaths_.find(id);
    if (it == subscriptionPaths_.end()) return;

    auto subs = subscribers_.find(it->second);
    if (subs != subscribers_.end()) {
        auto& list = subs->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                       [id](const Subscription& s) { return s.id == id; }),
                   list.end());
        if (list.empty()) subscribers_.erase(subs);
    }
    subscriptionPaths_.erase(it);
}

void Store::registerAction(const std::string& name, ActionHandler handler) {
    if (actions_.count(name))
        spdlog::debug("Store: action '{}' re-registered", name);
    actions_[name] = std::move(handler);
}

bool Store::hasAction(const std::string& name) const {
    return actions_.count(name) > 0;
}

DispatchResult Store::dispatch(const std::string& name,
                               const nlohmann::json& payload) {
    auto it = actions_.find(name);
    if (it == actions_.end()) {
        spdlog::warn("Store: unknown action '{}'", name);
        return {false, "unknown action: " + name};
    }

    // Copy: the handler may re-register its own name
    ActionHandler handler = it->second;
    nlohmann::json before = state_;
    ActionContext ctx(*this, name);

    try {
        handler(ctx, payload);
    } catch (const std::exception& e) {
        spdlog::error("Store: action '{}' failed: {}", name, e.what());
        return {false, e.what()};
    } catch (...) {
        spdlog::error("Store: action '{}' threw a non-standard exception", name);
        return {false, "non-standard exception in action " + name};
    }

    appendHistory({name, payload, std::move(before), state_,
                   std::chrono::system_clock::now()});
    return {true, ""};
}

size_t Store::subscriberCount(const std::string& path) const {
    auto it = subscribers_.find(path);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void Store::updateState(const nlohmann::json& partial) {
    if (!partial.is_object())
        throw std::invalid_argument("updateState expects an object");

    for (auto it = partial.begin(); it != partial.end(); ++it) {
        const std::string& path = it.key();
        nlohmann::json old = getState(path);
        if (old == it.value()) continue;

        assign(path, it.value());
        notify(path, old, it.value());
    }
}

void Store::assign(const std::string& path, const nlohmann::json& value) {
    auto parts = splitPath(path);
    nlohmann::json* cur = &state_;
    for (size_t i = 0; i < parts.size(); i++) {
        const std::string& seg = parts[i];
        bool last = i + 1 == parts.size();

        if (cur->is_null()) *cur = nlohmann::json::object();

        if (cur->is_object()) {
            if (last) (*cur)[seg] = value;
            else      cur = &(*cur)[seg];
        } else if (cur->is_array() && isIndex(seg)) {
            // One past the end appends
            size_t idx = std::stoul(seg);
            if (idx > cur->size())
                throw std::invalid_argument("index " + seg + " out of range in '" + path + "'");
            if (idx == cur->size()) cur->push_back(nullptr);
            if (last) (*cur)[idx] = value;
            else      cur = &(*cur)[idx];
        } else {
            throw std::invalid_argument("'" + seg + "' in '" + path +
                                        "' does not name a member of " + cur->type_name());
        }
    }
}

void Store::notify(const std::string& path, const nlohmann::json& oldValue,
                   const nlohmann::json& newValue) {
    auto it = subscribers_.find(path);
    if (it == subscribers_.end()) return;

    // Handlers may (un)subscribe while we iterate
    auto subs = it->second;
    for (auto& s : subs) {
        if (!subscriptionPaths_.count(s.id)) continue;
        try {
            s.handler(oldValue, newValue, path);
        } catch (const std::exception& e) {
            spdlog::error("Store: subscriber on '{}' threw: {}", path, e.what());
        } catch (...) {
            spdlog::error("Store: subscriber on '{}' threw a non-standard exception", path);
        }
    }
}

void Store::appendHistory(HistoryEntry entry) {
    if (historyLimit_ == 0) return;
    history_.push_back(std::move(entry));
    while (history_.size() > historyLimit_)
        history_.pop_front();
}
