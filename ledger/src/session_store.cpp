#include "session_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <vector>

SessionPtr SessionStore::require(const std::string& id) {
    auto session = get(id);
    if (!session) {
        throw SessionNotFound(id);
    }
    return session;
}

void SessionStore::notify_created(const Session& session) const {
    if (!hooks_.on_created) return;
    try {
        hooks_.on_created(session);
    } catch (const std::exception& e) {
        spdlog::warn("Session created hook failed: {}", e.what());
    }
}

void SessionStore::notify_deleted(const std::string& id) const {
    if (!hooks_.on_deleted) return;
    try {
        hooks_.on_deleted(id);
    } catch (const std::exception& e) {
        spdlog::warn("Session deleted hook failed: {}", e.what());
    }
}

InMemorySessionStore::InMemorySessionStore(size_t max_sessions)
    : max_sessions_(max_sessions)
{}

void InMemorySessionStore::put(SessionPtr session) {
    if (!session) return;

    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool existed = sessions_.count(session->id) > 0;
        sessions_[session->id] = session;
        if (!existed) {
            order_.push_back(session->id);
        }

        while (max_sessions_ > 0 && sessions_.size() > max_sessions_ && !order_.empty()) {
            std::string oldest = order_.front();
            order_.pop_front();
            if (sessions_.erase(oldest) > 0) evicted.push_back(oldest);
        }
    }

    notify_created(*session);
    for (const auto& id : evicted) {
        spdlog::info("Evicted session {}", id);
        notify_deleted(id);
    }
}

SessionPtr InMemorySessionStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

bool InMemorySessionStore::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(id) == 0) return false;
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    }
    notify_deleted(id);
    return true;
}

size_t InMemorySessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
