#pragma once

#include "session.hpp"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

using SessionPtr = std::shared_ptr<const Session>;

struct SessionHooks {
    std::function<void(const Session&)> on_created;
    std::function<void(const std::string& session_id)> on_deleted;
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual void put(SessionPtr session) = 0;
    // nullptr when absent.
    virtual SessionPtr get(const std::string& id) = 0;
    // False when the id was unknown; nothing changes in that case.
    virtual bool remove(const std::string& id) = 0;
    virtual size_t size() const = 0;

    // Throws SessionNotFound.
    SessionPtr require(const std::string& id);

    void set_hooks(SessionHooks hooks) { hooks_ = std::move(hooks); }

protected:
    void notify_created(const Session& session) const;
    void notify_deleted(const std::string& id) const;

private:
    SessionHooks hooks_;
};

// Evicts the oldest session once max_sessions is exceeded (0 = unbounded).
class InMemorySessionStore : public SessionStore {
public:
    explicit InMemorySessionStore(size_t max_sessions = 0);

    void put(SessionPtr session) override;
    SessionPtr get(const std::string& id) override;
    bool remove(const std::string& id) override;
    size_t size() const override;

private:
    size_t max_sessions_;
    mutable std::mutex mutex_;
    std::map<std::string, SessionPtr> sessions_;
    std::deque<std::string> order_;
};
