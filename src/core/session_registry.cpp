#include "session_registry.h"
#include "core/logger.h"

namespace eio::core {

    bool SessionRegistry::put(const std::string &id, std::shared_ptr<Session> session) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = sessions_.emplace(id, std::move(session));
        if (!inserted) {
            EIO_ERROR("Session id '{}' is already registered", id);
            return false;
        }
        EIO_TRACE("Registered session '{}' (live: {})", id, sessions_.size());
        return true;
    }

    std::shared_ptr<Session> SessionRegistry::get(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        return it != sessions_.end() ? it->second : nullptr;
    }

    bool SessionRegistry::remove(const std::string &id) {
        std::shared_ptr<Session> removed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) {
                return false;
            }
            // released outside the lock: the session destructor may call back in
            removed = std::move(it->second);
            sessions_.erase(it);
        }
        EIO_TRACE("Deregistered session '{}'", id);
        return true;
    }

    size_t SessionRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    std::vector<std::string> SessionRegistry::ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(sessions_.size());
        for (const auto &[id, _]: sessions_) {
            ids.push_back(id);
        }
        return ids;
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::shared_ptr<Session>> sessions;
        sessions.reserve(sessions_.size());
        for (const auto &[_, session]: sessions_) {
            sessions.push_back(session);
        }
        return sessions;
    }

}// namespace eio::core
