#pragma once

#include "session.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace eio::core {

    /**
     * @brief Live sessions by id. All members are safe to call from any thread.
     */
    class SessionRegistry {
    public:
        /**
         * @brief Register a session.
         * @return false if the id is already taken; the existing entry is kept
         */
        bool put(const std::string &id, std::shared_ptr<Session> session);

        /**
         * @return The session, or nullptr if the id is not registered
         */
        std::shared_ptr<Session> get(const std::string &id) const;

        /**
         * @brief Remove an entry. Removing an absent id is a no-op.
         * @return true if an entry was removed
         */
        bool remove(const std::string &id);

        size_t size() const;
        bool empty() const { return size() == 0; }

        // Ids in ascending order
        std::vector<std::string> ids() const;

        // Registered sessions in id order, for shutdown
        std::vector<std::shared_ptr<Session>> snapshot() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<Session>> sessions_;
    };

}// namespace eio::core
