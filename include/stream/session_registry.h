/**
 * @file session_registry.h
 * @brief Process-wide list of live sessions so shutdown can stop them all
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "stream/session_manager.h"

namespace dhanstream::stream {

class SessionRegistry {
public:
    static SessionRegistry& instance();

    /// Holds a weak reference; expired sessions are pruned on access.
    void add(const std::shared_ptr<SessionManager>& session);
    void remove(const SessionManager* session);

    /// stop() every live session; returns how many were stopped.
    std::size_t stop_all();

    std::size_t size();

private:
    void prune_locked();

    std::mutex mutex_;
    std::vector<std::weak_ptr<SessionManager>> sessions_;
};

} // namespace dhanstream::stream
