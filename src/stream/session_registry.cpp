/**
 * @file session_registry.cpp
 */

#include "stream/session_registry.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace dhanstream::stream {

SessionRegistry& SessionRegistry::instance() {
    static SessionRegistry registry;
    return registry;
}

void SessionRegistry::prune_locked() {
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const auto& w) { return w.expired(); }),
                    sessions_.end());
}

void SessionRegistry::add(const std::shared_ptr<SessionManager>& session) {
    if (!session) return;
    std::lock_guard<std::mutex> lk(mutex_);
    prune_locked();
    sessions_.push_back(session);
}

void SessionRegistry::remove(const SessionManager* session) {
    std::lock_guard<std::mutex> lk(mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [session](const auto& w) {
                                       auto s = w.lock();
                                       return !s || s.get() == session;
                                   }),
                    sessions_.end());
}

std::size_t SessionRegistry::stop_all() {
    std::vector<std::shared_ptr<SessionManager>> live;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& w : sessions_) {
            if (auto s = w.lock()) live.push_back(std::move(s));
        }
        sessions_.clear();
    }
    for (const auto& s : live) {
        s->stop();
    }
    spdlog::info("[Registry] stopped {} session(s)", live.size());
    return live.size();
}

std::size_t SessionRegistry::size() {
    std::lock_guard<std::mutex> lk(mutex_);
    prune_locked();
    return sessions_.size();
}

} // namespace dhanstream::stream
