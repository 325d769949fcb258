#pragma once
// InteractionStore.hpp
// Most recent interaction events per user, newest first, capped per user.
//
// Each user's history has its own lock, so appends for different users do
// not contend. The outer lock is only taken exclusively when a user is seen
// for the first time.

#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "InteractionEvent.hpp"

class InteractionStore {
public:
    explicit InteractionStore(size_t max_events_per_user = 100);

    // Thread-safe: prepend event to its user's history, dropping the oldest
    // entries beyond the cap
    void append(InteractionEvent event);

    // Copy of one user's events, newest first (empty for unknown users)
    std::vector<InteractionEvent> events_for(const std::string& user_id) const;

    // Copy of every user's history, taken user by user
    std::unordered_map<std::string, std::vector<InteractionEvent>> snapshot() const;

    // Product ids the user has a stored view event for
    std::unordered_set<std::string> viewed_products(const std::string& user_id) const;

    size_t user_count() const;
    size_t total_events() const;
    size_t max_events_per_user() const { return max_events_per_user_; }

    // Persist / restore: {user_id: [{product_id, kind, timestamp, duration}, ...]}
    bool save(const std::string& path) const;
    bool load(const std::string& path);

private:
    struct UserHistory {
        mutable std::mutex mutex;
        std::deque<InteractionEvent> events;
    };

    std::shared_ptr<UserHistory> find_history(const std::string& user_id) const;
    std::shared_ptr<UserHistory> history_for(const std::string& user_id);

    size_t max_events_per_user_;
    mutable std::shared_mutex users_mutex_;
    std::unordered_map<std::string, std::shared_ptr<UserHistory>> histories_;
};
