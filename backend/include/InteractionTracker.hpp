#pragma once
// InteractionTracker.hpp
// Write path: records interaction events, bumps product counters and
// schedules model refreshes.
//
// A background thread rebuilds the model once `event_threshold` events have
// arrived since the last refresh, or once `refresh_interval` has passed with
// at least one new event, whichever comes first.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "InteractionStore.hpp"
#include "ModelHandle.hpp"
#include "Repositories.hpp"

struct InteractionMetadata {
    double duration_seconds = 0.0;
    std::string source;
};

class InteractionTracker {
public:
    InteractionTracker(
        InteractionStore& store,
        ProductRepository& products,
        ModelHandle& model,
        size_t event_threshold = 50,
        std::chrono::seconds refresh_interval = std::chrono::seconds(300)
    );

    ~InteractionTracker();

    // Best effort: failures are logged and reported as false, never thrown
    bool track(const std::string& user_id,
               const std::string& product_id,
               InteractionKind kind,
               const InteractionMetadata& metadata = InteractionMetadata());

    // True when the threshold or interval policy says a rebuild is owed
    bool refresh_due() const;

    // Wake the worker for a refresh regardless of the policy
    void request_refresh();

    // Synchronous refresh on the caller's thread
    ModelHandle::RefreshResult refresh_now();

    // Called after every published generation (e.g. to persist state)
    void set_refresh_listener(std::function<void(const ModelGeneration&)> listener);

    struct Stats {
        size_t events_tracked = 0;
        size_t tracking_failures = 0;
        size_t refreshes_completed = 0;
        size_t refreshes_failed = 0;
        size_t events_since_refresh = 0;
        double avg_refresh_time_ms = 0.0;
    };
    Stats get_stats() const;

private:
    void refresh_thread();
    bool refresh_due_locked(std::chrono::steady_clock::time_point now) const;
    ModelHandle::RefreshResult run_refresh();

    InteractionStore& store_;
    ProductRepository& products_;
    ModelHandle& model_;

    size_t event_threshold_;
    std::chrono::seconds refresh_interval_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    size_t events_since_refresh_ = 0;
    bool refresh_requested_ = false;
    std::chrono::steady_clock::time_point last_refresh_time_;
    std::chrono::steady_clock::time_point retry_after_ = std::chrono::steady_clock::time_point::min();

    std::mutex listener_mutex_;
    std::function<void(const ModelGeneration&)> refresh_listener_;

    mutable std::mutex stats_mutex_;
    Stats stats_{};

    std::atomic<bool> shutdown_{false};
    std::thread worker_thread_;
};
