#include "InteractionTracker.hpp"
#include <algorithm>
#include <iostream>
#include "EngineErrors.hpp"

InteractionTracker::InteractionTracker(
    InteractionStore& store,
    ProductRepository& products,
    ModelHandle& model,
    size_t event_threshold,
    std::chrono::seconds refresh_interval
) : store_(store),
    products_(products),
    model_(model),
    event_threshold_(event_threshold == 0 ? 1 : event_threshold),
    refresh_interval_(refresh_interval.count() > 0 ? refresh_interval : std::chrono::seconds(1)),
    last_refresh_time_(std::chrono::steady_clock::now())
{
    worker_thread_ = std::thread(&InteractionTracker::refresh_thread, this);
    std::cout << "[Tracker] Started with event_threshold=" << event_threshold_
              << ", refresh_interval=" << refresh_interval_.count() << "s\n";
}

InteractionTracker::~InteractionTracker() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        shutdown_ = true;
    }
    state_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

bool InteractionTracker::track(const std::string& user_id,
                               const std::string& product_id,
                               InteractionKind kind,
                               const InteractionMetadata& metadata) {
    try {
        Product product;
        if (!products_.get(product_id, product)) {
            throw UnknownProduct(product_id);
        }

        // 1. Product analytics side effect; a product removed since the
        // lookup leaves no event behind
        if (!products_.increment_counter(product_id, kind)) {
            throw UnknownProduct(product_id);
        }

        // 2. Append to the capped history
        InteractionEvent event;
        event.user_id = user_id;
        event.product_id = product_id;
        event.kind = kind;
        event.timestamp = Clock::now();
        event.duration_seconds = std::max(0.0, metadata.duration_seconds);
        event.source = metadata.source;
        store_.append(std::move(event));

        // 3. Refresh policy
        bool due = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            events_since_refresh_++;
            due = refresh_due_locked(std::chrono::steady_clock::now());
        }
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.events_tracked++;
        }
        if (due) {
            state_cv_.notify_one();
        }
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Tracker] Error tracking " << to_string(kind) << " of " << product_id
                  << " by " << user_id << ": " << e.what() << "\n";
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.tracking_failures++;
        return false;
    } catch (...) {
        std::cerr << "[Tracker] Unknown error tracking " << to_string(kind) << " of " << product_id
                  << " by " << user_id << "\n";
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.tracking_failures++;
        return false;
    }
}

bool InteractionTracker::refresh_due_locked(std::chrono::steady_clock::time_point now) const {
    if (now < retry_after_) {
        return false;
    }
    if (events_since_refresh_ >= event_threshold_) {
        return true;
    }
    return events_since_refresh_ > 0 && (now - last_refresh_time_) >= refresh_interval_;
}

bool InteractionTracker::refresh_due() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return refresh_due_locked(std::chrono::steady_clock::now());
}

void InteractionTracker::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        refresh_requested_ = true;
    }
    state_cv_.notify_one();
}

ModelHandle::RefreshResult InteractionTracker::refresh_now() {
    return run_refresh();
}

void InteractionTracker::set_refresh_listener(std::function<void(const ModelGeneration&)> listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    refresh_listener_ = std::move(listener);
}

InteractionTracker::Stats InteractionTracker::get_stats() const {
    Stats snapshot;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        snapshot = stats_;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot.events_since_refresh = events_since_refresh_;
    return snapshot;
}

void InteractionTracker::refresh_thread() {
    while (!shutdown_) {
        std::unique_lock<std::mutex> lock(state_mutex_);

        state_cv_.wait_for(lock, refresh_interval_, [this]() {
            return shutdown_ || refresh_requested_ ||
                   refresh_due_locked(std::chrono::steady_clock::now());
        });

        if (shutdown_) break;

        if (!refresh_requested_ && !refresh_due_locked(std::chrono::steady_clock::now())) {
            continue;
        }
        refresh_requested_ = false;

        lock.unlock();
        run_refresh();
    }
}

ModelHandle::RefreshResult InteractionTracker::run_refresh() {
    auto start = std::chrono::steady_clock::now();

    // Events arriving while the build runs stay counted for the next cycle
    size_t consumed = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        consumed = events_since_refresh_;
    }

    ModelHandle::RefreshResult result = model_.refresh();
    if (result == ModelHandle::RefreshResult::AlreadyRunning) {
        return result;
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_refresh_time_ = end;
        if (result == ModelHandle::RefreshResult::Published) {
            events_since_refresh_ -= std::min(consumed, events_since_refresh_);
            retry_after_ = std::chrono::steady_clock::time_point::min();
        } else {
            // Previous generation stays; try again on the next cycle
            retry_after_ = end + refresh_interval_;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        if (result == ModelHandle::RefreshResult::Published) {
            stats_.refreshes_completed++;
            stats_.avg_refresh_time_ms =
                (stats_.avg_refresh_time_ms * (stats_.refreshes_completed - 1) + duration_ms) /
                stats_.refreshes_completed;
        } else {
            stats_.refreshes_failed++;
        }
    }

    if (result == ModelHandle::RefreshResult::Published) {
        std::cout << "[Tracker] ✅ Refresh complete in " << duration_ms << "ms (generation "
                  << model_.generation() << ")\n";

        std::function<void(const ModelGeneration&)> listener;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listener = refresh_listener_;
        }
        auto generation = model_.current();
        if (listener && generation) {
            try {
                listener(*generation);
            } catch (const std::exception& e) {
                std::cerr << "[Tracker] Refresh listener failed: " << e.what() << "\n";
            } catch (...) {
                std::cerr << "[Tracker] Refresh listener failed with unknown error\n";
            }
        }
    }
    return result;
}
