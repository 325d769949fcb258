#include "InteractionStore.hpp"
#include <fstream>
#include <iostream>
#include "JsonFile.hpp"

InteractionStore::InteractionStore(size_t max_events_per_user)
    : max_events_per_user_(max_events_per_user == 0 ? 1 : max_events_per_user) {}

std::shared_ptr<InteractionStore::UserHistory>
InteractionStore::find_history(const std::string& user_id) const {
    std::shared_lock<std::shared_mutex> lock(users_mutex_);
    auto it = histories_.find(user_id);
    if (it == histories_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<InteractionStore::UserHistory>
InteractionStore::history_for(const std::string& user_id) {
    auto existing = find_history(user_id);
    if (existing) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(users_mutex_);
    auto& slot = histories_[user_id];
    if (!slot) {
        slot = std::make_shared<UserHistory>();
    }
    return slot;
}

void InteractionStore::append(InteractionEvent event) {
    auto history = history_for(event.user_id);

    std::lock_guard<std::mutex> lock(history->mutex);
    history->events.push_front(std::move(event));
    while (history->events.size() > max_events_per_user_) {
        history->events.pop_back();
    }
}

std::vector<InteractionEvent> InteractionStore::events_for(const std::string& user_id) const {
    auto history = find_history(user_id);
    if (!history) {
        return {};
    }

    std::lock_guard<std::mutex> lock(history->mutex);
    return std::vector<InteractionEvent>(history->events.begin(), history->events.end());
}

std::unordered_map<std::string, std::vector<InteractionEvent>> InteractionStore::snapshot() const {
    // Collect handles first so the outer lock is not held while copying
    std::vector<std::pair<std::string, std::shared_ptr<UserHistory>>> handles;
    {
        std::shared_lock<std::shared_mutex> lock(users_mutex_);
        handles.reserve(histories_.size());
        for (const auto& [user_id, history] : histories_) {
            handles.emplace_back(user_id, history);
        }
    }

    std::unordered_map<std::string, std::vector<InteractionEvent>> copy;
    copy.reserve(handles.size());
    for (const auto& [user_id, history] : handles) {
        std::lock_guard<std::mutex> lock(history->mutex);
        copy[user_id].assign(history->events.begin(), history->events.end());
    }
    return copy;
}

std::unordered_set<std::string> InteractionStore::viewed_products(const std::string& user_id) const {
    std::unordered_set<std::string> viewed;
    for (const auto& event : events_for(user_id)) {
        if (event.kind == InteractionKind::View) {
            viewed.insert(event.product_id);
        }
    }
    return viewed;
}

size_t InteractionStore::user_count() const {
    std::shared_lock<std::shared_mutex> lock(users_mutex_);
    return histories_.size();
}

size_t InteractionStore::total_events() const {
    size_t total = 0;
    for (const auto& [user_id, events] : snapshot()) {
        total += events.size();
    }
    return total;
}

bool InteractionStore::save(const std::string& path) const {
    try {
        json j = json::object();
        for (const auto& [user_id, events] : snapshot()) {
            json list = json::array();
            for (const auto& event : events) {
                list.push_back(event_to_json(event));
            }
            j[user_id] = std::move(list);
        }

        return write_json_atomically(path, j, -1, "InteractionStore");

    } catch (const std::exception& e) {
        std::cerr << "[InteractionStore] Error saving interactions: " << e.what() << std::endl;
        return false;
    }
}

bool InteractionStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cout << "[InteractionStore] No interaction snapshot at " << path
                  << " (this is normal for fresh deployments)\n";
        return false;
    }

    try {
        json j;
        in >> j;

        std::unordered_map<std::string, std::shared_ptr<UserHistory>> loaded;
        size_t event_count = 0;

        for (auto& [user_id, list] : j.items()) {
            auto history = std::make_shared<UserHistory>();
            // Stored newest first; keep that order
            for (const auto& item : list) {
                if (history->events.size() >= max_events_per_user_) break;
                history->events.push_back(event_from_json(user_id, item));
                event_count++;
            }
            loaded[user_id] = std::move(history);
        }

        {
            std::unique_lock<std::shared_mutex> lock(users_mutex_);
            histories_ = std::move(loaded);
        }

        std::cout << "[InteractionStore] Loaded " << event_count << " events for "
                  << user_count() << " users\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[InteractionStore] Error parsing interaction snapshot: " << e.what() << "\n";
        return false;
    }
}
