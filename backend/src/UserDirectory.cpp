#include "UserDirectory.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <mutex>

UserDirectory::UserDirectory() {}

bool UserDirectory::load(const std::string& users_path) {
    std::ifstream in(users_path);
    if (!in.is_open()) {
        std::cerr << "[Users] Warning: Could not open users file: " << users_path << std::endl;
        return false;
    }

    try {
        json j;
        in >> j;

        std::unordered_map<std::string, UserRecord> loaded;
        loaded.reserve(j.size());
        for (auto& [key, value] : j.items()) {
            loaded[key] = user_from_json(key, value);
        }

        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            users_ = std::move(loaded);
        }

        std::cout << "[Users] Loaded " << size() << " user profiles" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Users] Error parsing users file: " << e.what() << std::endl;
        return false;
    }
}

void UserDirectory::add_user(const UserRecord& user) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    users_[user.id] = user;
}

std::vector<UserRecord> UserDirectory::active_users() const {
    std::vector<UserRecord> active;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        active.reserve(users_.size());
        for (const auto& [id, user] : users_) {
            if (user.is_active) {
                active.push_back(user);
            }
        }
    }

    std::sort(active.begin(), active.end(), [](const UserRecord& a, const UserRecord& b) {
        return a.id < b.id;
    });
    return active;
}

bool UserDirectory::get(const std::string& user_id, UserRecord& out) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

size_t UserDirectory::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return users_.size();
}
