#pragma once
// UserDirectory.hpp
// Read-only view of user profiles, loaded from a JSON file keyed by user id.

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Repositories.hpp"

class UserDirectory : public UserRepository {
public:
    UserDirectory();

    // Load users from JSON file: {user_id: {preferences, behavior, ...}}
    bool load(const std::string& users_path);

    // Insert or replace a user
    void add_user(const UserRecord& user);

    std::vector<UserRecord> active_users() const override;
    bool get(const std::string& user_id, UserRecord& out) const override;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, UserRecord> users_;
};
