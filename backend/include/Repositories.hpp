#pragma once
// Repositories.hpp
// Narrow interfaces over the platform's product and user stores.
// Implementations may throw TransientLookupFailure when a read fails.

#include <string>
#include <vector>
#include "Records.hpp"
#include "InteractionEvent.hpp"

class ProductRepository {
public:
    virtual ~ProductRepository() = default;

    // Copies of every product whose status is "active"
    virtual std::vector<Product> active_products() const = 0;

    // Returns false if the id is unknown
    virtual bool get(const std::string& product_id, Product& out) const = 0;

    // Bumps the analytics counter matching `kind`; false if the id is unknown
    virtual bool increment_counter(const std::string& product_id, InteractionKind kind) = 0;
};

class UserRepository {
public:
    virtual ~UserRepository() = default;

    // Copies of every user with is_active set
    virtual std::vector<UserRecord> active_users() const = 0;

    // Returns false if the id is unknown
    virtual bool get(const std::string& user_id, UserRecord& out) const = 0;
};
