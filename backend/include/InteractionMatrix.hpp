#pragma once
// InteractionMatrix.hpp
// Dense user x product matrix of interaction scores in [0, 1].
// Row i belongs to user_ids[i], column j to product_ids[j]. A matrix is built
// once and never mutated; refresh replaces it with a new one.

#include <string>
#include <unordered_map>
#include <vector>
#include "InteractionStore.hpp"
#include "Records.hpp"

struct InteractionMatrix {
    std::vector<std::string> user_ids;
    std::vector<std::string> product_ids;
    std::vector<std::vector<double>> scores;   // scores[row][col]

    std::unordered_map<std::string, size_t> user_index;
    std::unordered_map<std::string, size_t> product_index;

    size_t rows() const { return user_ids.size(); }
    size_t cols() const { return product_ids.size(); }

    // Row of the user, or -1 when the user has no row
    int row_of(const std::string& user_id) const;

    // 0.0 when either id is absent
    double score(const std::string& user_id, const std::string& product_id) const;
};

class InteractionMatrixBuilder {
public:
    explicit InteractionMatrixBuilder(double recency_days = 30.0);

    // Full rebuild over the active users/products. Events for products outside
    // `products` are ignored; every user in `users` gets a row.
    InteractionMatrix build(
        const std::vector<UserRecord>& users,
        const std::vector<Product>& products,
        const std::unordered_map<std::string, std::vector<InteractionEvent>>& events_by_user,
        Clock::time_point now
    ) const;

    // Convenience overload reading a snapshot of the store
    InteractionMatrix build(
        const std::vector<UserRecord>& users,
        const std::vector<Product>& products,
        const InteractionStore& store,
        Clock::time_point now
    ) const;

    // exp(-days_since_event / recency_days); events in the future count as now
    double recency_score(Clock::time_point timestamp, Clock::time_point now) const;

    // min(duration / 60, 10) / 10
    static double duration_score(double duration_seconds);

    // recency * 0.7 + duration * 0.3
    double cell_score(const InteractionEvent& event, Clock::time_point now) const;

private:
    double recency_days_;
};
