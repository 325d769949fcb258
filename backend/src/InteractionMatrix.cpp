#include "InteractionMatrix.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

int InteractionMatrix::row_of(const std::string& user_id) const {
    auto it = user_index.find(user_id);
    if (it == user_index.end()) {
        return -1;
    }
    return static_cast<int>(it->second);
}

double InteractionMatrix::score(const std::string& user_id, const std::string& product_id) const {
    auto row = user_index.find(user_id);
    auto col = product_index.find(product_id);
    if (row == user_index.end() || col == product_index.end()) {
        return 0.0;
    }
    return scores[row->second][col->second];
}

InteractionMatrixBuilder::InteractionMatrixBuilder(double recency_days)
    : recency_days_(recency_days > 0.0 ? recency_days : 30.0) {}

double InteractionMatrixBuilder::recency_score(Clock::time_point timestamp, Clock::time_point now) const {
    double seconds = std::chrono::duration<double>(now - timestamp).count();
    double days = std::max(0.0, seconds / 86400.0);
    return std::exp(-days / recency_days_);
}

double InteractionMatrixBuilder::duration_score(double duration_seconds) {
    if (duration_seconds <= 0.0) {
        return 0.0;
    }
    return std::min(duration_seconds / 60.0, 10.0) / 10.0;
}

double InteractionMatrixBuilder::cell_score(const InteractionEvent& event, Clock::time_point now) const {
    return recency_score(event.timestamp, now) * 0.7 + duration_score(event.duration_seconds) * 0.3;
}

InteractionMatrix InteractionMatrixBuilder::build(
    const std::vector<UserRecord>& users,
    const std::vector<Product>& products,
    const std::unordered_map<std::string, std::vector<InteractionEvent>>& events_by_user,
    Clock::time_point now
) const {
    InteractionMatrix matrix;

    // 1. Index rows and columns
    matrix.user_ids.reserve(users.size());
    for (const auto& user : users) {
        if (matrix.user_index.count(user.id)) continue;
        matrix.user_index[user.id] = matrix.user_ids.size();
        matrix.user_ids.push_back(user.id);
    }

    matrix.product_ids.reserve(products.size());
    for (const auto& product : products) {
        if (matrix.product_index.count(product.id)) continue;
        matrix.product_index[product.id] = matrix.product_ids.size();
        matrix.product_ids.push_back(product.id);
    }

    matrix.scores.assign(matrix.rows(), std::vector<double>(matrix.cols(), 0.0));

    // 2. Fill cells; repeated interactions keep the strongest score
    size_t events_used = 0;
    for (size_t row = 0; row < matrix.rows(); ++row) {
        auto it = events_by_user.find(matrix.user_ids[row]);
        if (it == events_by_user.end()) continue;

        for (const auto& event : it->second) {
            auto col = matrix.product_index.find(event.product_id);
            if (col == matrix.product_index.end()) continue;

            double& cell = matrix.scores[row][col->second];
            cell = std::max(cell, cell_score(event, now));
            events_used++;
        }
    }

    std::cout << "[MatrixBuilder] Interaction matrix built: " << matrix.rows() << " users x "
              << matrix.cols() << " products (" << events_used << " events)\n";
    return matrix;
}

InteractionMatrix InteractionMatrixBuilder::build(
    const std::vector<UserRecord>& users,
    const std::vector<Product>& products,
    const InteractionStore& store,
    Clock::time_point now
) const {
    return build(users, products, store.snapshot(), now);
}
