#include "CollaborativeFilter.hpp"
#include <algorithm>
#include <unordered_map>
#include "VectorMath.hpp"

CollaborativeFilter::CollaborativeFilter(double min_similarity, size_t max_neighbors)
    : min_similarity_(min_similarity), max_neighbors_(max_neighbors) {}

std::vector<CollaborativeFilter::Neighbor>
CollaborativeFilter::find_neighbors(size_t user_row, const InteractionMatrix& matrix) const {
    const std::vector<double>& user_vector = matrix.scores[user_row];

    std::vector<Neighbor> neighbors;
    for (size_t row = 0; row < matrix.rows(); ++row) {
        if (row == user_row) continue;

        double similarity = cosine_similarity(user_vector, matrix.scores[row]);
        if (similarity > min_similarity_) {
            neighbors.push_back({row, similarity});
        }
    }

    std::sort(neighbors.begin(), neighbors.end(), [](const Neighbor& a, const Neighbor& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.row < b.row;
    });

    if (neighbors.size() > max_neighbors_) {
        neighbors.resize(max_neighbors_);
    }
    return neighbors;
}

std::vector<RecommendationCandidate> CollaborativeFilter::recommend(
    const std::string& user_id,
    const InteractionMatrix& matrix,
    size_t limit
) const {
    std::vector<RecommendationCandidate> results;

    int user_row = matrix.row_of(user_id);
    if (user_row < 0 || limit == 0) {
        return results;
    }

    const std::vector<double>& user_vector = matrix.scores[user_row];
    std::vector<Neighbor> neighbors = find_neighbors(static_cast<size_t>(user_row), matrix);

    // Accumulate scores from similar users (summed, not maxed)
    std::unordered_map<size_t, double> accumulated;
    for (const auto& neighbor : neighbors) {
        const std::vector<double>& neighbor_vector = matrix.scores[neighbor.row];
        for (size_t col = 0; col < matrix.cols(); ++col) {
            if (user_vector[col] == 0.0 && neighbor_vector[col] > 0.0) {
                accumulated[col] += neighbor_vector[col] * neighbor.similarity;
            }
        }
    }

    results.reserve(accumulated.size());
    for (const auto& [col, score] : accumulated) {
        results.emplace_back(matrix.product_ids[col], score, RecommendationSource::Collaborative);
    }

    if (results.size() > limit) {
        std::partial_sort(results.begin(), results.begin() + limit, results.end(),
                          compareCandidates);
        results.resize(limit);
    } else {
        sort_by_score(results);
    }
    return results;
}
