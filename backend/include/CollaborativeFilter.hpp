#pragma once
// CollaborativeFilter.hpp
// User-based neighbourhood recommendations over the interaction matrix.

#include <string>
#include <vector>
#include "InteractionMatrix.hpp"
#include "RecommendationCandidate.hpp"

class CollaborativeFilter {
public:
    CollaborativeFilter(double min_similarity = 0.1, size_t max_neighbors = 10);

    // Products the user has not touched, scored by the summed
    // neighbour_cell * neighbour_similarity of the closest users.
    // Empty when the user has no row (cold start).
    std::vector<RecommendationCandidate> recommend(
        const std::string& user_id,
        const InteractionMatrix& matrix,
        size_t limit
    ) const;

private:
    struct Neighbor {
        size_t row;
        double similarity;
    };

    std::vector<Neighbor> find_neighbors(size_t user_row, const InteractionMatrix& matrix) const;

    double min_similarity_;
    size_t max_neighbors_;
};
