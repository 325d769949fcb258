#include "ContentFilter.hpp"
#include <algorithm>
#include "VectorMath.hpp"

std::vector<RecommendationCandidate> ContentFilter::recommend(
    const std::string& user_id,
    const EmbeddingIndex& user_embeddings,
    const EmbeddingIndex& product_embeddings,
    size_t limit
) const {
    std::vector<RecommendationCandidate> results;

    const std::vector<float>* user_vector = user_embeddings.find(user_id);
    if (!user_vector || limit == 0) {
        return results;
    }

    // A zero embedding carries no preference signal
    bool all_zero = std::all_of(user_vector->begin(), user_vector->end(),
                                [](float v) { return v == 0.0f; });
    if (all_zero) {
        return results;
    }

    results.reserve(product_embeddings.size());
    for (const auto& product_id : product_embeddings.ids()) {
        const std::vector<float>* product_vector = product_embeddings.find(product_id);
        double similarity = cosine_similarity(*user_vector, *product_vector);
        if (similarity <= 0.0) {
            continue;
        }
        results.emplace_back(product_id, similarity, RecommendationSource::ContentBased);
    }

    // Partial sort for top-k (cheaper than a full sort over the catalog)
    if (results.size() > limit) {
        std::partial_sort(results.begin(), results.begin() + limit, results.end(), compareCandidates);
        results.resize(limit);
    } else {
        sort_by_score(results);
    }
    return results;
}
