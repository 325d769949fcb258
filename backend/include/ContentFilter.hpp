#pragma once
// ContentFilter.hpp
// Ranks products by cosine similarity between the user's embedding and each
// product embedding of the current generation.

#include <string>
#include <vector>
#include "EmbeddingIndex.hpp"
#include "RecommendationCandidate.hpp"

class ContentFilter {
public:
    // Top `limit` products with positive similarity; empty if the user has no
    // embedding or a zero one
    std::vector<RecommendationCandidate> recommend(
        const std::string& user_id,
        const EmbeddingIndex& user_embeddings,
        const EmbeddingIndex& product_embeddings,
        size_t limit
    ) const;
};
