#pragma once
// RecommendationService.hpp
// Request path: collaborative + content-based + trending lists, merged by the
// hybrid ranker, filtered, boosted and truncated. Any failure on the way
// degrades to the fallback list; callers never see an exception.

#include <string>
#include <unordered_set>
#include <vector>
#include "CollaborativeFilter.hpp"
#include "ContentFilter.hpp"
#include "EngineConfig.hpp"
#include "HybridRanker.hpp"
#include "InteractionStore.hpp"
#include "ModelHandle.hpp"
#include "Repositories.hpp"
#include "TrendingGenerator.hpp"

class RecommendationService {
public:
    RecommendationService(const EngineConfig& config,
                          const ProductRepository& products,
                          const UserRepository& users,
                          const InteractionStore& store,
                          const ModelHandle& model);

    // Ranked, de-duplicated, at most `limit` entries. Never throws.
    std::vector<RecommendationCandidate> get_recommendations(
        const std::string& user_id,
        size_t limit = 10,
        bool exclude_recently_viewed = true
    ) const;

    // Same, rendered as {"user_id", "generation", "recommendations": [...]}
    std::string get_recommendations_json(
        const std::string& user_id,
        size_t limit = 10,
        bool exclude_recently_viewed = true
    ) const;

    const HybridRanker& ranker() const { return ranker_; }

private:
    // Full pipeline; may throw (ModelNotReady, TransientLookupFailure, ...)
    std::vector<RecommendationCandidate> run_pipeline(
        const std::string& user_id,
        size_t limit,
        bool exclude_recently_viewed
    ) const;

    std::unordered_set<std::string> recently_viewed(const UserRecord& user) const;

    const ProductRepository& products_;
    const UserRepository& users_;
    const InteractionStore& store_;
    const ModelHandle& model_;

    CollaborativeFilter collaborative_;
    ContentFilter content_;
    TrendingGenerator trending_;
    HybridRanker ranker_;
    size_t candidate_multiplier_;
};
