#pragma once
// RecommendationCandidate.hpp
// One scored product produced for a single request.

#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class RecommendationSource {
    Collaborative,
    ContentBased,
    Trending,
    Fallback
};

// "collaborative", "content-based", "trending", "fallback"
std::string to_string(RecommendationSource source);

struct RecommendationCandidate {
    std::string product_id;
    double score;
    std::set<RecommendationSource> sources;

    RecommendationCandidate() : score(0.0) {}
    RecommendationCandidate(std::string id, double s, RecommendationSource source)
        : product_id(std::move(id)), score(s), sources{source} {}
};

// Highest score first; equal scores ordered by product id
bool compareCandidates(const RecommendationCandidate& a, const RecommendationCandidate& b);
void sort_by_score(std::vector<RecommendationCandidate>& candidates);

// {"product_id", "score", "sources": [...]}
json candidate_to_json(const RecommendationCandidate& candidate);
