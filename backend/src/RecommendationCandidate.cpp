#include "RecommendationCandidate.hpp"
#include <algorithm>

std::string to_string(RecommendationSource source) {
    switch (source) {
        case RecommendationSource::Collaborative: return "collaborative";
        case RecommendationSource::ContentBased:  return "content-based";
        case RecommendationSource::Trending:      return "trending";
        case RecommendationSource::Fallback:      return "fallback";
    }
    return "fallback";
}

bool compareCandidates(const RecommendationCandidate& a, const RecommendationCandidate& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    return a.product_id < b.product_id;
}

void sort_by_score(std::vector<RecommendationCandidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(), compareCandidates);
}

json candidate_to_json(const RecommendationCandidate& candidate) {
    json item;
    item["product_id"] = candidate.product_id;
    item["score"] = candidate.score;
    item["sources"] = json::array();
    for (RecommendationSource source : candidate.sources) {
        item["sources"].push_back(to_string(source));
    }
    return item;
}
