#include "HybridRanker.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace {

bool equals_ignore_case(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

} // namespace

std::string to_string(Season season) {
    switch (season) {
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Fall:   return "fall";
        case Season::Winter: return "winter";
    }
    return "winter";
}

HybridRanker::HybridRanker() {}

HybridRanker::HybridRanker(const SourceWeights& weights, const BoostFactors& boosts)
    : weights_(weights), boosts_(boosts) {}

std::vector<RecommendationCandidate> HybridRanker::combine(const std::vector<WeightedList>& sources) const {
    std::unordered_map<std::string, RecommendationCandidate> combined;

    for (const auto& [candidates, weight] : sources) {
        for (const auto& candidate : candidates) {
            double weighted_score = candidate.score * weight;

            auto it = combined.find(candidate.product_id);
            if (it == combined.end()) {
                RecommendationCandidate merged = candidate;
                merged.score = weighted_score;
                combined.emplace(candidate.product_id, std::move(merged));
            } else {
                it->second.score += weighted_score;
                it->second.sources.insert(candidate.sources.begin(), candidate.sources.end());
            }
        }
    }

    std::vector<RecommendationCandidate> results;
    results.reserve(combined.size());
    for (auto& [product_id, candidate] : combined) {
        results.push_back(std::move(candidate));
    }
    sort_by_score(results);
    return results;
}

double HybridRanker::personalization_boost(const Product& product, const UserRecord& user, Season current) const {
    double boost = 1.0;

    // Category preference
    if (!product.category.empty() && contains(user.preferred_categories, product.category)) {
        boost *= boosts_.category;
    }

    // Price range (inclusive)
    if (product.price >= user.price_range.min && product.price <= user.price_range.max) {
        boost *= boosts_.price;
    }

    // Brand preference
    if (!product.brand.empty() && contains(user.preferred_brands, product.brand)) {
        boost *= boosts_.brand;
    }

    // Seasonal relevance
    std::string season_name = to_string(current);
    bool in_season = std::any_of(product.attributes.seasons.begin(), product.attributes.seasons.end(),
                                 [&season_name](const std::string& s) { return equals_ignore_case(s, season_name); });
    if (in_season) {
        boost *= boosts_.season;
    }

    return boost;
}

std::vector<RecommendationCandidate> HybridRanker::apply_boost(
    std::vector<RecommendationCandidate> candidates,
    const std::unordered_map<std::string, Product>& products,
    const UserRecord& user,
    Season current
) const {
    for (auto& candidate : candidates) {
        auto it = products.find(candidate.product_id);
        if (it == products.end()) continue;
        candidate.score *= personalization_boost(it->second, user, current);
    }
    sort_by_score(candidates);
    return candidates;
}

std::vector<RecommendationCandidate> HybridRanker::exclude(
    std::vector<RecommendationCandidate> candidates,
    const std::unordered_set<std::string>& excluded
) {
    if (excluded.empty()) {
        return candidates;
    }
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&excluded](const RecommendationCandidate& c) {
                                        return excluded.count(c.product_id) > 0;
                                    }),
                     candidates.end());
    return candidates;
}

Season HybridRanker::season_for_month(int month) {
    if (month >= 2 && month <= 4) return Season::Spring;
    if (month >= 5 && month <= 7) return Season::Summer;
    if (month >= 8 && month <= 10) return Season::Fall;
    return Season::Winter;
}

Season HybridRanker::current_season() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return season_for_month(local.tm_mon);
}
