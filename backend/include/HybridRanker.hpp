#pragma once
// HybridRanker.hpp
// Merges ranked candidate lists with per-source weights and applies
// multiplicative personalization boosts from the user's profile.

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "RecommendationCandidate.hpp"
#include "Records.hpp"

// Weight applied to each generator's scores before merging
struct SourceWeights {
    double collaborative;
    double content_based;
    double trending;

    SourceWeights() : collaborative(0.4), content_based(0.4), trending(0.2) {}
};

// Factor applied when the product matches the rule
struct BoostFactors {
    double category;   // product category in preferred categories
    double price;      // price within preferred range
    double brand;      // brand in preferred brands
    double season;     // product lists the current season

    BoostFactors() : category(1.3), price(1.2), brand(1.4), season(1.1) {}
};

enum class Season { Spring, Summer, Fall, Winter };

std::string to_string(Season season);

using WeightedList = std::pair<std::vector<RecommendationCandidate>, double>;

class HybridRanker {
public:
    HybridRanker();
    HybridRanker(const SourceWeights& weights, const BoostFactors& boosts);

    // Sum score * weight per product id, union the sources, sort descending
    std::vector<RecommendationCandidate> combine(const std::vector<WeightedList>& sources) const;

    // Product of the factors whose rule matches; 1.0 when none match
    double personalization_boost(const Product& product, const UserRecord& user, Season current) const;

    // Multiply each candidate by its boost and re-sort. Candidates whose
    // product is missing from `products` keep their score.
    std::vector<RecommendationCandidate> apply_boost(
        std::vector<RecommendationCandidate> candidates,
        const std::unordered_map<std::string, Product>& products,
        const UserRecord& user,
        Season current
    ) const;

    // Drop candidates whose product id is in `excluded`
    static std::vector<RecommendationCandidate> exclude(
        std::vector<RecommendationCandidate> candidates,
        const std::unordered_set<std::string>& excluded
    );

    // Month is 0-based (0 = January): spring 2-4, summer 5-7, fall 8-10
    static Season season_for_month(int month);
    static Season current_season();

    void set_weights(const SourceWeights& weights) { weights_ = weights; }
    const SourceWeights& weights() const { return weights_; }
    const BoostFactors& boosts() const { return boosts_; }

private:
    SourceWeights weights_;
    BoostFactors boosts_;
};
