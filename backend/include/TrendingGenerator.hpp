#pragma once
// TrendingGenerator.hpp
// Popularity-ranked lists that need no per-user model.

#include <vector>
#include "RecommendationCandidate.hpp"
#include "Repositories.hpp"

class TrendingGenerator {
public:
    TrendingGenerator(const ProductRepository& products,
                      double trending_score = 0.8,
                      double fallback_score = 0.5);

    // Active products by trending score, then views; flat score, tag "trending"
    std::vector<RecommendationCandidate> trending(size_t limit) const;

    // Featured active products by views; flat score, tag "fallback".
    // If nothing is featured, the most viewed active products are used.
    // Never throws: a failing product read yields an empty list.
    std::vector<RecommendationCandidate> fallback(size_t limit) const;

private:
    const ProductRepository& products_;
    double trending_score_;
    double fallback_score_;
};
