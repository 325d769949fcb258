#include "TrendingGenerator.hpp"
#include <algorithm>
#include <iostream>

TrendingGenerator::TrendingGenerator(const ProductRepository& products,
                                     double trending_score,
                                     double fallback_score)
    : products_(products), trending_score_(trending_score), fallback_score_(fallback_score) {}

std::vector<RecommendationCandidate> TrendingGenerator::trending(size_t limit) const {
    std::vector<Product> active = products_.active_products();

    std::sort(active.begin(), active.end(), [](const Product& a, const Product& b) {
        if (a.analytics.trending_score != b.analytics.trending_score) {
            return a.analytics.trending_score > b.analytics.trending_score;
        }
        if (a.analytics.views != b.analytics.views) {
            return a.analytics.views > b.analytics.views;
        }
        return a.id < b.id;
    });

    std::vector<RecommendationCandidate> results;
    for (size_t i = 0; i < active.size() && i < limit; ++i) {
        results.emplace_back(active[i].id, trending_score_, RecommendationSource::Trending);
    }
    return results;
}

std::vector<RecommendationCandidate> TrendingGenerator::fallback(size_t limit) const {
    std::vector<RecommendationCandidate> results;
    try {
        std::vector<Product> active = products_.active_products();

        std::vector<Product> pool;
        for (const auto& product : active) {
            if (product.featured) {
                pool.push_back(product);
            }
        }
        if (pool.empty()) {
            pool = std::move(active);
        }

        std::sort(pool.begin(), pool.end(), [](const Product& a, const Product& b) {
            if (a.analytics.views != b.analytics.views) {
                return a.analytics.views > b.analytics.views;
            }
            return a.id < b.id;
        });

        for (size_t i = 0; i < pool.size() && i < limit; ++i) {
            results.emplace_back(pool[i].id, fallback_score_, RecommendationSource::Fallback);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Engine] Error getting fallback recommendations: " << e.what() << "\n";
        results.clear();
    } catch (...) {
        std::cerr << "[Engine] Unknown error getting fallback recommendations\n";
        results.clear();
    }
    return results;
}
