#pragma once
// EngineConfig.hpp
// Tunables for the recommendation engine. Defaults are the production
// values; a JSON file may override any subset of them.

#include <chrono>
#include <string>
#include <vector>
#include "HybridRanker.hpp"

struct EngineConfig {
    // Data files
    std::string products_path = "data/products.json";
    std::string users_path = "data/users.json";
    std::string interactions_path = "data/interactions.json";

    // HTTP server
    std::string host = "0.0.0.0";
    int port = 8080;

    // Ranking
    SourceWeights weights;
    BoostFactors boosts;
    size_t candidate_multiplier = 2;   // generators return limit * this

    // Collaborative filter
    double min_neighbor_similarity = 0.1;
    size_t max_neighbors = 10;

    // Interaction store / matrix
    size_t max_events_per_user = 100;
    double recency_days = 30.0;

    // Refresh policy: whichever comes first
    size_t refresh_event_threshold = 50;
    std::chrono::seconds refresh_interval{300};

    // Popularity lists
    double trending_base_score = 0.8;
    double fallback_base_score = 0.5;

    // Category one-hot vocabulary shared by product and user encodings
    std::vector<std::string> category_vocabulary = {
        "clothing", "shoes", "accessories", "electronics",
        "home", "beauty", "sports", "books"
    };

    // Override fields present in the JSON file. On any error the config is
    // left as it was and false is returned.
    bool load(const std::string& config_path);
};
