#include "EngineConfig.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool EngineConfig::load(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        std::cerr << "[Config] Warning: Could not open config file: " << config_path
                  << " (using defaults)" << std::endl;
        return false;
    }

    try {
        json j;
        in >> j;

        // Parse into a copy so a bad value leaves *this untouched
        EngineConfig next = *this;

        if (j.contains("data")) {
            const json& data = j["data"];
            next.products_path = data.value("products_path", next.products_path);
            next.users_path = data.value("users_path", next.users_path);
            next.interactions_path = data.value("interactions_path", next.interactions_path);
        }

        if (j.contains("server")) {
            const json& server = j["server"];
            next.host = server.value("host", next.host);
            next.port = server.value("port", next.port);
        }

        if (j.contains("weights")) {
            const json& w = j["weights"];
            next.weights.collaborative = w.value("collaborative", next.weights.collaborative);
            next.weights.content_based = w.value("content_based", next.weights.content_based);
            next.weights.trending = w.value("trending", next.weights.trending);
        }

        if (j.contains("boost")) {
            const json& b = j["boost"];
            next.boosts.category = b.value("category", next.boosts.category);
            next.boosts.price = b.value("price", next.boosts.price);
            next.boosts.brand = b.value("brand", next.boosts.brand);
            next.boosts.season = b.value("season", next.boosts.season);
        }

        if (j.contains("collaborative")) {
            const json& c = j["collaborative"];
            next.min_neighbor_similarity = c.value("min_similarity", next.min_neighbor_similarity);
            next.max_neighbors = c.value("max_neighbors", next.max_neighbors);
        }

        if (j.contains("store")) {
            next.max_events_per_user = j["store"].value("max_events_per_user", next.max_events_per_user);
        }

        if (j.contains("matrix")) {
            next.recency_days = j["matrix"].value("recency_days", next.recency_days);
        }

        if (j.contains("refresh")) {
            const json& r = j["refresh"];
            next.refresh_event_threshold = r.value("event_threshold", next.refresh_event_threshold);
            long long interval = r.value("interval_seconds",
                                         static_cast<long long>(next.refresh_interval.count()));
            next.refresh_interval = std::chrono::seconds(interval);
        }

        if (j.contains("encoder") && j["encoder"].contains("category_vocabulary")) {
            next.category_vocabulary = j["encoder"]["category_vocabulary"].get<std::vector<std::string>>();
        }

        if (j.contains("trending")) {
            next.trending_base_score = j["trending"].value("base_score", next.trending_base_score);
        }
        if (j.contains("fallback")) {
            next.fallback_base_score = j["fallback"].value("base_score", next.fallback_base_score);
        }
        if (j.contains("request")) {
            next.candidate_multiplier = j["request"].value("candidate_multiplier", next.candidate_multiplier);
        }

        *this = std::move(next);
        std::cout << "[Config] Loaded " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Config] Error parsing config file: " << e.what() << " (using defaults)" << std::endl;
        return false;
    }
}
