#include "httplib.h"
#include <nlohmann/json.hpp>
#include "EngineConfig.hpp"
#include "FeatureEncoder.hpp"
#include "InteractionMatrix.hpp"
#include "InteractionStore.hpp"
#include "InteractionTracker.hpp"
#include "ModelHandle.hpp"
#include "ProductCatalog.hpp"
#include "RecommendationService.hpp"
#include "UserDirectory.hpp"
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

size_t parse_limit(const httplib::Request& req) {
    size_t limit = 10;
    if (req.has_param("limit")) {
        try {
            int requested = std::stoi(req.get_param_value("limit"));
            if (requested < 1) requested = 1;
            if (requested > 50) requested = 50;
            limit = static_cast<size_t>(requested);
        } catch (const std::exception&) {
            limit = 10;
        }
    }
    return limit;
}

bool parse_exclude_viewed(const httplib::Request& req) {
    if (!req.has_param("exclude_viewed")) return true;
    std::string value = req.get_param_value("exclude_viewed");
    return !(value == "false" || value == "0");
}

void set_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    json error_json;
    error_json["error"] = message;
    res.set_content(error_json.dump(), "application/json");
}

// Parses {"user_id", "product_id", "kind", "duration"?, "source"?}. Returns
// false with a message on malformed input.
bool parse_interaction(const std::string& body,
                       std::string& user_id,
                       std::string& product_id,
                       InteractionKind& kind,
                       InteractionMetadata& metadata,
                       std::string& error) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        error = "Malformed JSON body";
        return false;
    }
    if (!j.contains("user_id") || !j["user_id"].is_string() ||
        !j.contains("product_id") || !j["product_id"].is_string()) {
        error = "Missing 'user_id' or 'product_id'";
        return false;
    }
    user_id = j["user_id"].get<std::string>();
    product_id = j["product_id"].get<std::string>();

    std::string kind_name = j.value("kind", std::string("view"));
    if (!parse_interaction_kind(kind_name, kind)) {
        error = "Unknown interaction kind: " + kind_name;
        return false;
    }

    if (j.contains("duration") && j["duration"].is_number()) {
        metadata.duration_seconds = j["duration"].get<double>();
    }
    metadata.source = j.value("source", std::string());
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    std::cout << "[Server] Initializing recommendation engine...\n";

    std::string config_path = argc > 1 ? argv[1] : "config/engine.json";
    EngineConfig config;
    config.load(config_path);

    ProductCatalog catalog;
    catalog.load(config.products_path);

    UserDirectory users;
    users.load(config.users_path);

    InteractionStore store(config.max_events_per_user);
    store.load(config.interactions_path);

    FeatureEncoder encoder(config.category_vocabulary);
    InteractionMatrixBuilder matrix_builder(config.recency_days);

    ModelHandle model(catalog, users, store, encoder, matrix_builder);
    if (model.refresh() != ModelHandle::RefreshResult::Published) {
        std::cerr << "[Server] ❌ Initial model build failed, serving fallback until the next refresh\n";
    }

    // Refreshes every `refresh_event_threshold` events or `refresh_interval`
    InteractionTracker tracker(
        store,
        catalog,
        model,
        config.refresh_event_threshold,
        config.refresh_interval
    );

    // Persist interaction history and product counters after each generation
    tracker.set_refresh_listener([&](const ModelGeneration& generation) {
        bool saved = store.save(config.interactions_path);
        saved = catalog.save(config.products_path) && saved;
        if (!saved) {
            std::cerr << "[Server] Snapshot after generation " << generation.number << " incomplete\n";
        }
    });

    RecommendationService service(config, catalog, users, store, model);

    httplib::Server svr;

    // CORS headers on every response
    svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    svr.Get("/api", [](const httplib::Request&, httplib::Response& res) {
        json api;
        api["service"] = "recommendation-engine";
        api["endpoints"] = {
            "GET  /recommendations?user_id=<id>&limit=<n>&exclude_viewed=<bool>",
            "POST /interactions",
            "POST /interactions/view",
            "POST /refresh",
            "GET  /stats",
            "GET  /health"
        };
        res.set_content(api.dump(2), "application/json");
    });

    // Route: /recommendations?user_id=...&limit=10
    svr.Get("/recommendations", [&](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("user_id")) {
            set_error(res, 400, "Missing 'user_id' parameter");
            return;
        }
        std::string user_id = req.get_param_value("user_id");
        std::string json_output = service.get_recommendations_json(
            user_id, parse_limit(req), parse_exclude_viewed(req));
        res.set_content(json_output, "application/json");
    });

    // Route: /interactions - record any interaction kind
    svr.Post("/interactions", [&](const httplib::Request& req, httplib::Response& res) {
        std::string user_id, product_id, error;
        InteractionKind kind = InteractionKind::View;
        InteractionMetadata metadata;
        if (!parse_interaction(req.body, user_id, product_id, kind, metadata, error)) {
            set_error(res, 400, error);
            return;
        }

        json response_json;
        response_json["success"] = tracker.track(user_id, product_id, kind, metadata);
        res.set_content(response_json.dump(), "application/json");
    });

    // Route: /interactions/view - record a view and return the updated set
    // for the user's live session
    svr.Post("/interactions/view", [&](const httplib::Request& req, httplib::Response& res) {
        std::string user_id, product_id, error;
        InteractionKind kind = InteractionKind::View;
        InteractionMetadata metadata;
        if (!parse_interaction(req.body, user_id, product_id, kind, metadata, error)) {
            set_error(res, 400, error);
            return;
        }

        bool tracked = tracker.track(user_id, product_id, InteractionKind::View, metadata);

        json response_json = json::parse(service.get_recommendations_json(user_id, parse_limit(req), true));
        response_json["success"] = tracked;
        res.set_content(response_json.dump(), "application/json");
    });

    // Route: /refresh - wake the refresh worker now
    svr.Post("/refresh", [&](const httplib::Request&, httplib::Response& res) {
        tracker.request_refresh();
        json response_json;
        response_json["requested"] = true;
        response_json["generation"] = model.generation();
        res.set_content(response_json.dump(), "application/json");
    });

    // Stats endpoint for monitoring
    svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
        auto tracker_stats = tracker.get_stats();

        json stats_json;
        auto generation = model.current();
        stats_json["model"] = {
            {"ready", generation != nullptr},
            {"generation", generation ? generation->number : 0}
        };
        if (generation) {
            stats_json["model"]["built_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                generation->built_at.time_since_epoch()).count();
            stats_json["model"]["users"] = generation->matrix.rows();
            stats_json["model"]["products"] = generation->matrix.cols();
        }
        stats_json["tracker"] = {
            {"events_tracked", tracker_stats.events_tracked},
            {"tracking_failures", tracker_stats.tracking_failures},
            {"refreshes_completed", tracker_stats.refreshes_completed},
            {"refreshes_failed", tracker_stats.refreshes_failed},
            {"events_since_refresh", tracker_stats.events_since_refresh},
            {"avg_refresh_time_ms", tracker_stats.avg_refresh_time_ms}
        };
        stats_json["store"] = {
            {"users", store.user_count()},
            {"events", store.total_events()}
        };
        stats_json["catalog"] = {
            {"products", catalog.size()},
            {"users", users.size()}
        };

        res.set_content(stats_json.dump(2), "application/json");
    });

    svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        json health;
        health["status"] = "ok";
        health["model_ready"] = model.is_ready();
        res.set_content(health.dump(), "application/json");
    });

    std::cout << "======================================" << std::endl;
    std::cout << "   Recommendation Engine" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  - GET  /recommendations?user_id=<id>&limit=<num>" << std::endl;
    std::cout << "  - POST /interactions" << std::endl;
    std::cout << "  - POST /interactions/view" << std::endl;
    std::cout << "  - POST /refresh" << std::endl;
    std::cout << "  - GET  /stats" << std::endl;
    std::cout << "  - GET  /health" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Products: " << catalog.size() << ", users: " << users.size()
              << ", generation: " << model.generation() << std::endl;
    std::cout << "Listening on " << config.host << ":" << config.port << std::endl;
    std::cout << "======================================" << std::endl;

    if (!svr.listen(config.host, config.port)) {
        std::cerr << "[Server] Failed to start server!" << std::endl;
        return 1;
    }

    return 0;
}
