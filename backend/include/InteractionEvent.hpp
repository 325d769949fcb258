#pragma once
// InteractionEvent.hpp
// A single tracked user action against a product.

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

enum class InteractionKind {
    View,
    Purchase,
    AddToCart,
    AddToWishlist
};

// "view", "purchase", "add_to_cart", "add_to_wishlist"
std::string to_string(InteractionKind kind);

// Returns false for an unrecognised name; `out` is left untouched then
bool parse_interaction_kind(const std::string& name, InteractionKind& out);

struct InteractionEvent {
    std::string user_id;
    std::string product_id;
    InteractionKind kind;
    Clock::time_point timestamp;
    double duration_seconds;   // 0 when the caller did not report one
    std::string source;        // search, recommendation, category, ...

    InteractionEvent() : kind(InteractionKind::View), duration_seconds(0.0) {}
};

// Timestamps are serialized as milliseconds since the Unix epoch
json event_to_json(const InteractionEvent& event);
InteractionEvent event_from_json(const std::string& user_id, const json& j);
