#include "InteractionEvent.hpp"
#include <stdexcept>

std::string to_string(InteractionKind kind) {
    switch (kind) {
        case InteractionKind::View:          return "view";
        case InteractionKind::Purchase:      return "purchase";
        case InteractionKind::AddToCart:     return "add_to_cart";
        case InteractionKind::AddToWishlist: return "add_to_wishlist";
    }
    return "view";
}

bool parse_interaction_kind(const std::string& name, InteractionKind& out) {
    if (name == "view") {
        out = InteractionKind::View;
    } else if (name == "purchase") {
        out = InteractionKind::Purchase;
    } else if (name == "add_to_cart") {
        out = InteractionKind::AddToCart;
    } else if (name == "add_to_wishlist") {
        out = InteractionKind::AddToWishlist;
    } else {
        return false;
    }
    return true;
}

json event_to_json(const InteractionEvent& event) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();

    json j;
    j["product_id"] = event.product_id;
    j["kind"] = to_string(event.kind);
    j["timestamp"] = millis;
    j["duration"] = event.duration_seconds;
    if (!event.source.empty()) {
        j["source"] = event.source;
    }
    return j;
}

InteractionEvent event_from_json(const std::string& user_id, const json& j) {
    InteractionEvent event;
    event.user_id = user_id;
    event.product_id = j.at("product_id").get<std::string>();

    std::string kind_name = j.value("kind", std::string("view"));
    if (!parse_interaction_kind(kind_name, event.kind)) {
        throw std::invalid_argument("unknown interaction kind: " + kind_name);
    }

    long long millis = j.value("timestamp", 0LL);
    event.timestamp = Clock::time_point(std::chrono::milliseconds(millis));
    event.duration_seconds = j.value("duration", 0.0);
    event.source = j.value("source", std::string());
    return event;
}
