#include "Records.hpp"

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<std::string>>();
    }
    return {};
}

std::vector<ClickBucket> click_buckets(const json& j, const char* key, const char* slot_key) {
    std::vector<ClickBucket> buckets;
    if (!j.contains(key) || !j[key].is_array()) {
        return buckets;
    }
    for (const auto& item : j[key]) {
        ClickBucket bucket;
        bucket.slot = item.value(slot_key, 0);
        bucket.clicks = item.value("clicks", 0L);
        buckets.push_back(bucket);
    }
    return buckets;
}

json buckets_to_json(const std::vector<ClickBucket>& buckets, const char* slot_key) {
    json out = json::array();
    for (const auto& bucket : buckets) {
        out.push_back({{slot_key, bucket.slot}, {"clicks", bucket.clicks}});
    }
    return out;
}

} // namespace

Product product_from_json(const std::string& id, const json& j) {
    Product product;
    product.id = id;
    product.name = j.value("name", std::string());
    product.description = j.value("description", std::string());
    product.price = j.value("price", 0.0);
    product.category = j.value("category", std::string());
    product.brand = j.value("brand", std::string());
    product.status = j.value("status", std::string("active"));
    product.featured = j.value("featured", false);

    if (j.contains("attributes") && j["attributes"].is_object()) {
        const json& attrs = j["attributes"];
        product.attributes.colors = string_list(attrs, "colors");
        product.attributes.sizes = string_list(attrs, "sizes");
        product.attributes.materials = string_list(attrs, "materials");
        product.attributes.seasons = string_list(attrs, "season");
        product.attributes.features = string_list(attrs, "features");
    }

    if (j.contains("analytics") && j["analytics"].is_object()) {
        const json& a = j["analytics"];
        product.analytics.views = a.value("views", 0L);
        product.analytics.purchases = a.value("purchases", 0L);
        product.analytics.add_to_cart = a.value("add_to_cart", 0L);
        product.analytics.add_to_wishlist = a.value("add_to_wishlist", 0L);
        product.analytics.conversion_rate = a.value("conversion_rate", 0.0);
        product.analytics.average_rating = a.value("average_rating", 0.0);
        product.analytics.trending_score = a.value("trending_score", 0.0);
    }
    return product;
}

json product_to_json(const Product& product) {
    json j;
    j["name"] = product.name;
    j["description"] = product.description;
    j["price"] = product.price;
    j["category"] = product.category;
    j["brand"] = product.brand;
    j["status"] = product.status;
    j["featured"] = product.featured;
    j["attributes"] = {
        {"colors", product.attributes.colors},
        {"sizes", product.attributes.sizes},
        {"materials", product.attributes.materials},
        {"season", product.attributes.seasons},
        {"features", product.attributes.features}
    };
    j["analytics"] = {
        {"views", product.analytics.views},
        {"purchases", product.analytics.purchases},
        {"add_to_cart", product.analytics.add_to_cart},
        {"add_to_wishlist", product.analytics.add_to_wishlist},
        {"conversion_rate", product.analytics.conversion_rate},
        {"average_rating", product.analytics.average_rating},
        {"trending_score", product.analytics.trending_score}
    };
    return j;
}

UserRecord user_from_json(const std::string& id, const json& j) {
    UserRecord user;
    user.id = id;
    user.is_active = j.value("is_active", true);
    user.recently_viewed = string_list(j, "recently_viewed");

    if (j.contains("preferences") && j["preferences"].is_object()) {
        const json& prefs = j["preferences"];
        user.preferred_categories = string_list(prefs, "categories");
        user.preferred_brands = string_list(prefs, "brands");
        if (prefs.contains("price_range") && prefs["price_range"].is_object()) {
            user.price_range.min = prefs["price_range"].value("min", 0.0);
            user.price_range.max = prefs["price_range"].value("max", 10000.0);
        }
    }

    if (j.contains("personalization_scores") && j["personalization_scores"].is_object()) {
        const json& s = j["personalization_scores"];
        user.scores.fashion_style = s.value("fashion_style", 0.0);
        user.scores.price_consciousness = s.value("price_consciousness", 0.0);
        user.scores.brand_loyalty = s.value("brand_loyalty", 0.0);
        user.scores.trend_follower = s.value("trend_follower", 0.0);
        user.scores.quality_focused = s.value("quality_focused", 0.0);
        user.scores.impulse_buyer = s.value("impulse_buyer", 0.0);
    }

    if (j.contains("behavior") && j["behavior"].is_object()) {
        const json& b = j["behavior"];
        user.behavior.total_purchases = b.value("total_purchases", 0L);
        user.behavior.total_spent = b.value("total_spent", 0.0);
        user.behavior.average_order_value = b.value("average_order_value", 0.0);
        if (b.contains("click_patterns") && b["click_patterns"].is_object()) {
            const json& clicks = b["click_patterns"];
            user.behavior.time_of_day = click_buckets(clicks, "time_of_day", "hour");
            user.behavior.day_of_week = click_buckets(clicks, "day_of_week", "day");
        }
    }
    return user;
}

json user_to_json(const UserRecord& user) {
    json j;
    j["is_active"] = user.is_active;
    j["recently_viewed"] = user.recently_viewed;
    j["preferences"] = {
        {"categories", user.preferred_categories},
        {"brands", user.preferred_brands},
        {"price_range", {{"min", user.price_range.min}, {"max", user.price_range.max}}}
    };
    j["personalization_scores"] = {
        {"fashion_style", user.scores.fashion_style},
        {"price_consciousness", user.scores.price_consciousness},
        {"brand_loyalty", user.scores.brand_loyalty},
        {"trend_follower", user.scores.trend_follower},
        {"quality_focused", user.scores.quality_focused},
        {"impulse_buyer", user.scores.impulse_buyer}
    };
    j["behavior"] = {
        {"total_purchases", user.behavior.total_purchases},
        {"total_spent", user.behavior.total_spent},
        {"average_order_value", user.behavior.average_order_value},
        {"click_patterns", {
            {"time_of_day", buckets_to_json(user.behavior.time_of_day, "hour")},
            {"day_of_week", buckets_to_json(user.behavior.day_of_week, "day")}
        }}
    };
    return j;
}
