#pragma once
// Records.hpp
// Product and user records as read from the platform's stores.
// The engine only reads these, apart from product analytics counters.

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct ProductAttributes {
    std::vector<std::string> colors;
    std::vector<std::string> sizes;
    std::vector<std::string> materials;
    std::vector<std::string> seasons;   // spring, summer, fall, winter
    std::vector<std::string> features;  // waterproof, breathable, ...
};

struct ProductAnalytics {
    long views;
    long purchases;
    long add_to_cart;
    long add_to_wishlist;
    double conversion_rate;   // purchases / views * 100
    double average_rating;    // 0..5
    double trending_score;

    ProductAnalytics() : views(0), purchases(0), add_to_cart(0), add_to_wishlist(0),
                         conversion_rate(0), average_rating(0), trending_score(0) {}
};

struct Product {
    std::string id;
    std::string name;
    std::string description;
    double price;
    std::string category;
    std::string brand;
    std::string status;       // active, inactive, draft, archived
    bool featured;
    ProductAttributes attributes;
    ProductAnalytics analytics;

    Product() : price(0), status("active"), featured(false) {}

    bool is_active() const { return status == "active"; }
};

struct PriceRange {
    double min;
    double max;

    PriceRange() : min(0), max(10000) {}
};

// Six personalization scores, each in [0, 1]
struct PersonalizationScores {
    double fashion_style;
    double price_consciousness;
    double brand_loyalty;
    double trend_follower;
    double quality_focused;
    double impulse_buyer;

    PersonalizationScores() : fashion_style(0), price_consciousness(0), brand_loyalty(0),
                              trend_follower(0), quality_focused(0), impulse_buyer(0) {}
};

// One histogram bucket: hour of day (0-23) or day of week (0-6)
struct ClickBucket {
    int slot;
    long clicks;

    ClickBucket() : slot(0), clicks(0) {}
};

struct BehaviorData {
    long total_purchases;
    double total_spent;
    double average_order_value;
    std::vector<ClickBucket> time_of_day;
    std::vector<ClickBucket> day_of_week;

    BehaviorData() : total_purchases(0), total_spent(0), average_order_value(0) {}
};

struct UserRecord {
    std::string id;
    bool is_active;
    std::vector<std::string> preferred_categories;
    std::vector<std::string> preferred_brands;
    PriceRange price_range;
    PersonalizationScores scores;
    BehaviorData behavior;
    std::vector<std::string> recently_viewed;  // product ids, newest first

    UserRecord() : is_active(true) {}
};

// JSON mapping. Absent keys keep the defaults above.
Product product_from_json(const std::string& id, const json& j);
json product_to_json(const Product& product);

UserRecord user_from_json(const std::string& id, const json& j);
json user_to_json(const UserRecord& user);
