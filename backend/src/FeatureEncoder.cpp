#include "FeatureEncoder.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace {

const size_t kProductTailSlots = 4 + 4 + 3;   // attribute counts, seasons, text
const size_t kUserTailSlots = 6 + 3 + 2;      // scores, behavior, click patterns

float clamp01(double value) {
    if (value < 0.0) return 0.0f;
    if (value > 1.0) return 1.0f;
    return static_cast<float>(value);
}

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Strip leading/trailing punctuation but keep inner hyphens ("high-quality")
std::string trim_token(const std::string& token) {
    size_t begin = 0;
    size_t end = token.size();
    while (begin < end && !std::isalnum(static_cast<unsigned char>(token[begin]))) ++begin;
    while (end > begin && !std::isalnum(static_cast<unsigned char>(token[end - 1]))) --end;
    return token.substr(begin, end - begin);
}

long total_clicks(const std::vector<ClickBucket>& buckets) {
    long total = 0;
    for (const auto& bucket : buckets) {
        total += bucket.clicks;
    }
    return total;
}

} // namespace

FeatureEncoder::FeatureEncoder(const std::vector<std::string>& category_vocabulary) {
    for (const auto& category : category_vocabulary) {
        std::string key = to_lower(category);
        if (vocabulary_index_.count(key)) continue;
        vocabulary_index_[key] = vocabulary_.size();
        vocabulary_.push_back(key);
    }
}

size_t FeatureEncoder::product_dimension() const {
    return kLeadingSlots + vocabulary_.size() + kProductTailSlots;
}

size_t FeatureEncoder::user_dimension() const {
    return kLeadingSlots + vocabulary_.size() + kUserTailSlots;
}

void FeatureEncoder::push_category_one_hot(std::vector<float>& features,
                                           const std::vector<std::string>& categories) const {
    size_t offset = features.size();
    features.resize(offset + vocabulary_.size(), 0.0f);
    for (const auto& category : categories) {
        auto it = vocabulary_index_.find(to_lower(category));
        if (it != vocabulary_index_.end()) {
            features[offset + it->second] = 1.0f;
        }
    }
}

FeatureEncoder::TextSignals FeatureEncoder::extract_text_signals(const std::string& text) {
    static const std::unordered_set<std::string> stop_words = {
        "the", "and", "or", "but", "in", "on", "at", "to", "for", "of", "with", "by"
    };
    static const std::unordered_set<std::string> quality_words = {
        "premium", "luxury", "high-quality"
    };
    static const std::unordered_set<std::string> discount_words = {
        "sale", "discount", "cheap", "affordable"
    };

    TextSignals signals{0, 0, 0};
    std::stringstream ss(to_lower(text));
    std::string raw;
    while (ss >> raw) {
        std::string word = trim_token(raw);
        if (word.empty()) continue;

        if (word.size() > 2 && !stop_words.count(word)) {
            signals.meaningful_words++;
        }
        if (quality_words.count(word)) {
            signals.quality_terms++;
        }
        if (discount_words.count(word)) {
            signals.discount_terms++;
        }
    }
    return signals;
}

std::vector<float> FeatureEncoder::encode_product(const Product& product) const {
    std::vector<float> features;
    features.reserve(product_dimension());

    // Price tier, popularity proxy, rating
    features.push_back(clamp01(product.price / 1000.0));
    features.push_back(clamp01(product.analytics.views / 10000.0));
    features.push_back(clamp01(product.analytics.average_rating / 5.0));

    push_category_one_hot(features, {product.category});

    // Attribute richness
    const ProductAttributes& attrs = product.attributes;
    features.push_back(clamp01(attrs.colors.size() / 10.0));
    features.push_back(clamp01(attrs.sizes.size() / 10.0));
    features.push_back(clamp01(attrs.materials.size() / 5.0));
    features.push_back(clamp01(attrs.features.size() / 10.0));

    // Seasons: spring, summer, fall, winter
    static const char* const seasons[] = {"spring", "summer", "fall", "winter"};
    for (const char* season : seasons) {
        bool present = std::any_of(attrs.seasons.begin(), attrs.seasons.end(),
                                   [season](const std::string& s) { return to_lower(s) == season; });
        features.push_back(present ? 1.0f : 0.0f);
    }

    TextSignals text = extract_text_signals(product.name + " " + product.description);
    features.push_back(clamp01(text.meaningful_words / 100.0));
    features.push_back(clamp01(text.quality_terms / 10.0));
    features.push_back(clamp01(text.discount_terms / 10.0));

    return features;
}

std::vector<float> FeatureEncoder::encode_user(const UserRecord& user) const {
    std::vector<float> features;
    features.reserve(user_dimension());

    features.push_back(clamp01(user.price_range.min / 1000.0));
    features.push_back(clamp01(user.price_range.max / 1000.0));
    features.push_back(clamp01(user.preferred_categories.size() / 10.0));

    push_category_one_hot(features, user.preferred_categories);

    const PersonalizationScores& s = user.scores;
    features.push_back(clamp01(s.fashion_style));
    features.push_back(clamp01(s.price_consciousness));
    features.push_back(clamp01(s.brand_loyalty));
    features.push_back(clamp01(s.trend_follower));
    features.push_back(clamp01(s.quality_focused));
    features.push_back(clamp01(s.impulse_buyer));

    const BehaviorData& b = user.behavior;
    features.push_back(clamp01(b.total_purchases / 50.0));
    features.push_back(clamp01(b.total_spent / 10000.0));
    features.push_back(clamp01(b.average_order_value / 500.0));

    features.push_back(clamp01(total_clicks(b.time_of_day) / 100.0));
    features.push_back(clamp01(total_clicks(b.day_of_week) / 100.0));

    return features;
}
