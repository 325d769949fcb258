#pragma once
// FeatureEncoder.hpp
// Turns product and user records into fixed-length feature vectors.
//
// Both layouts put the category one-hot at the same offset so that a user's
// preferred categories line up with a product's category under cosine
// similarity:
//
//   product: [price tier, popularity, rating,
//             category one-hot (V),
//             colors, sizes, materials, features,
//             spring, summer, fall, winter,
//             word count, quality terms, discount terms]
//
//   user:    [price min, price max, preferred category count,
//             category one-hot (V),
//             six personalization scores,
//             purchases, spent, average order value,
//             time-of-day clicks, day-of-week clicks]
//
// Every slot is clamped to [0, 1]; absent attributes encode as 0.

#include <string>
#include <unordered_map>
#include <vector>
#include "Records.hpp"

class FeatureEncoder {
public:
    explicit FeatureEncoder(const std::vector<std::string>& category_vocabulary);

    std::vector<float> encode_product(const Product& product) const;
    std::vector<float> encode_user(const UserRecord& user) const;

    size_t product_dimension() const;
    size_t user_dimension() const;

    // Lexical counts over lower-cased name + description
    struct TextSignals {
        int meaningful_words;   // length > 2 and not a stop word
        int quality_terms;      // premium, luxury, high-quality
        int discount_terms;     // sale, discount, cheap, affordable
    };
    static TextSignals extract_text_signals(const std::string& text);

    static constexpr size_t kLeadingSlots = 3;

private:
    std::vector<std::string> vocabulary_;
    std::unordered_map<std::string, size_t> vocabulary_index_;

    void push_category_one_hot(std::vector<float>& features,
                               const std::vector<std::string>& categories) const;
};
