#include <gtest/gtest.h>
#include "HybridRanker.hpp"

namespace {

std::vector<RecommendationCandidate> list(
    std::initializer_list<std::pair<const char*, double>> entries,
    RecommendationSource source) {
    std::vector<RecommendationCandidate> out;
    for (const auto& entry : entries) {
        out.emplace_back(entry.first, entry.second, source);
    }
    return out;
}

Product make_product(const std::string& id) {
    Product p;
    p.id = id;
    p.category = "shoes";
    p.brand = "Acme";
    p.price = 120.0;
    p.attributes.seasons = {"Summer"};
    return p;
}

UserRecord fan_of_everything() {
    UserRecord u;
    u.id = "U";
    u.preferred_categories = {"shoes"};
    u.preferred_brands = {"Acme"};
    u.price_range.min = 100;
    u.price_range.max = 200;
    return u;
}

} // namespace

TEST(HybridRankerTest, MergesWeightedSourcesIntoOrderedList) {
    HybridRanker ranker;
    auto merged = ranker.combine({
        {list({{"P1", 0.5}}, RecommendationSource::Collaborative), 0.4},
        {list({{"P1", 0.8}}, RecommendationSource::ContentBased), 0.4},
        {list({{"P2", 0.8}}, RecommendationSource::Trending), 0.2}
    });

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].product_id, "P1");
    EXPECT_NEAR(merged[0].score, 0.52, 1e-12);
    EXPECT_EQ(merged[1].product_id, "P2");
    EXPECT_NEAR(merged[1].score, 0.16, 1e-12);

    EXPECT_EQ(merged[0].sources.size(), 2u);
    EXPECT_EQ(merged[0].sources.count(RecommendationSource::Collaborative), 1u);
    EXPECT_EQ(merged[0].sources.count(RecommendationSource::ContentBased), 1u);
    EXPECT_EQ(merged[1].sources.count(RecommendationSource::Trending), 1u);
}

TEST(HybridRankerTest, ScoreInBothModelListsIsExactWeightedSum) {
    HybridRanker ranker;
    const double c = 0.37;
    const double d = 0.91;
    const SourceWeights& w = ranker.weights();

    auto merged = ranker.combine({
        {list({{"P", c}}, RecommendationSource::Collaborative), w.collaborative},
        {list({{"P", d}}, RecommendationSource::ContentBased), w.content_based}
    });

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_DOUBLE_EQ(merged[0].score, 0.4 * c + 0.4 * d);
}

TEST(HybridRankerTest, CombineHasNoDuplicates) {
    HybridRanker ranker;
    auto merged = ranker.combine({
        {list({{"A", 0.1}, {"B", 0.2}, {"C", 0.3}}, RecommendationSource::Collaborative), 0.4},
        {list({{"C", 0.5}, {"A", 0.4}}, RecommendationSource::ContentBased), 0.4},
        {list({{"B", 0.8}, {"D", 0.8}}, RecommendationSource::Trending), 0.2}
    });

    ASSERT_EQ(merged.size(), 4u);
    for (size_t i = 1; i < merged.size(); ++i) {
        EXPECT_GE(merged[i - 1].score, merged[i].score);
        EXPECT_NE(merged[i - 1].product_id, merged[i].product_id);
    }
}

TEST(HybridRankerTest, BoostIsMultiplicativeAndBounded) {
    HybridRanker ranker;
    double full = ranker.personalization_boost(make_product("P"), fan_of_everything(), Season::Summer);
    EXPECT_NEAR(full, 1.3 * 1.2 * 1.4 * 1.1, 1e-12);

    // Season compared case-insensitively; out of season drops that factor only
    double no_season = ranker.personalization_boost(make_product("P"), fan_of_everything(), Season::Winter);
    EXPECT_NEAR(no_season, 1.3 * 1.2 * 1.4, 1e-12);
}

TEST(HybridRankerTest, NoMatchingRuleKeepsBoostOfOne) {
    HybridRanker ranker;
    Product p = make_product("P");
    p.price = 50000.0;   // above the default 0..10000 range
    p.attributes.seasons.clear();

    UserRecord stranger;
    stranger.id = "S";
    EXPECT_DOUBLE_EQ(ranker.personalization_boost(p, stranger, Season::Summer), 1.0);
}

TEST(HybridRankerTest, PriceRangeIsInclusive) {
    HybridRanker ranker;
    Product p;
    p.id = "P";
    UserRecord u;
    u.price_range.min = 100;
    u.price_range.max = 200;

    p.price = 100.0;
    EXPECT_DOUBLE_EQ(ranker.personalization_boost(p, u, Season::Winter), 1.2);
    p.price = 200.0;
    EXPECT_DOUBLE_EQ(ranker.personalization_boost(p, u, Season::Winter), 1.2);
    p.price = 200.01;
    EXPECT_DOUBLE_EQ(ranker.personalization_boost(p, u, Season::Winter), 1.0);
}

TEST(HybridRankerTest, ApplyBoostReordersCandidates) {
    HybridRanker ranker;
    std::vector<RecommendationCandidate> candidates = {
        RecommendationCandidate("plain", 0.50, RecommendationSource::Trending),
        RecommendationCandidate("liked", 0.40, RecommendationSource::Trending),
        RecommendationCandidate("unknown", 0.45, RecommendationSource::Trending)
    };

    Product plain;
    plain.id = "plain";
    plain.price = 50000.0;
    std::unordered_map<std::string, Product> products = {
        {"plain", plain},
        {"liked", make_product("liked")}
    };

    auto boosted = ranker.apply_boost(candidates, products, fan_of_everything(), Season::Summer);
    ASSERT_EQ(boosted.size(), 3u);
    EXPECT_EQ(boosted[0].product_id, "liked");
    EXPECT_NEAR(boosted[0].score, 0.40 * 1.3 * 1.2 * 1.4 * 1.1, 1e-12);
    EXPECT_EQ(boosted[1].product_id, "plain");
    EXPECT_DOUBLE_EQ(boosted[1].score, 0.50);
    EXPECT_EQ(boosted[2].product_id, "unknown");
    EXPECT_DOUBLE_EQ(boosted[2].score, 0.45);
}

TEST(HybridRankerTest, ExcludeRemovesListedProducts) {
    auto kept = HybridRanker::exclude(
        list({{"A", 0.3}, {"B", 0.2}, {"C", 0.1}}, RecommendationSource::Trending),
        {"B", "Z"});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].product_id, "A");
    EXPECT_EQ(kept[1].product_id, "C");
}

TEST(HybridRankerTest, SeasonForZeroBasedMonth) {
    EXPECT_EQ(HybridRanker::season_for_month(0), Season::Winter);
    EXPECT_EQ(HybridRanker::season_for_month(1), Season::Winter);
    EXPECT_EQ(HybridRanker::season_for_month(2), Season::Spring);
    EXPECT_EQ(HybridRanker::season_for_month(4), Season::Spring);
    EXPECT_EQ(HybridRanker::season_for_month(5), Season::Summer);
    EXPECT_EQ(HybridRanker::season_for_month(7), Season::Summer);
    EXPECT_EQ(HybridRanker::season_for_month(8), Season::Fall);
    EXPECT_EQ(HybridRanker::season_for_month(10), Season::Fall);
    EXPECT_EQ(HybridRanker::season_for_month(11), Season::Winter);
    EXPECT_EQ(to_string(Season::Fall), "fall");
}
