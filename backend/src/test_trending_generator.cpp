#include <gtest/gtest.h>
#include <stdexcept>
#include "ProductCatalog.hpp"
#include "TrendingGenerator.hpp"

namespace {

Product make_product(const std::string& id, double trending, long views,
                     bool featured = false, const std::string& status = "active") {
    Product p;
    p.id = id;
    p.analytics.trending_score = trending;
    p.analytics.views = views;
    p.featured = featured;
    p.status = status;
    return p;
}

class BrokenRepository : public ProductRepository {
public:
    std::vector<Product> active_products() const override {
        throw std::runtime_error("catalog unavailable");
    }
    bool get(const std::string&, Product&) const override { return false; }
    bool increment_counter(const std::string&, InteractionKind) override { return false; }
};

} // namespace

TEST(TrendingGeneratorTest, OrdersByTrendingScoreThenViews) {
    ProductCatalog catalog;
    catalog.add_product(make_product("a", 0.2, 500));
    catalog.add_product(make_product("b", 0.9, 10));
    catalog.add_product(make_product("c", 0.2, 900));
    catalog.add_product(make_product("d", 1.0, 0, false, "archived"));

    TrendingGenerator generator(catalog);
    auto results = generator.trending(10);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].product_id, "b");
    EXPECT_EQ(results[1].product_id, "c");
    EXPECT_EQ(results[2].product_id, "a");
    for (const auto& candidate : results) {
        EXPECT_DOUBLE_EQ(candidate.score, 0.8);
        EXPECT_EQ(candidate.sources.count(RecommendationSource::Trending), 1u);
    }

    EXPECT_EQ(generator.trending(2).size(), 2u);
}

TEST(TrendingGeneratorTest, FallbackPrefersFeaturedProducts) {
    ProductCatalog catalog;
    catalog.add_product(make_product("plain", 0.0, 10000));
    catalog.add_product(make_product("f1", 0.0, 5, true));
    catalog.add_product(make_product("f2", 0.0, 50, true));

    TrendingGenerator generator(catalog);
    auto results = generator.fallback(10);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].product_id, "f2");
    EXPECT_EQ(results[1].product_id, "f1");
    EXPECT_DOUBLE_EQ(results[0].score, 0.5);
    EXPECT_EQ(results[0].sources.count(RecommendationSource::Fallback), 1u);
}

TEST(TrendingGeneratorTest, FallbackWithoutFeaturedUsesAllActive) {
    ProductCatalog catalog;
    catalog.add_product(make_product("x", 0.0, 3));
    catalog.add_product(make_product("y", 0.0, 30));
    catalog.add_product(make_product("z", 0.0, 300, true, "inactive"));

    TrendingGenerator generator(catalog);
    auto results = generator.fallback(10);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].product_id, "y");
    EXPECT_EQ(results[1].product_id, "x");
}

TEST(TrendingGeneratorTest, EmptyCatalogGivesEmptyLists) {
    ProductCatalog catalog;
    TrendingGenerator generator(catalog);
    EXPECT_TRUE(generator.trending(5).empty());
    EXPECT_TRUE(generator.fallback(5).empty());
}

TEST(TrendingGeneratorTest, FallbackNeverThrows) {
    BrokenRepository broken;
    TrendingGenerator generator(broken);
    std::vector<RecommendationCandidate> results;
    EXPECT_NO_THROW(results = generator.fallback(5));
    EXPECT_TRUE(results.empty());
}
