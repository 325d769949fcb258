#include <gtest/gtest.h>
#include "ContentFilter.hpp"

namespace {

struct Embeddings {
    EmbeddingIndex users;
    EmbeddingIndex products;
};

Embeddings make_embeddings() {
    Embeddings e;
    e.users.put("U", {1.0f, 0.0f, 0.0f});
    e.users.put("ZERO", {0.0f, 0.0f, 0.0f});
    e.products.put("P1", {1.0f, 0.0f, 0.0f});    // identical
    e.products.put("P2", {1.0f, 1.0f, 0.0f});    // 45 degrees
    e.products.put("P3", {0.0f, 0.0f, 1.0f});    // orthogonal
    e.products.put("P4", {2.0f, 2.0f, 0.0f});    // same direction as P2
    return e;
}

} // namespace

TEST(ContentFilterTest, RanksByCosineSimilarity) {
    Embeddings e = make_embeddings();
    ContentFilter filter;
    auto results = filter.recommend("U", e.users, e.products, 10);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].product_id, "P1");
    EXPECT_NEAR(results[0].score, 1.0, 1e-6);

    // Equal scores fall back to product id order
    EXPECT_EQ(results[1].product_id, "P2");
    EXPECT_EQ(results[2].product_id, "P4");
    EXPECT_NEAR(results[1].score, results[2].score, 1e-6);

    for (const auto& candidate : results) {
        EXPECT_EQ(candidate.sources.count(RecommendationSource::ContentBased), 1u);
    }
}

TEST(ContentFilterTest, TopKRespectsLimit) {
    Embeddings e = make_embeddings();
    ContentFilter filter;
    auto results = filter.recommend("U", e.users, e.products, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].product_id, "P1");
    EXPECT_EQ(results[1].product_id, "P2");
}

TEST(ContentFilterTest, MissingUserEmbeddingGivesNothing) {
    Embeddings e = make_embeddings();
    ContentFilter filter;
    EXPECT_TRUE(filter.recommend("NOBODY", e.users, e.products, 10).empty());
}

TEST(ContentFilterTest, OrthogonalProductsAreDropped) {
    Embeddings e = make_embeddings();
    ContentFilter filter;
    for (const auto& candidate : filter.recommend("U", e.users, e.products, 10)) {
        EXPECT_NE(candidate.product_id, "P3");
        EXPECT_GT(candidate.score, 0.0);
    }
}

TEST(ContentFilterTest, ZeroEmbeddingGivesNothing) {
    Embeddings e = make_embeddings();
    ContentFilter filter;
    EXPECT_TRUE(filter.recommend("ZERO", e.users, e.products, 10).empty());
}

TEST(EmbeddingIndexTest, RejectsMismatchedDimension) {
    EmbeddingIndex index;
    index.put("a", {1.0f, 2.0f});
    EXPECT_THROW(index.put("b", {1.0f}), std::invalid_argument);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.dimension(), 2u);
    EXPECT_EQ(index.find("b"), nullptr);
}
