#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "EngineConfig.hpp"

namespace fs = std::filesystem;

namespace {

fs::path write_config(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".json");
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(EngineConfigTest, DefaultsMatchProductionValues) {
    EngineConfig config;
    EXPECT_DOUBLE_EQ(config.weights.collaborative, 0.4);
    EXPECT_DOUBLE_EQ(config.weights.content_based, 0.4);
    EXPECT_DOUBLE_EQ(config.weights.trending, 0.2);
    EXPECT_DOUBLE_EQ(config.boosts.category, 1.3);
    EXPECT_DOUBLE_EQ(config.boosts.price, 1.2);
    EXPECT_DOUBLE_EQ(config.boosts.brand, 1.4);
    EXPECT_DOUBLE_EQ(config.boosts.season, 1.1);
    EXPECT_DOUBLE_EQ(config.min_neighbor_similarity, 0.1);
    EXPECT_EQ(config.max_neighbors, 10u);
    EXPECT_EQ(config.max_events_per_user, 100u);
    EXPECT_EQ(config.refresh_event_threshold, 50u);
    EXPECT_EQ(config.refresh_interval, std::chrono::seconds(300));
    EXPECT_EQ(config.candidate_multiplier, 2u);
}

TEST(EngineConfigTest, OverridesOnlyListedFields) {
    fs::path path = write_config("engine_partial", R"({
        "server": {"port": 9090},
        "weights": {"trending": 0.5},
        "refresh": {"event_threshold": 10, "interval_seconds": 60},
        "encoder": {"category_vocabulary": ["a", "b"]}
    })");

    EngineConfig config;
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_DOUBLE_EQ(config.weights.trending, 0.5);
    EXPECT_DOUBLE_EQ(config.weights.collaborative, 0.4);
    EXPECT_EQ(config.refresh_event_threshold, 10u);
    EXPECT_EQ(config.refresh_interval, std::chrono::seconds(60));
    EXPECT_EQ(config.category_vocabulary, (std::vector<std::string>{"a", "b"}));

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(EngineConfigTest, BadFileLeavesDefaultsUntouched) {
    fs::path path = write_config("engine_bad", R"({"server": {"port": "not a number"}})");

    EngineConfig config;
    EXPECT_FALSE(config.load(path.string()));
    EXPECT_EQ(config.port, 8080);
    EXPECT_FALSE(config.load("/nonexistent/engine.json"));

    std::error_code ec;
    fs::remove(path, ec);
}
