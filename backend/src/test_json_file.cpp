#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "JsonFile.hpp"

namespace fs = std::filesystem;

namespace {

fs::path temp_path(const std::string& name) {
    return fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".json");
}

} // namespace

TEST(JsonFileTest, WritesAndReplacesWithoutLeavingTempFile) {
    fs::path path = temp_path("json_file_replace");
    {
        std::ofstream out(path);
        out << "stale";
    }

    json j = {{"P1", {{"views", 3}}}};
    ASSERT_TRUE(write_json_atomically(path.string(), j, 2, "Test"));
    EXPECT_FALSE(fs::exists(path.string() + ".tmp"));

    std::ifstream in(path);
    json read_back;
    in >> read_back;
    EXPECT_EQ(read_back["P1"]["views"].get<int>(), 3);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(JsonFileTest, UnwritableDirectoryReportsFalse) {
    EXPECT_FALSE(write_json_atomically("/nonexistent/dir/out.json", json::object(), -1, "Test"));
}
