#include <gtest/gtest.h>
#include "core/ParseCache.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace obs_sitter;
namespace fs = std::filesystem;

class ParseCacheTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "obs_sitter_parse_cache_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path create_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream file(path);
        file << content;
        file.close();
        return path;
    }
};

// Test 1: ParsesAndCaches - second lookup returns the same entry
TEST_F(ParseCacheTest, ParsesAndCaches) {
    auto path = create_file("worker.rb", "class Worker\nend\n");
    ParseCache cache;

    const ParsedFile* first = cache.get(path);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(first->tree, nullptr);
    EXPECT_EQ(first->source, "class Worker\nend\n");

    const ParsedFile* second = cache.get(test_dir_ / "." / "worker.rb");
    EXPECT_EQ(first, second) << "Equivalent paths share one entry";
    EXPECT_EQ(cache.size(), 1u);
}

// Test 2: SyntaxErrorKeepsSource - a broken file is cached without a tree
TEST_F(ParseCacheTest, SyntaxErrorKeepsSource) {
    auto path = create_file("broken.rb", "class Broken\n  def go(\nend\n");
    ParseCache cache;

    const ParsedFile* parsed = cache.get(path);
    ASSERT_NE(parsed, nullptr);
    EXPECT_EQ(parsed->tree, nullptr);
    EXPECT_FALSE(parsed->source.empty());
}

// Test 3: MissingFile - nothing is cached for a missing path
TEST_F(ParseCacheTest, MissingFile) {
    ParseCache cache;

    EXPECT_EQ(cache.get(test_dir_ / "missing.rb"), nullptr);
    EXPECT_EQ(cache.get(test_dir_), nullptr) << "Directories are not files";
    EXPECT_EQ(cache.size(), 0u);
}

// Test 4: ModifiedFileIsReparsed - a newer mtime invalidates the entry
TEST_F(ParseCacheTest, ModifiedFileIsReparsed) {
    auto path = create_file("service.rb", "class Service\nend\n");
    ParseCache cache;

    ASSERT_NE(cache.get(path), nullptr);

    create_file("service.rb", "module Service\nend\n");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));

    const ParsedFile* reparsed = cache.get(path);
    ASSERT_NE(reparsed, nullptr);
    EXPECT_EQ(reparsed->source, "module Service\nend\n");
    EXPECT_EQ(cache.size(), 1u);
}

// Test 5: ReadFile - whole-file read helper
TEST_F(ParseCacheTest, ReadFile) {
    auto path = create_file("plain.rb", "x = 1\n");

    EXPECT_EQ(ParseCache::read_file(path), "x = 1\n");
    EXPECT_FALSE(ParseCache::read_file(test_dir_ / "missing.rb").has_value());
}

// Test 6: Clear - empties the cache
TEST_F(ParseCacheTest, Clear) {
    ParseCache cache;
    cache.get(create_file("a.rb", "module A; end"));
    cache.get(create_file("b.rb", "module B; end"));
    EXPECT_EQ(cache.size(), 2u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}
