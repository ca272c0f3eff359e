#include <gtest/gtest.h>
#include "core/PathResolver.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace obs_sitter;
namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        // Create temporary repository layout
        test_dir_ = fs::temp_directory_path() / "obs_sitter_path_resolver_test";
        fs::remove_all(test_dir_);

        create_file(test_dir_ / "app/models/user.rb", "class User\nend\n");
        create_file(test_dir_ / "app/models/admin/user.rb", "module Admin\n  class User\n  end\nend\n");
        create_file(test_dir_ / "app/models/superuser.rb", "class Superuser < User\nend\n");
        create_file(test_dir_ / "app/models/notes.txt", "Not Ruby");
        create_file(test_dir_ / "lib/tasks/cleanup.rb", "module Cleanup\nend\n");
        create_file(test_dir_ / "app/.hidden/secret.rb", "class Secret\nend\n");
        create_file(test_dir_ / "spec/models/user_spec.rb", "describe User do\nend\n");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void create_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
        file.close();
    }
};

TEST_F(PathResolverTest, SingleFile) {
    auto results = PathResolver::resolve_paths({"app/models/user.rb"}, test_dir_);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0], (test_dir_ / "app/models/user.rb").lexically_normal());
}

TEST_F(PathResolverTest, DirectoryExpandsToSortedRubyFiles) {
    auto results = PathResolver::resolve_paths({(test_dir_ / "app/models").string()}, test_dir_);

    // admin/user.rb, superuser.rb, user.rb; notes.txt is skipped
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].filename(), "user.rb");
    EXPECT_EQ(results[0].parent_path().filename(), "admin");
    EXPECT_EQ(results[1].filename(), "superuser.rb");
    EXPECT_EQ(results[2].filename(), "user.rb");
}

TEST_F(PathResolverTest, InputOrderKeptAndDuplicatesDropped) {
    auto results = PathResolver::resolve_paths(
        {"lib/tasks/cleanup.rb", "app/models/user.rb", "./lib/tasks/cleanup.rb"}, test_dir_);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].filename(), "cleanup.rb");
    EXPECT_EQ(results[1].filename(), "user.rb");
}

TEST_F(PathResolverTest, MissingFilePassedThrough) {
    auto results = PathResolver::resolve_paths({"app/models/deleted.rb"}, test_dir_);

    ASSERT_EQ(results.size(), 1u) << "The collector decides what to do with missing files";
    EXPECT_EQ(results[0].filename(), "deleted.rb");
}

TEST_F(PathResolverTest, RubyFilesSkipsHiddenDirectories) {
    auto results = PathResolver::ruby_files(test_dir_ / "app");

    ASSERT_EQ(results.size(), 3u);
    for (const auto& path : results) {
        EXPECT_EQ(path.string().find(".hidden"), std::string::npos);
    }
    EXPECT_TRUE(std::is_sorted(results.begin(), results.end()));
}

TEST_F(PathResolverTest, RubyFilesOfMissingDirectory) {
    EXPECT_TRUE(PathResolver::ruby_files(test_dir_ / "nope").empty());
}

TEST_F(PathResolverTest, EndsWithComponents) {
    EXPECT_TRUE(PathResolver::ends_with_components("app/models/admin/user.rb", "admin/user.rb"));
    EXPECT_TRUE(PathResolver::ends_with_components("app/models/user.rb", "user.rb"));
    EXPECT_FALSE(PathResolver::ends_with_components("app/models/superuser.rb", "user.rb"));
    EXPECT_FALSE(PathResolver::ends_with_components("user.rb", "models/user.rb"));
}

TEST_F(PathResolverTest, IsTestPath) {
    EXPECT_TRUE(PathResolver::is_test_path(test_dir_ / "spec/models/user_spec.rb", test_dir_));
    EXPECT_TRUE(PathResolver::is_test_path(test_dir_ / "test/models/helper.rb", test_dir_));
    EXPECT_TRUE(PathResolver::is_test_path(test_dir_ / "app/models/user_test.rb", test_dir_));
    EXPECT_FALSE(PathResolver::is_test_path(test_dir_ / "app/models/user.rb", test_dir_));
    EXPECT_FALSE(PathResolver::is_test_path(test_dir_ / "app/models/contest.rb", test_dir_));
}

TEST_F(PathResolverTest, FindFirstLineMatch) {
    auto files = PathResolver::ruby_files(test_dir_ / "app");
    std::regex pattern("^\\s*class\\s+" + PathResolver::regex_escape("User") + "\\b");

    auto found = PathResolver::find_first_line_match(files, pattern);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->parent_path().filename(), "admin") << "First file in sorted order wins";

    std::regex missing("^\\s*class\\s+Nobody\\b");
    EXPECT_FALSE(PathResolver::find_first_line_match(files, missing).has_value());
}

TEST_F(PathResolverTest, RegexEscape) {
    EXPECT_EQ(PathResolver::regex_escape("A::B"), "A::B");
    EXPECT_EQ(PathResolver::regex_escape("a.b*c"), "a\\.b\\*c");
}
