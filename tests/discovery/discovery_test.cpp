#include "mx/discovery/discovery.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

using mx::discovery::collect_candidates;

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        root_ = fs::temp_directory_path() /
                ("mx_discovery_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path touch(const std::string& relative) {
        auto path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << "data";
        return path;
    }

    static std::vector<std::string> names(const std::vector<fs::path>& paths) {
        std::vector<std::string> result;
        for (const auto& p : paths) {
            result.push_back(p.filename().string());
        }
        return result;
    }

    fs::path root_;
};

TEST_F(DiscoveryTest, ExplicitFilesAreFiltered) {
    auto video = touch("a.mp4");
    auto text = touch("b.txt");

    auto result = collect_candidates({video, text});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"a.mp4"}));
}

TEST_F(DiscoveryTest, DirectoriesAreWalkedRecursively) {
    touch("videos/b.mkv");
    touch("videos/a.mp4");
    touch("videos/nested/deeper/c.webm");
    touch("videos/nested/readme.txt");

    auto result = collect_candidates({root_ / "videos"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"a.mp4", "b.mkv", "c.webm"}));
}

TEST_F(DiscoveryTest, DuplicatesKeepFirstPosition) {
    auto a = touch("a.mp4");
    touch("b.mp4");

    auto result = collect_candidates({a, root_, root_ / "." / "a.mp4"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"a.mp4", "b.mp4"}));
}

TEST_F(DiscoveryTest, MissingPathIsAnError) {
    auto result = collect_candidates({root_ / "does-not-exist"});

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("does-not-exist"), std::string::npos);
}

TEST_F(DiscoveryTest, NoEligibleFilesGivesEmptyList) {
    touch("docs/notes.txt");

    auto result = collect_candidates({root_ / "docs"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}
