#include "mx/cli/app.hpp"
#include "support/fake_protocol_client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

using mx::archive::UploadError;
using mx::cli::Options;
using mx::testing::FakeProtocolClient;

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        root_ = fs::temp_directory_path() /
                ("mx_app_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(root_);

        options_.api_key = "k";
        options_.finalize.tags = "spin";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path touch(const std::string& name) {
        auto path = root_ / name;
        std::ofstream out(path);
        out << "data";
        return path;
    }

    static std::size_t count_lines(const std::string& text, const std::string& needle) {
        std::size_t count = 0;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (line.find(needle) != std::string::npos) {
                count++;
            }
        }
        return count;
    }

    fs::path root_;
    Options options_;
    FakeProtocolClient client_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(AppTest, TenFilesOneDuplicateExitsZero) {
    for (int i = 0; i < 10; ++i) {
        touch("clip" + std::to_string(i) + ".mp4");
    }
    client_.fail_initiate("clip7.mp4", UploadError::validation("duplicate file"));
    options_.paths = {root_};

    int code = mx::cli::run(options_, client_, out_, err_);

    EXPECT_EQ(code, mx::cli::kExitOk);
    EXPECT_EQ(count_lines(out_.str(), "] Uploaded: https://archive.test/uploads/"), 9u);
    EXPECT_EQ(count_lines(err_.str(), "clip7.mp4] Error: duplicate file"), 1u);
}

TEST_F(AppTest, AllRejectedStillExitsZero) {
    touch("a.mp4");
    touch("b.mp4");
    client_.reject_all_credentials();
    options_.paths = {root_};

    int code = mx::cli::run(options_, client_, out_, err_);

    EXPECT_EQ(code, mx::cli::kExitOk);
    EXPECT_EQ(count_lines(err_.str(), "] Error: Invalid API key"), 2u);
    EXPECT_EQ(client_.count("transfer"), 0u);
}

TEST_F(AppTest, NoVideoFilesExitsNonZero) {
    touch("notes.txt");
    options_.paths = {root_};

    int code = mx::cli::run(options_, client_, out_, err_);

    EXPECT_EQ(code, mx::cli::kExitFailure);
    EXPECT_NE(err_.str().find("No video files found."), std::string::npos);
    EXPECT_TRUE(client_.calls().empty());
}

TEST_F(AppTest, InvalidPathExitsNonZero) {
    touch("a.mp4");
    options_.paths = {root_ / "a.mp4", root_ / "missing"};

    int code = mx::cli::run(options_, client_, out_, err_);

    EXPECT_EQ(code, mx::cli::kExitFailure);
    EXPECT_NE(err_.str().find("missing"), std::string::npos);
    EXPECT_TRUE(client_.calls().empty());
}
