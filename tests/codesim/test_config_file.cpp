#include <gtest/gtest.h>
#include <codesim/config_file.hpp>

#include <filesystem>
#include <fstream>

using namespace codesim;
namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "codesim_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write(const std::string& content) {
        fs::path path = test_dir_ / "codesim.json";
        std::ofstream(path) << content;
        return path;
    }

    fs::path test_dir_;
    ComparisonConfig comparison_;
    CollectorConfig collector_;
};

TEST_F(ConfigFileTest, AppliesKnownKeys) {
    auto path = write(R"({
        "k": 7,
        "threads": 3,
        "max_file_bytes": 1024,
        "max_pairwise_comparisons": 50,
        "extensions": [".java"],
        "ignore_dirs": ["out"],
        "extra_keywords": ["record", "sealed"]
    })");

    auto result = load_config_file(path, comparison_, collector_);
    ASSERT_TRUE(result.ok()) << result.error().to_string();

    EXPECT_EQ(comparison_.shingle_size, 7);
    EXPECT_EQ(comparison_.threads, 3u);
    EXPECT_EQ(comparison_.max_file_bytes, 1024u);
    EXPECT_EQ(comparison_.max_pairwise_comparisons, 50u);
    EXPECT_EQ(collector_.extensions, (std::set<std::string>{".java"}));
    EXPECT_EQ(collector_.ignore_dirs, (std::set<std::string>{"out"}));
    EXPECT_TRUE(comparison_.keywords.contains("record"));
    EXPECT_TRUE(comparison_.keywords.contains("class"));
}

TEST_F(ConfigFileTest, AbsentKeysKeepDefaults) {
    auto path = write(R"({"k": 3})");
    ASSERT_TRUE(load_config_file(path, comparison_, collector_).ok());

    EXPECT_EQ(comparison_.shingle_size, 3);
    EXPECT_EQ(comparison_.max_tokens_per_file, ComparisonConfig().max_tokens_per_file);
    EXPECT_EQ(collector_.extensions, CollectorConfig().extensions);
}

TEST_F(ConfigFileTest, UnknownKeyRejected) {
    auto path = write(R"({"shingle": 3})");
    EXPECT_EQ(load_config_file(path, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, WrongTypeRejected) {
    auto path = write(R"({"k": "five"})");
    EXPECT_EQ(load_config_file(path, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, NegativeCountRejected) {
    auto path = write(R"({"threads": -1})");
    EXPECT_EQ(load_config_file(path, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(comparison_.threads, 0u);
}

TEST_F(ConfigFileTest, FractionalNumbersRejected) {
    auto k = write(R"({"k": 2.5})");
    EXPECT_EQ(load_config_file(k, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(comparison_.shingle_size, DEFAULT_SHINGLE_SIZE);

    auto bytes = write(R"({"max_file_bytes": 1024.5})");
    EXPECT_EQ(load_config_file(bytes, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, OutOfRangeShingleSizeRejected) {
    auto path = write(R"({"k": 5000000000})");
    EXPECT_EQ(load_config_file(path, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, ExcessiveThreadsFailValidation) {
    auto path = write(R"({"threads": 100000})");
    ASSERT_TRUE(load_config_file(path, comparison_, collector_).ok());
    EXPECT_EQ(comparison_.validate().error_code(), ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, MalformedJsonRejected) {
    auto path = write("{ not json");
    EXPECT_EQ(load_config_file(path, comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, NonObjectRejected) {
    EXPECT_EQ(apply_config(nlohmann::json::array(), comparison_, collector_).error_code(),
              ErrorCode::INVALID_CONFIG);
}

TEST_F(ConfigFileTest, MissingFile) {
    EXPECT_EQ(load_config_file(test_dir_ / "none.json", comparison_, collector_).error_code(),
              ErrorCode::NOT_FOUND);
}

TEST_F(ConfigFileTest, ValidationCatchesBadK) {
    ASSERT_TRUE(apply_config({{"k", 0}}, comparison_, collector_).ok());
    EXPECT_EQ(comparison_.validate().error_code(), ErrorCode::INVALID_CONFIG);
}
