// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации YAML (GoogleTest)
// ==============================================================================

#include "anirename/config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace anirename::config::test {

using Strings = std::vector<std::string>;

// ==============================================================================
// parse_config
// ==============================================================================

TEST(ParseConfigTest, AllKeys) {
    // Arrange
    const std::string yaml = R"(
release_groups: [Foo, Bar]
extra_release_groups: [Baz]
technical_keywords: [remux]
extra_technical_keywords: [dual-audio]
extensions: [mkv, .mp4]
)";

    // Act
    ConfigResult result = parse_config(yaml);

    // Assert
    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_TRUE(result.config.release_groups.has_value());
    EXPECT_EQ(*result.config.release_groups, (Strings{"Foo", "Bar"}));
    EXPECT_EQ(result.config.extra_release_groups, (Strings{"Baz"}));
    ASSERT_TRUE(result.config.technical_keywords.has_value());
    EXPECT_EQ(*result.config.technical_keywords, (Strings{"remux"}));
    EXPECT_EQ(result.config.extra_technical_keywords, (Strings{"dual-audio"}));
    EXPECT_EQ(result.config.extensions, (Strings{"mkv", "mp4"}));
}

TEST(ParseConfigTest, EmptyText_IsEmptyConfig) {
    ConfigResult result = parse_config("");

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_FALSE(result.config.release_groups.has_value());
    EXPECT_FALSE(result.config.technical_keywords.has_value());
    EXPECT_TRUE(result.config.extensions.empty());
}

TEST(ParseConfigTest, UnknownKeysAreIgnored) {
    ConfigResult result = parse_config("colour: blue\nextra_release_groups: [X]\n");

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.extra_release_groups, (Strings{"X"}));
}

TEST(ParseConfigTest, NonListValue_IsError) {
    ConfigResult result = parse_config("release_groups: Foo\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "'release_groups' must be a list of strings");
}

TEST(ParseConfigTest, NestedListItem_IsError) {
    ConfigResult result = parse_config("extensions:\n  - [mkv]\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "'extensions' must be a list of strings");
}

TEST(ParseConfigTest, NonMappingRoot_IsError) {
    ConfigResult result = parse_config("- a\n- b\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "configuration root must be a mapping");
}

TEST(ParseConfigTest, MalformedYaml_IsError) {
    ConfigResult result = parse_config("release_groups: [Foo\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("YAML parse error: ", 0), 0u) << result.error;
}

// ==============================================================================
// apply_config
// ==============================================================================

TEST(ApplyConfigTest, EmptyConfig_KeepsBase) {
    classify::Vocabulary base{{"k1", "k2"}, {"G1"}};

    classify::Vocabulary v = apply_config(Config{}, base);

    EXPECT_EQ(v.technical_keywords, base.technical_keywords);
    EXPECT_EQ(v.release_groups, base.release_groups);
}

TEST(ApplyConfigTest, ReplaceThenExtend) {
    classify::Vocabulary base{{"k1"}, {"G1", "G2"}};
    Config cfg;
    cfg.release_groups = Strings{"New"};
    cfg.extra_release_groups = {"Extra"};
    cfg.extra_technical_keywords = {"k2"};

    classify::Vocabulary v = apply_config(cfg, base);

    EXPECT_EQ(v.release_groups, (Strings{"New", "Extra"}));
    EXPECT_EQ(v.technical_keywords, (Strings{"k1", "k2"}));
}

TEST(ApplyConfigTest, DuplicatesAreRemoved) {
    classify::Vocabulary base{{"web"}, {"DMG"}};
    Config cfg;
    cfg.extra_release_groups = {"DMG", "Other", "Other"};
    cfg.extra_technical_keywords = {"web"};

    classify::Vocabulary v = apply_config(cfg, base);

    EXPECT_EQ(v.release_groups, (Strings{"DMG", "Other"}));
    EXPECT_EQ(v.technical_keywords, (Strings{"web"}));
}

// ==============================================================================
// load_config
// ==============================================================================

class LoadConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("anirename_config_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = test_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(LoadConfigTest, ReadsFile) {
    auto path = write_file("anirename.yaml", "extra_release_groups:\n  - MyGroup\n");

    ConfigResult result = load_config(path);

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.config.extra_release_groups, (Strings{"MyGroup"}));
}

TEST_F(LoadConfigTest, MissingFile_IsError) {
    ConfigResult result = load_config(test_dir_ / "missing.yaml");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("cannot open config file: ", 0), 0u) << result.error;
}

TEST_F(LoadConfigTest, InvalidContent_ErrorNamesFile) {
    auto path = write_file("bad.yaml", "extensions: mkv\n");

    ConfigResult result = load_config(path);

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("bad.yaml"), std::string::npos);
    EXPECT_NE(result.error.find("'extensions' must be a list of strings"), std::string::npos);
}

}  // namespace anirename::config::test
