// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/config_source.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace logset {
namespace {

class ConfigSourceTest : public test::TempDirTest {
protected:
    void write(const std::string& name, const std::string& content) {
        std::ofstream out(test_dir_ / name, std::ios::binary);
        out << content;
    }
};

TEST_F(ConfigSourceTest, MissingFileGivesDefaults) {
    auto source = JsonFileConfigSource::in_directory(test_dir_);
    EXPECT_FALSE(source->locate().has_value());

    ::testing::internal::CaptureStderr();
    auto config = source->read(true);
    auto err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(config, default_config());
    EXPECT_NE(err.find("logset: No logging config file found. Using defaults"), std::string::npos);
}

TEST_F(ConfigSourceTest, MissingFileSilentWithoutWarning) {
    auto source = JsonFileConfigSource::in_directory(test_dir_);

    ::testing::internal::CaptureStderr();
    auto config = source->read(false);
    auto err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(config, default_config());
    EXPECT_TRUE(err.empty());
}

TEST_F(ConfigSourceTest, UnreadableDirectoryGivesDefaults) {
    write("plain", "not a directory");

    for (const auto& dir : {test_dir_ / "missing", test_dir_ / "plain"}) {
        auto source = JsonFileConfigSource::in_directory(dir);
        EXPECT_FALSE(source->locate().has_value()) << dir.string();
        EXPECT_EQ(source->read(false), default_config()) << dir.string();
    }
}

TEST_F(ConfigSourceTest, FindsFileBySuffix) {
    write("notes.txt", "{}");
    write("myapp.logging.config", R"({"numFiles": 4})");

    auto source = JsonFileConfigSource::in_directory(test_dir_);
    auto path = source->locate();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->filename().string(), "myapp.logging.config");
    EXPECT_EQ(source->read(false).max_files, 4);
}

TEST_F(ConfigSourceTest, FirstMatchByName) {
    write("b.logging.config", R"({"numFiles": 2})");
    write("a.logging.config", R"({"numFiles": 5})");

    auto source = JsonFileConfigSource::in_directory(test_dir_);
    EXPECT_EQ(source->read(false).max_files, 5);
}

TEST_F(ConfigSourceTest, ExplicitFile) {
    write("custom.json", R"({"priority": "DEBUG"})");
    auto source = JsonFileConfigSource::from_file(test_dir_ / "custom.json");
    EXPECT_EQ(source->read(false).threshold, Priority::Debug);
}

TEST_F(ConfigSourceTest, MalformedFileGivesDefaults) {
    write("app.logging.config", "{ \"numFiles\": ");
    auto source = JsonFileConfigSource::in_directory(test_dir_);

    ::testing::internal::CaptureStderr();
    auto config = source->read(false);
    auto err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(config, default_config());
    EXPECT_NE(err.find("Error parsing"), std::string::npos);
}

TEST_F(ConfigSourceTest, RereadSeesChanges) {
    write("app.logging.config", R"({"numFiles": 2})");
    auto source = JsonFileConfigSource::in_directory(test_dir_);
    EXPECT_EQ(source->read(false).max_files, 2);

    write("app.logging.config", R"({"numFiles": 6})");
    EXPECT_EQ(source->read(false).max_files, 6);
}

TEST(StaticConfigSourceTest, ReturnsWhatWasSet) {
    StaticConfigSource source;
    EXPECT_EQ(source.read(true), default_config());

    auto config = default_config();
    config.max_files = 11;
    source.set(config);
    EXPECT_EQ(source.read(false), config);
}

} // anonymous namespace
} // namespace logset
