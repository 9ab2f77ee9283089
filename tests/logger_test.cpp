// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/logger.hpp"
#include "pkg_sources.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <format>
#include <thread>
#include <vector>

namespace logset {
namespace {

using namespace std::chrono_literals;

// Test fixture with a static config source in a fresh directory
class LoggerTest : public test::TempDirTest {
protected:
    std::shared_ptr<StaticConfigSource> source_;

    void SetUp() override {
        TempDirTest::SetUp();
        source_ = std::make_shared<StaticConfigSource>(make_config());
    }

    LoggerOptions make_options(std::chrono::milliseconds reload = 1h) const {
        LoggerOptions options;
        options.source = source_;
        options.reload_interval = reload;
        return options;
    }

    void use_threshold(Priority threshold) {
        auto config = make_config();
        config.threshold = threshold;
        source_->set(config);
    }

    std::string contents(std::string_view prefix = "test") const {
        return test::read_all(log_files(prefix));
    }
};

// ============================================================================
// Startup
// ============================================================================

TEST_F(LoggerTest, StartupWritesConfigRecord) {
    Logger logger(make_options());
    EXPECT_EQ(logger.state(), LoggerState::Running);
    logger.close();
    EXPECT_EQ(logger.state(), LoggerState::Closed);

    auto text = contents();
    EXPECT_EQ(test::count_occurrences(text, "Log configuration:"), 1u);
    EXPECT_NE(text.find(std::format("  RootDir: {}\n", test_dir_.string())), std::string::npos);
    EXPECT_NE(text.find("  FileName: test\n"), std::string::npos);
    EXPECT_NE(text.find("  Priority: DEBUG\n"), std::string::npos);
}

// ============================================================================
// Filtering
// ============================================================================

TEST_F(LoggerTest, ThresholdFiltersMoreVerbose) {
    use_threshold(Priority::Info);
    Logger logger(make_options());

    EXPECT_EQ(logger.debug("hidden detail"), Delivery::Queued);
    EXPECT_EQ(logger.info("visible"), Delivery::Queued);
    logger.close();

    auto text = contents();
    EXPECT_EQ(test::count_occurrences(text, " [INFO] "), 1u);
    EXPECT_EQ(text.find("hidden detail"), std::string::npos);
    EXPECT_NE(text.find("] -logger_test.cpp, line "), std::string::npos);
    EXPECT_NE(text.find("- visible\n"), std::string::npos);
}

TEST_F(LoggerTest, WarningThresholdDropsInfoAndDebug) {
    use_threshold(Priority::Warning);
    Logger logger(make_options());

    logger.warning("w");
    logger.info("i");
    logger.debug("d");
    logger.close();

    auto text = contents();
    EXPECT_EQ(test::count_occurrences(text, " [WARNING] "), 1u);
    EXPECT_EQ(test::count_occurrences(text, " [INFO] "), 0u);
    EXPECT_EQ(test::count_occurrences(text, " [DEBUG] "), 0u);
}

TEST_F(LoggerTest, FormattedVariants) {
    Logger logger(make_options());
    logger.infof("answer {}", 42);
    logger.warningf("{}-{}", "a", "b");
    logger.debugf("x={:.1f}", 1.5);
    logger.logf(Priority::Info, "via logf {}", 'z');
    logger.close();

    auto text = contents();
    EXPECT_NE(text.find("- answer 42\n"), std::string::npos);
    EXPECT_NE(text.find("- a-b\n"), std::string::npos);
    EXPECT_NE(text.find("- x=1.5\n"), std::string::npos);
    EXPECT_NE(text.find("- via logf z\n"), std::string::npos);
}

TEST_F(LoggerTest, SuppressedFileDropsOnlyDebug) {
    Logger logger(make_options());
    logger.suppress("logger_test.cpp, pkgb");

    logger.debug("suppressed debug");
    logger.info("info still written");

    logger.suppress("pkgb");
    logger.debug("debug again");
    logger.close();

    auto text = contents();
    EXPECT_EQ(text.find("suppressed debug"), std::string::npos);
    EXPECT_NE(text.find("info still written"), std::string::npos);
    EXPECT_NE(text.find("debug again"), std::string::npos);
}

TEST_F(LoggerTest, SuppressionIsPerSourceFile) {
    Logger logger(make_options());
    logger.suppress("pkga,pkgb");

    test::debug_from_pkga(logger, "debug from a");
    test::debug_from_pkgc(logger, "debug from c");
    logger.close();

    auto text = contents();
    EXPECT_EQ(text.find("debug from a"), std::string::npos);
    EXPECT_NE(text.find("] -pkgc.cpp, line "), std::string::npos);
    EXPECT_NE(text.find("- debug from c\n"), std::string::npos);
}

TEST_F(LoggerTest, EmptySuppressListClearsSuppression) {
    Logger logger(make_options());
    logger.suppress("logger_test");
    EXPECT_EQ(logger.get_config().suppressed_file_stems.size(), 1u);

    logger.suppress("");
    EXPECT_TRUE(logger.get_config().suppressed_file_stems.empty());
    logger.debug("visible");
    logger.close();

    EXPECT_NE(contents().find("- visible\n"), std::string::npos);
}

// ============================================================================
// Reconfiguration
// ============================================================================

TEST_F(LoggerTest, SetConfigUpdatesLiveConfig) {
    Logger logger(make_options());
    ASSERT_TRUE(logger.set_config(7, 5000, Priority::Warning).has_value());

    auto config = logger.get_config();
    EXPECT_EQ(config.max_files, 7);
    EXPECT_EQ(config.max_file_bytes, 5000);
    EXPECT_EQ(config.threshold, Priority::Warning);
    EXPECT_EQ(config.root_dir.string(), test_dir_.string());
    logger.close();

    auto text = contents();
    EXPECT_EQ(test::count_occurrences(text, "Log configuration:"), 2u);
    EXPECT_NE(text.find("  NumFiles: 7\n"), std::string::npos);
}

TEST_F(LoggerTest, SetConfigRejectsInvalidValues) {
    Logger logger(make_options());

    auto files = logger.set_config(0, 100, Priority::Info);
    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error(), ConfigError::InvalidMaxFiles);

    auto bytes = logger.set_config(2, 0, Priority::Info);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error(), ConfigError::InvalidMaxFileBytes);

    EXPECT_EQ(logger.get_config().max_files, 3);
}

TEST_F(LoggerTest, QueuedEntriesUseRulesInForceWhenQueued) {
    Logger logger(make_options());

    logger.debug("before lowering");
    ASSERT_TRUE(logger.set_config(3, 1'000'000, Priority::Info).has_value());
    logger.debug("after lowering");
    logger.close();

    auto text = contents();
    EXPECT_NE(text.find("before lowering"), std::string::npos);
    EXPECT_EQ(text.find("after lowering"), std::string::npos);
}

TEST_F(LoggerTest, RaisingThresholdAdmitsLaterEntries) {
    use_threshold(Priority::Info);
    Logger logger(make_options());

    logger.debug("too early");
    ASSERT_TRUE(logger.set_config(3, 1'000'000, Priority::Debug).has_value());
    logger.debug("now visible");
    logger.close();

    auto text = contents();
    EXPECT_EQ(text.find("too early"), std::string::npos);
    EXPECT_NE(text.find("now visible"), std::string::npos);
}

TEST_F(LoggerTest, SetConfigShrinkingFileRotates) {
    Logger logger(make_options());
    for (int i = 0; i < 10; ++i) {
        logger.infof("filler line {}", i);
    }
    ASSERT_TRUE(logger.set_config(3, 50, Priority::Debug).has_value());
    logger.close();

    EXPECT_GE(log_files().size(), 2u);
}

TEST_F(LoggerTest, GetConfigReturnsIndependentCopy) {
    Logger logger(make_options());
    auto copy = logger.get_config();
    copy.suppressed_file_stems.insert("mutated");
    copy.max_files = 99;

    auto fresh = logger.get_config();
    EXPECT_TRUE(fresh.suppressed_file_stems.empty());
    EXPECT_EQ(fresh.max_files, 3);
}

// ============================================================================
// Reload
// ============================================================================

TEST_F(LoggerTest, ReloadPicksUpSourceChanges) {
    use_threshold(Priority::Info);
    Logger logger(make_options(50ms));

    use_threshold(Priority::Debug);
    ASSERT_TRUE(test::wait_for([&] { return logger.get_config().threshold == Priority::Debug; }));

    logger.debug("after reload");
    logger.close();

    auto text = contents();
    EXPECT_NE(text.find("after reload"), std::string::npos);
    EXPECT_EQ(test::count_occurrences(text, "Log configuration:"), 2u);
}

TEST_F(LoggerTest, ReloadToNewPrefixMovesFiles) {
    Logger logger(make_options(50ms));
    logger.info("old place");

    source_->set(make_config("moved"));
    ASSERT_TRUE(test::wait_for([&] { return logger.get_config().file_name_prefix == "moved"; }));

    logger.info("new place");
    logger.close();

    EXPECT_NE(contents("test").find("old place"), std::string::npos);
    auto moved = contents("moved");
    EXPECT_NE(moved.find("new place"), std::string::npos);
    EXPECT_NE(moved.find("  FileName: moved\n"), std::string::npos);
}

TEST_F(LoggerTest, ReloadIgnoresInvalidConfig) {
    Logger logger(make_options(20ms));

    auto broken = make_config();
    broken.max_file_bytes = 0;
    source_->set(broken);
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(logger.get_config().max_file_bytes, 1'000'000);
    logger.close();
}

// ============================================================================
// Close
// ============================================================================

TEST_F(LoggerTest, CloseWritesOutQueuedEntries) {
    Logger logger(make_options());
    for (int i = 0; i < 500; ++i) {
        logger.infof("entry {}", i);
    }
    logger.close();

    auto text = contents();
    for (int i = 0; i < 500; ++i) {
        EXPECT_NE(text.find(std::format("- entry {}\n", i)), std::string::npos) << i;
    }
}

TEST_F(LoggerTest, CallsAfterCloseAreDropped) {
    Logger logger(make_options());
    logger.close();
    logger.close();

    EXPECT_EQ(logger.info("late"), Delivery::Dropped);
    EXPECT_TRUE(logger.set_config(5, 10, Priority::Warning).has_value());
    logger.suppress("anything");

    auto config = logger.get_config();
    EXPECT_EQ(config.max_files, 3);
    EXPECT_EQ(config.threshold, Priority::Debug);
    EXPECT_TRUE(config.suppressed_file_stems.empty());
    EXPECT_EQ(contents().find("late"), std::string::npos);
}

TEST_F(LoggerTest, DestructorCloses) {
    {
        Logger logger(make_options());
        logger.info("from scope");
    }
    EXPECT_NE(contents().find("from scope"), std::string::npos);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(LoggerTest, ConcurrentProducersKeepTheirOwnOrder) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    Logger logger(make_options());
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.infof("t{} m{}", t, i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    logger.close();

    auto text = contents();
    for (int t = 0; t < kThreads; ++t) {
        std::size_t prev = 0;
        for (int i = 0; i < kPerThread; ++i) {
            auto pos = text.find(std::format("- t{} m{}\n", t, i));
            ASSERT_NE(pos, std::string::npos) << t << "/" << i;
            EXPECT_GT(pos, prev);
            prev = pos;
        }
    }
}

// An entry logged after another thread's log() returned is written after it,
// even while a third thread keeps the queue busy
TEST_F(LoggerTest, EntriesFollowHandOffBetweenThreads) {
    constexpr int kRounds = 50;

    Logger logger(make_options());
    std::atomic<bool> stop{false};
    std::thread flood([&] {
        for (int i = 0; i < 5000 && !stop.load(); ++i) {
            logger.infof("flood {}", i);
        }
    });

    for (int round = 0; round < kRounds; ++round) {
        std::thread([&] { logger.infof("received {}", round); }).join();
        std::thread([&] { logger.infof("processing {}", round); }).join();
    }
    stop.store(true);
    flood.join();
    logger.close();

    auto text = contents();
    for (int round = 0; round < kRounds; ++round) {
        auto received = text.find(std::format("- received {}\n", round));
        auto processing = text.find(std::format("- processing {}\n", round));
        ASSERT_NE(received, std::string::npos) << round;
        ASSERT_NE(processing, std::string::npos) << round;
        EXPECT_LT(received, processing) << round;
    }
}

TEST_F(LoggerTest, CloseWhileProducersRun) {
    Logger logger(make_options());
    std::atomic<int> queued{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 2000; ++i) {
                if (logger.info("racing") == Delivery::Queued) {
                    queued.fetch_add(1);
                }
            }
        });
    }
    std::this_thread::sleep_for(5ms);
    logger.close();
    for (auto& th : threads) {
        th.join();
    }

    // Every entry accepted before close reached the file
    EXPECT_EQ(test::count_occurrences(contents(), "- racing\n"),
              static_cast<std::size_t>(queued.load()));
}

// ============================================================================
// Termination
// ============================================================================

TEST_F(LoggerTest, ExitWritesRecordAndExits) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        Logger logger(make_options());
        logger.info("last words");
        logger.exit(3, "shutting down");
    }, ::testing::ExitedWithCode(3), "");

    auto text = contents();
    EXPECT_NE(text.find("- last words\n"), std::string::npos);
    EXPECT_NE(text.find(" [EXIT 3] "), std::string::npos);
    EXPECT_NE(text.find("- shutting down\n"), std::string::npos);
    EXPECT_LT(text.find("last words"), text.find("shutting down"));
}

TEST_F(LoggerTest, ExitfFormatsMessage) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        Logger logger(make_options());
        logger.exitf(0, "done after {} steps", 12);
    }, ::testing::ExitedWithCode(0), "");

    EXPECT_NE(contents().find(" [EXIT 0] "), std::string::npos);
    EXPECT_NE(contents().find("- done after 12 steps\n"), std::string::npos);
}

TEST_F(LoggerTest, PanicWritesRecordAndExitsWithOne) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        Logger logger(make_options());
        logger.panicf("invariant broken: {}", "x < 0");
    }, ::testing::ExitedWithCode(kPanicExitCode), "");

    auto text = contents();
    EXPECT_NE(text.find(" [PANIC] "), std::string::npos);
    EXPECT_NE(text.find("- invariant broken: x < 0\n"), std::string::npos);
}

TEST_F(LoggerTest, PanicBelowThresholdStillExits) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    use_threshold(Priority::Exit);
    EXPECT_EXIT({
        Logger logger(make_options());
        logger.panic("quiet");
    }, ::testing::ExitedWithCode(kPanicExitCode), "");

    EXPECT_EQ(contents().find("[PANIC]"), std::string::npos);
}

TEST_F(LoggerTest, ExitAfterCloseReportsOnStderr) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        Logger logger(make_options());
        logger.close();
        logger.exit(4, "too late");
    }, ::testing::ExitedWithCode(4), "logset: exit 4 after close: too late");
}

} // anonymous namespace
} // namespace logset
