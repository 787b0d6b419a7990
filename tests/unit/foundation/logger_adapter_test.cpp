#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "arc/foundation/error_code.hpp"
#include "arc/foundation/game_logger.hpp"
#include "mock_logger.hpp"

using namespace arc::foundation;
using arc::test::GlobalLoggerRegistry;
using arc::test::log_level;
using arc::test::MockLogger;

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Category / level helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Progression), "Progression");
    EXPECT_EQ(logCategoryName(LogCategory::Reputation), "Reputation");
    EXPECT_EQ(logCategoryName(LogCategory::Ability), "Ability");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Progression), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Progression));

    logger.setCategoryLevel(LogCategory::Progression, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Progression));

    logger.setCategoryLevel(LogCategory::Progression, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Progression));
}

TEST(GameLoggerBasicTest, InvalidCategoryIsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Ability, "loaded 5 abilities");

    const auto& records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Ability] loaded 5 abilities");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Combat, LogLevel::Warning);
    logger.log(LogLevel::Debug, LogCategory::Combat, "entity 3 broken");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GameLoggerTest, WarningMapsToKcenonWarning) {
    GameLogger logger;
    logger.log(LogLevel::Warning, LogCategory::Reputation, "unknown faction: Crimson");

    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].level, log_level::warning);
}

TEST_F(GameLoggerTest, ContextFieldsAreOrdered) {
    GameLogger logger;

    LogContext ctx;
    ctx.entityId = 7;
    ctx.stageId = "stage_02";
    ctx.extra["xp"] = "-40";
    ctx.extra["level"] = "0";

    logger.logWithContext(LogLevel::Warning, LogCategory::Progression,
                          "corrupt level state reset", ctx);

    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message,
              "[Progression] corrupt level state reset "
              "{entity=7, stage=stage_02, level=0, xp=-40}");
}

TEST_F(GameLoggerTest, EmptyContextOmitsBraces) {
    GameLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "resuming stage", LogContext{});

    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] resuming stage");
}

TEST_F(GameLoggerTest, MacrosRouteThroughInstance) {
    ARC_LOG_WARN(LogCategory::Config, "combat.kill_xp out of range");
    EXPECT_EQ(mockLogger_->count(log_level::warning, "[Config] combat.kill_xp"), 1u);
}

TEST_F(GameLoggerTest, FlushReachesDefaultLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}
