#include "Logging.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using PaletteLogging::LogLevel;

TEST(PaletteLogging, ParseLogLevel) {
    EXPECT_EQ(PaletteLogging::ParseLogLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(PaletteLogging::ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(PaletteLogging::ParseLogLevel("Critical"), LogLevel::Critical);
    EXPECT_EQ(PaletteLogging::ParseLogLevel("verbose", LogLevel::Error), LogLevel::Error);
    EXPECT_STREQ(PaletteLogging::LogLevelName(LogLevel::Warn), "warn");
}

TEST(PaletteLogging, PrintJoinsPieces) {
    ASSERT_TRUE(PaletteLogging::IsInitialized());
    PaletteTests::DrainLog();

    PALETTES_PRINT(LogLevel::Warn, "[Test] count ", 3, " of ", 4.5);

    std::vector<PaletteLogging::LogMessage> log = PaletteTests::DrainLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].text, "[Test] count 3 of 4.5");
    EXPECT_EQ(log[0].level, LogLevel::Warn);
}

TEST(PaletteLogging, QueueIsBounded) {
    PaletteTests::DrainLog();
    for (int i = 0; i < 1200; ++i) {
        PALETTES_PRINT(LogLevel::Info, "message ", i);
    }
    EXPECT_EQ(PaletteLogging::GetLogQueue().Size(), 1000u);

    PaletteLogging::LogMessage oldest("", LogLevel::Info);
    ASSERT_TRUE(PaletteLogging::GetLogQueue().TryPop(oldest));
    EXPECT_EQ(oldest.text, "message 200");
    PaletteLogging::GetLogQueue().Clear();
}

TEST(PaletteLogging, ReinitializeAppliesNewLevel) {
    PaletteLogging::Shutdown();
    EXPECT_FALSE(PaletteLogging::IsInitialized());

    PaletteLogging::LoggingConfig config;
    config.level = LogLevel::Warn;
    config.logToConsole = false;
    ASSERT_TRUE(PaletteLogging::Initialize(config));

    PALETTES_PRINT(LogLevel::Info, "[Test] below the threshold");
    PALETTES_PRINT(LogLevel::Warn, "[Test] at the threshold");
    std::vector<PaletteLogging::LogMessage> log = PaletteTests::DrainLog();
    EXPECT_FALSE(PaletteTests::LogContains(log, LogLevel::Info, "below the threshold"));
    EXPECT_TRUE(PaletteTests::LogContains(log, LogLevel::Warn, "at the threshold"));

    // back to what the other tests expect
    PaletteLogging::Shutdown();
    config.level = LogLevel::Trace;
    ASSERT_TRUE(PaletteLogging::Initialize(config));
    PaletteTests::DrainLog();
}
