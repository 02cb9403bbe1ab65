// FILEKIT - Logging Tests
// Copyright (c) 2024 FILEKIT Developers
// MIT License

#include <gtest/gtest.h>

#include <filekit/fs/os.h>
#include <filekit/temp/temp.h>
#include <filekit/util/logging.h>

#include <string>
#include <vector>

namespace filekit {
namespace util {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::WALK));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::WALK));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableAllCategories();
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::TEXTIO));

    logger.EnableCategory(LogCategory::TEXTIO);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TEXTIO));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::TEMP));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TEMP));
}

TEST_F(LoggingTest, StreamMacroReachesCallbackSink) {
    std::vector<LogEntry> captured;
    auto sink = std::make_shared<CallbackSink>(
        [&](const LogEntry& entry) { captured.push_back(entry); }, LogLevel::Trace);

    auto& logger = Logger::Instance();
    logger.AddSink(sink);
    logger.SetLevel(LogLevel::Debug);

    LOG_INFO(LogCategory::LIST) << "listed " << 3 << " entries";
    LOG_TRACE(LogCategory::LIST) << "below the logger level";

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].message, "listed 3 entries");
    EXPECT_EQ(captured[0].category, LogCategory::LIST);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
}

TEST_F(LoggingTest, DisabledCategoryIsDropped) {
    std::vector<std::string> messages;
    auto sink = std::make_shared<CallbackSink>(
        [&](const LogEntry& entry) { messages.push_back(entry.message); }, LogLevel::Trace);

    auto& logger = Logger::Instance();
    logger.AddSink(sink);
    logger.DisableCategory(LogCategory::WALK);

    LOG_WARN(LogCategory::WALK) << "hidden";
    LOG_WARN(LogCategory::TEMP) << "shown";

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "shown");
}

TEST_F(LoggingTest, DisableOneCategoryKeepsTheRest) {
    auto& logger = Logger::Instance();

    logger.DisableCategory(LogCategory::WALK);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::WALK));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TEMP));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::DEFAULT));
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::WALK));

    logger.EnableCategory(LogCategory::WALK);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::WALK));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TEMP));

    logger.DisableCategory(LogCategory::LIST);
    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LIST));
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::TEXTIO;
    entry.message = "retrying as UTF-8";

    LogFormat format;
    format.showTimestamp = false;
    format.showThread = false;
    format.showLocation = false;
    format.showLevel = true;
    format.showCategory = true;

    std::string line = FormatLogEntry(entry, format);
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("textio"), std::string::npos);
    EXPECT_NE(line.find("retrying as UTF-8"), std::string::npos);
}

TEST_F(LoggingTest, FileSinkWritesMessages) {
    temp::TempDirectory dir;
    path::Path logFile = dir.GetPath().Child("filekit.log");

    FileSink::Config config;
    config.path = logFile.NativeString();
    config.autoFlush = true;
    auto sink = std::make_shared<FileSink>(config);
    ASSERT_TRUE(sink->IsOpen());

    auto& logger = Logger::Instance();
    logger.AddSink(sink);
    LOG_ERROR(LogCategory::CONFIG) << "bad option";
    logger.Flush();
    logger.RemoveSink(sink);

    auto bytes = fs::ReadFileBytes(logFile);
    ASSERT_TRUE(bytes.has_value());
    std::string content(bytes->begin(), bytes->end());
    EXPECT_NE(content.find("bad option"), std::string::npos);
}

TEST_F(LoggingTest, FixedWidthAndBasename) {
    EXPECT_EQ(FixedWidth("abc", 5), "abc  ");
    EXPECT_EQ(FixedWidth("abcdef", 3), "abc");
    EXPECT_EQ(GetBasename("/src/fs/walker.cpp"), "walker.cpp");
}

} // namespace
} // namespace util
} // namespace filekit
