// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/LogUtils.h"
#include "common/Logger.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

namespace {

/**
 * @brief Backend that records what reaches it
 */
class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::pair<LogLevel, std::string>> &records) : records_(records) {}

    void log(LogLevel level, const std::string &message, const std::source_location &) override {
        records_.emplace_back(level, message);
    }

    void setLevel(LogLevel level) override {
        lastLevel = level;
    }

    void flush() override {}

    LogLevel lastLevel = LogLevel::Trace;

private:
    std::vector<std::pair<LogLevel, std::string>> &records_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel_ = Logger::getLevel();
        auto backend = std::make_unique<RecordingBackend>(records_);
        backend_ = backend.get();
        Logger::setLevel(LogLevel::Info);
        Logger::setBackend(std::move(backend));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
        Logger::setLevel(previousLevel_);
    }

    std::vector<std::pair<LogLevel, std::string>> records_;
    RecordingBackend *backend_ = nullptr;
    LogLevel previousLevel_ = LogLevel::Warn;
};

TEST_F(LoggerTest, InjectedBackendReceivesCurrentLevel) {
    EXPECT_EQ(LogLevel::Info, backend_->lastLevel);
    Logger::setLevel(LogLevel::Error);
    EXPECT_EQ(LogLevel::Error, backend_->lastLevel);
}

TEST_F(LoggerTest, MessagesBelowTheLevelAreNotFormatted) {
    int formatted = 0;
    auto count = [&formatted]() {
        ++formatted;
        return "x";
    };

    LOG_DEBUG("PatchEngine: {}", count());
    LOG_WARN("PatchEngine: {} {}", count(), 2);

    EXPECT_EQ(1, formatted);
    ASSERT_EQ(1u, records_.size());
    EXPECT_EQ(LogLevel::Warn, records_[0].first);
    EXPECT_EQ("PatchEngine: x 2", records_[0].second);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::setLevel(LogLevel::Off);
    LOG_ERROR("CodeChanges: {}", "dropped");
    EXPECT_TRUE(records_.empty());
}

TEST(LogLevelTest, ParsesNamesAndAliases) {
    EXPECT_EQ(LogLevel::Debug, parseLogLevel("debug"));
    EXPECT_EQ(LogLevel::Warn, parseLogLevel("WARNING"));
    EXPECT_EQ(LogLevel::Error, parseLogLevel("err"));
    EXPECT_EQ(LogLevel::Off, parseLogLevel("Off"));
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_STREQ("critical", logLevelToString(LogLevel::Critical));
}

TEST(LogSanitizeTest, EscapesLineBreaksAndControlBytes) {
    EXPECT_EQ("a\\nb\\r\\tc?", Log::sanitize("a\nb\r\tc\x01"));
    EXPECT_EQ("caf\xC3\xA9", Log::sanitize("caf\xC3\xA9"));
}

TEST(LogSanitizeTest, TruncatesLongText) {
    EXPECT_EQ("abc...", Log::sanitize("abcdef", 3));
    EXPECT_EQ("abc", Log::sanitize("abc", 3));
    // Cut lands inside the two-byte e-acute
    EXPECT_EQ("caf...", Log::sanitize("caf\xC3\xA9", 4));
}

}  // namespace MDG
