#include "util/logger.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <string>

namespace {

class LoggerTests : public ::testing::Test {
  protected:
    void SetUp() override {
        sink_ = std::tmpfile();
        ASSERT_NE(sink_, nullptr);
        chunkio::Logger::Instance().SetStream(sink_);
    }

    void TearDown() override {
        chunkio::Logger::Instance().SetStream(nullptr);
        chunkio::Logger::Instance().SetLevel(chunkio::LogLevel::Info);
        if (sink_) std::fclose(sink_);
    }

    std::string Captured() {
        std::rewind(sink_);
        std::string out;
        char buf[256];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), sink_)) > 0)
            out.append(buf, n);
        return out;
    }

    std::FILE* sink_ = nullptr;
};

TEST_F(LoggerTests, FiltersBelowLevelAndTagsSource) {
    chunkio::Logger::Instance().SetLevel(chunkio::LogLevel::Warn);
    LogInfo("hidden %d", 1);
    LogWarn("shown %d", 2);

    const std::string out = Captured();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN]"), std::string::npos);
    EXPECT_NE(out.find("[test_logger.cpp:"), std::string::npos);
    EXPECT_NE(out.find("shown 2\n"), std::string::npos);
}

TEST_F(LoggerTests, NoneSilencesEverything) {
    chunkio::Logger::Instance().SetLevel(chunkio::LogLevel::None);
    LogError("nothing");
    EXPECT_TRUE(Captured().empty());
}

TEST(LogLevelTest, ParsesNames) {
    chunkio::LogLevel lvl = chunkio::LogLevel::Info;
    EXPECT_TRUE(chunkio::ParseLogLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, chunkio::LogLevel::Debug);
    EXPECT_TRUE(chunkio::ParseLogLevel("warning", lvl));
    EXPECT_EQ(lvl, chunkio::LogLevel::Warn);
    EXPECT_TRUE(chunkio::ParseLogLevel("none", lvl));
    EXPECT_EQ(lvl, chunkio::LogLevel::None);
    EXPECT_FALSE(chunkio::ParseLogLevel("verbose", lvl));
    EXPECT_EQ(lvl, chunkio::LogLevel::None);
}

} // namespace
