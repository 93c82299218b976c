/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, level parsing and JSON escaping.
 */

#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace agent_orchestrator;

namespace {

/// Captures lines into a vector owned by the test.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override { ++flushes; }

    int flushes = 0;

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<std::string>> lines_ = std::make_shared<std::vector<std::string>>();

    Logger make_logger(LogLevel level = LogLevel::Debug) {
        return Logger(std::make_unique<CaptureSink>(lines_), level);
    }
};

TEST_F(LoggerTest, WritesNdjsonLine) {
    auto logger = make_logger();
    logger.info("hello");

    ASSERT_EQ(lines_->size(), 1u);
    const auto& line = lines_->front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"orchestrator")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"hello")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
    EXPECT_NE(line.find("Z\""), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    auto logger = make_logger(LogLevel::Warn);
    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");

    ASSERT_EQ(lines_->size(), 2u);
    EXPECT_NE((*lines_)[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE((*lines_)[1].find(R"("level":"error")"), std::string::npos);
}

TEST_F(LoggerTest, ComponentLoggerSharesSinkAndLevel) {
    auto logger = make_logger(LogLevel::Info);
    auto pool_logger = logger.with_component("AgentPool");

    pool_logger.info("from pool");
    EXPECT_EQ(pool_logger.component(), "AgentPool");
    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_NE(lines_->front().find(R"("component":"AgentPool")"), std::string::npos);

    logger.set_level(LogLevel::Error);
    pool_logger.warn("suppressed");
    EXPECT_EQ(lines_->size(), 1u);
    EXPECT_EQ(pool_logger.level(), LogLevel::Error);
}

TEST_F(LoggerTest, EscapesMessage) {
    auto logger = make_logger();
    logger.error("say \"hi\"\nnext");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_NE(lines_->front().find(R"(say \"hi\"\nnext)"), std::string::npos);
}

TEST(JsonEscapeTest, ControlCharacters) {
    EXPECT_EQ(json_escape("a\tb"), "a\\tb");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(json_escape(std::string{"\x01"}), "\\u0001");
    EXPECT_EQ(json_escape("plain"), "plain");
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::Error);

    auto bad = parse_log_level("verbose");
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().message.find("verbose"), std::string::npos);
}

TEST(LogLevelTest, ToString) {
    EXPECT_EQ(to_string(LogLevel::Debug), "debug");
    EXPECT_EQ(to_string(LogLevel::Error), "error");
}
