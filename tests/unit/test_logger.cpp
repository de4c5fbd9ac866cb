/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger and log sinks.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace dag_scheduler;

namespace {

struct CapturingLogger {
    std::shared_ptr<MemorySink::Buffer> lines;
    Logger logger;

    explicit CapturingLogger(LogLevel level = LogLevel::Debug)
        : CapturingLogger(std::make_unique<MemorySink>(), level) {}

private:
    CapturingLogger(std::unique_ptr<MemorySink> sink, LogLevel level)
        : lines(sink->buffer()), logger(std::move(sink), level, "test") {}
};

}  // namespace

TEST(LoggerTest, WritesJsonLine) {
    CapturingLogger cap;
    cap.logger.info("hello");

    ASSERT_EQ(cap.lines->lines.size(), 1u);
    const auto& line = cap.lines->lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"test")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"hello")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    CapturingLogger cap(LogLevel::Warn);
    cap.logger.debug("d");
    cap.logger.info("i");
    cap.logger.warn("w");
    cap.logger.error("e");
    EXPECT_EQ(cap.lines->lines.size(), 2u);
}

TEST(LoggerTest, SetLevel) {
    CapturingLogger cap(LogLevel::Error);
    EXPECT_FALSE(cap.logger.enabled(LogLevel::Info));
    cap.logger.set_level(LogLevel::Debug);
    EXPECT_EQ(cap.logger.level(), LogLevel::Debug);
    EXPECT_TRUE(cap.logger.enabled(LogLevel::Info));
}

TEST(LoggerTest, EscapesMessage) {
    CapturingLogger cap;
    cap.logger.error("bad \"quote\"\nnext");
    ASSERT_EQ(cap.lines->lines.size(), 1u);
    EXPECT_NE(cap.lines->lines[0].find(R"(bad \"quote\"\nnext)"), std::string::npos);
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("tab\t"), "tab\\t");
    EXPECT_EQ(json_escape(std::string{"\x01", 1}), "\\u0001");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "dag_scheduler_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, AppendsLines) {
    {
        JsonFileSink sink(dir_, "engine");
        sink.write(R"({"n":1})");
        sink.write(R"({"n":2})");
    }
    std::ifstream in(dir_ / "engine.ndjson");
    std::string first, second;
    std::getline(in, first);
    std::getline(in, second);
    EXPECT_EQ(first, R"({"n":1})");
    EXPECT_EQ(second, R"({"n":2})");
}

TEST_F(JsonFileSinkTest, RotatesWhenFull) {
    JsonFileSink sink(dir_, "engine", 1, 2);
    sink.set_max_file_size_bytes(16);

    for (int i = 0; i < 6; ++i) {
        sink.write(R"({"line":"0123456789"})");  // > 16 bytes, every write rotates
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "engine.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "engine.3.ndjson"));
}
