#include <gtest/gtest.h>
#include "pixel_budget/utils/logger.hpp"
#include "pixel_budget/core/max_size.hpp"
#include <cstdio>
#include <string>

using namespace pixel_budget;

namespace {

std::string read_all(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        out.append(buf, n);
    }
    return out;
}

class LoggerCapture : public ::testing::Test {
protected:
    void SetUp() override {
        file_ = std::tmpfile();
        ASSERT_NE(file_, nullptr);
        Logger& log = Logger::get();
        log.set_stream(file_);
        log.set_colors(false);
        log.set_level(LogLevel::INFO);
    }

    void TearDown() override {
        Logger& log = Logger::get();
        log.set_stream(nullptr);
        log.set_colors(true);
        log.set_level(LogLevel::INFO);
        if (file_ != nullptr) {
            std::fclose(file_);
        }
    }

    std::FILE* file_ = nullptr;
};

}  // namespace

TEST(LoggerTest, InfoLevelWorks) {
    Logger& log = Logger::get();
    log.set_level(LogLevel::INFO);
    log.info("Test info message: %d", 42);
    EXPECT_EQ(log.get_level(), LogLevel::INFO);
}

TEST(LoggerTest, LevelNamesRoundTrip) {
    EXPECT_STREQ(log_level_to_string(LogLevel::WARN), "WARN");
    EXPECT_EQ(string_to_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(string_to_log_level("4"), LogLevel::ERROR);
    EXPECT_EQ(string_to_log_level("verbose", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggerCapture, WritesLevelAndMessage) {
    Logger::get().warn("budget %d exceeded", 7);
    std::string text = read_all(file_);
    EXPECT_NE(text.find("WARN: budget 7 exceeded"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(LoggerCapture, SuppressesBelowLevel) {
    Logger& log = Logger::get();
    log.set_level(LogLevel::WARN);
    log.info("hidden");
    log.debug("hidden too");
    log.error("shown");
    std::string text = read_all(file_);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("ERROR: shown"), std::string::npos);
}

TEST_F(LoggerCapture, InvalidInputReportedAsError) {
    compute_max_size(0, 100, 1000);
    std::string text = read_all(file_);
    EXPECT_NE(text.find("ERROR:"), std::string::npos);
    EXPECT_NE(text.find("Invalid input: width=0, height=100, num_pixels=1000"), std::string::npos);
}

TEST_F(LoggerCapture, CalculationReportedAsInfo) {
    compute_max_size(1920, 1080, 1048576);
    std::string text = read_all(file_);
    EXPECT_NE(text.find("INFO:"), std::string::npos);
    EXPECT_NE(text.find("Calculated size: 1365x768"), std::string::npos);
}

TEST_F(LoggerCapture, IterationCeilingReportedAsWarning) {
    compute_max_size(52958, 153, 93296);
    std::string text = read_all(file_);
    EXPECT_NE(text.find("WARN: [ImageResizeCalculator] Refinement stopped"), std::string::npos);
}
