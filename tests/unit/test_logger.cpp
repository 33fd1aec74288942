#include <gtest/gtest.h>
#include "selfcrypt/core/logger.hpp"
#include "selfcrypt/core/config.hpp"
#include <filesystem>
#include <fstream>

using namespace selfcrypt::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_selfcrypt.log";
    }
    
    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }
    
    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
    
    std::string log_file;
};

TEST_F(LoggerTest, Initialize) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, LogMessages) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("Debug message: {}", 123);
    LOG_INFO("Info message: {}", "test");
    LOG_WARN("Warning message");
    LOG_ERROR("Error message");
    LOG_CRITICAL("Critical message");
    
    auto content = read_log();
    
    EXPECT_TRUE(content.find("Debug message: 123") != std::string::npos);
    EXPECT_TRUE(content.find("Info message: test") != std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
    EXPECT_TRUE(content.find("Error message") != std::string::npos);
    EXPECT_TRUE(content.find("Critical message") != std::string::npos);
}

TEST_F(LoggerTest, LogLevel) {
    Logger::initialize(log_file, LogLevel::Warn);
    
    LOG_DEBUG("Debug message");
    LOG_INFO("Info message");
    LOG_WARN("Warning message");
    
    auto content = read_log();
    
    EXPECT_TRUE(content.find("Debug message") == std::string::npos);
    EXPECT_TRUE(content.find("Info message") == std::string::npos);
    EXPECT_TRUE(content.find("Warning message") != std::string::npos);
}

TEST_F(LoggerTest, MacrosSafeAfterShutdown) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();
    
    EXPECT_EQ(Logger::get(), nullptr);
    EXPECT_NO_THROW(LOG_INFO("Logged to the console fallback"));
}

TEST_F(LoggerTest, InitializeFromConfig) {
    Config config;
    config.set("log.file", log_file);
    config.set("log.level", "error");
    Logger::initialize(config);
    
    ASSERT_NE(Logger::get(), nullptr);
    EXPECT_EQ(Logger::get()->level(), spdlog::level::err);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parse_level("verbose", LogLevel::Error), LogLevel::Error);
}
