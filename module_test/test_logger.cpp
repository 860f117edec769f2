/*-------------------------------------------------------------------------
 *
 * test_logger.cpp
 *      Logger level filtering and file output.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CClientConfig.hpp"
#include "CLogger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <unistd.h>

namespace DocWire
{
namespace Test
{

static std::string readAll(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST(LogLevelTest, Parse)
{
    EXPECT_EQ(parseLogLevel("debug"), CLogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), CLogLevel::INFO);
    EXPECT_EQ(parseLogLevel("Warning"), CLogLevel::WARN);
    EXPECT_EQ(parseLogLevel("fatal"), CLogLevel::FATAL);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(LoggerTest, LevelFiltering)
{
    CClientConfig config;
    CLogger logger(config);

    logger.setLogLevel(CLogLevel::WARN);
    EXPECT_EQ(logger.getLogLevel(), CLogLevel::WARN);
    EXPECT_FALSE(logger.shouldLog(CLogLevel::INFO));
    EXPECT_TRUE(logger.shouldLog(CLogLevel::WARN));
    EXPECT_TRUE(logger.shouldLog(CLogLevel::ERROR));
}

TEST(LoggerTest, WritesToFile)
{
    std::string path = (std::filesystem::temp_directory_path() /
                        ("docwire_log_" + std::to_string(::getpid()) + ".log"))
                           .string();
    std::filesystem::remove(path);

    CClientConfig config;
    config.logFile = path;
    config.consoleLog = false;
    config.logLevel = "info";
    config.clientName = "unit";

    auto logger = makeLogger(config);
    ASSERT_TRUE(logger);
    logger->log(CLogLevel::DEBUG, "hidden message");
    logger->log(CLogLevel::ERROR, "visible message");
    logger->logWithContext(CLogLevel::INFO, "tagged", "db:1");
    logger->shutdown();

    std::string content = readAll(path);
    EXPECT_EQ(content.find("hidden message"), std::string::npos);
    EXPECT_NE(content.find("ERROR unit: visible message"), std::string::npos);
    EXPECT_NE(content.find("[db:1] tagged"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(LoggerTest, UnwritableFileFallsBack)
{
    CClientConfig config;
    config.logFile = "/nonexistent-dir/docwire.log";
    config.consoleLog = false;

    auto logger = makeLogger(config);
    ASSERT_TRUE(logger);
    EXPECT_EQ(logger->getLogLevel(), CLogLevel::INFO);
}

} /* namespace Test */
} /* namespace DocWire */
