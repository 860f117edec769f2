/*-------------------------------------------------------------------------
 *
 * CLogger.cpp
 *		  Logging system implementation for DocWire
 *
 * Writes level-filtered messages to the console and, optionally, to an
 * append-only log file.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogger.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace std;

namespace DocWire
{

/*
 * parseLogLevel
 *		Map a case-insensitive level name onto CLogLevel
 */
std::optional<CLogLevel> parseLogLevel(const std::string& name)
{
    std::string upper = name;

    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "TRACE")
        return CLogLevel::TRACE;
    if (upper == "DEBUG")
        return CLogLevel::DEBUG;
    if (upper == "INFO")
        return CLogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return CLogLevel::WARN;
    if (upper == "ERROR")
        return CLogLevel::ERROR;
    if (upper == "FATAL")
        return CLogLevel::FATAL;
    return std::nullopt;
}

/*
 * CLogger constructor
 *		Initialize logger with configuration
 */
CLogger::CLogger(const CClientConfig& config)
    : config_(config), logFile_(""), consoleOutput_(true), fileOutput_(true),
      colorOutput_(true), timestampFormat_("%Y-%m-%d %H:%M:%S"),
      logLevel_(CLogLevel::INFO), initialized_(false)
{
}

/*
 * CLogger destructor
 *		Clean up open file streams
 */
CLogger::~CLogger()
{
    shutdown();
}

/*
 * log
 *		Main logging function - write message if level is sufficient
 */
void CLogger::log(CLogLevel level, const std::string& message)
{
    std::string formattedMessage;

    if (!shouldLog(level))
        return;

    formattedMessage = formatMessage(level, message);

    std::lock_guard<std::mutex> lock(logMutex_);
    if (consoleOutput_)
        writeToConsole(formattedMessage);

    if (fileOutput_ && fileStream_ && fileStream_->is_open())
        writeToFile(formattedMessage);
}

/*
 * logWithContext
 *		Log a message tagged with a context such as "host:port"
 */
void CLogger::logWithContext(CLogLevel level, const std::string& message,
                             const std::string& context)
{
    log(level, "[" + context + "] " + message);
}

/*
 * setLogLevel
 *		Set minimum log level for output
 */
void CLogger::setLogLevel(CLogLevel level)
{
    logLevel_ = level;
}

/*
 * getLogLevel
 *		Return current log level
 */
CLogLevel CLogger::getLogLevel() const noexcept
{
    return logLevel_;
}

/*
 * initialize
 *		Open the log file, if one is configured
 */
std::error_code CLogger::initialize()
{
    if (initialized_)
        return std::error_code();

    if (fileOutput_ && !logFile_.empty())
    {
        fileStream_ = std::make_unique<std::ofstream>(logFile_, std::ios::app);
        if (!fileStream_->is_open())
        {
            fileStream_.reset();
            return std::make_error_code(std::errc::io_error);
        }
    }

    initialized_ = true;
    return std::error_code();
}

/*
 * shutdown
 *		Close file streams and clean up resources
 */
void CLogger::shutdown() noexcept
{
    std::lock_guard<std::mutex> lock(logMutex_);
    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
    fileStream_.reset();
    initialized_ = false;
}

/*
 * setLogFile
 *		Set main log file path
 */
void CLogger::setLogFile(const std::string& filename)
{
    logFile_ = filename;
}

/*
 * enableConsoleOutput
 *		Enable or disable console output
 */
void CLogger::enableConsoleOutput(bool enable)
{
    consoleOutput_ = enable;
}

/*
 * enableFileOutput
 *		Enable or disable file output
 */
void CLogger::enableFileOutput(bool enable)
{
    fileOutput_ = enable;
}

void CLogger::enableColor(bool enable)
{
    colorOutput_ = enable;
}

void CLogger::writeToConsole(const std::string& message)
{
    std::cerr << message << std::endl;
}

void CLogger::writeToFile(const std::string& message)
{
    *fileStream_ << message << std::endl;
    fileStream_->flush();
}

/*
 * formatMessage
 *		Format log message with timestamp, pid, level and component
 */
std::string CLogger::formatMessage(CLogLevel level, const std::string& message)
{
    std::stringstream ss;
    int pid = static_cast<int>(getpid());
    std::string component =
        config_.clientName.empty() ? "docwire" : config_.clientName;

    /* ANSI color codes */
    const char* green = "\033[32m";
    const char* red = "\033[31m";
    const char* yellow = "\033[33m";
    const char* blue = "\033[34m";
    const char* reset = "\033[0m";
    const char* color = reset;

    if (level == CLogLevel::ERROR || level == CLogLevel::FATAL)
        color = red;
    else if (level == CLogLevel::WARN)
        color = yellow;
    else if (level == CLogLevel::INFO)
        color = green;
    else
        color = blue;

    if (colorOutput_)
        ss << color;
    ss << getTimestamp() << " [" << pid << "] " << getLevelString(level) << " "
       << component << ": " << message;
    if (colorOutput_)
        ss << reset;
    return ss.str();
}

/*
 * getLevelString
 *		Convert log level enum to string representation
 */
std::string CLogger::getLevelString(CLogLevel level) const
{
    switch (level)
    {
    case CLogLevel::TRACE:
        return "TRACE";
    case CLogLevel::DEBUG:
        return "DEBUG";
    case CLogLevel::INFO:
        return "INFO";
    case CLogLevel::WARN:
        return "WARN";
    case CLogLevel::ERROR:
        return "ERROR";
    case CLogLevel::FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}

/*
 * getTimestamp
 *		Generate formatted timestamp string
 */
std::string CLogger::getTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    std::stringstream ss;

    localtime_r(&t, &tm);
    ss << std::put_time(&tm, timestampFormat_.c_str());
    return ss.str();
}

/*
 * shouldLog
 *		Check if message should be logged based on level
 */
bool CLogger::shouldLog(CLogLevel level) const noexcept
{
    return level >= logLevel_.load();
}

/*
 * makeLogger
 *		Create and initialize a logger from client configuration.
 *		A log file that cannot be opened falls back to console output.
 */
std::shared_ptr<CLogger> makeLogger(const CClientConfig& config)
{
    auto logger = std::make_shared<CLogger>(config);

    logger->setLogLevel(parseLogLevel(config.logLevel).value_or(CLogLevel::INFO));
    logger->enableConsoleOutput(config.consoleLog);
    logger->enableColor(isatty(STDERR_FILENO) != 0);
    if (!config.logFile.empty())
        logger->setLogFile(config.logFile);
    else
        logger->enableFileOutput(false);

    std::error_code ec = logger->initialize();
    if (ec)
    {
        logger->enableConsoleOutput(true);
        logger->log(CLogLevel::WARN, "Cannot open log file '" +
                                         config.logFile + "': " + ec.message() +
                                         ". Logging to console only.");
    }
    return logger;
}

} /* namespace DocWire */
