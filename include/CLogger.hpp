/*-------------------------------------------------------------------------
 *
 * CLogger.hpp
 *      Logging system implementation for DocWire.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once
#include "CClientConfig.hpp"
#include "IInterfaces.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace DocWire
{

class CLogger : public ILogger
{
  public:
    explicit CLogger(const CClientConfig& config);
    ~CLogger() override;
    void log(CLogLevel level, const std::string& message) override;
    void setLogLevel(CLogLevel level) override;
    CLogLevel getLogLevel() const noexcept override;
    std::error_code initialize() override;
    void shutdown() noexcept override;
    void logWithContext(CLogLevel level, const std::string& message,
                        const std::string& context);
    void setLogFile(const std::string& filename);
    void enableConsoleOutput(bool enable);
    void enableFileOutput(bool enable);
    void enableColor(bool enable);
    bool shouldLog(CLogLevel level) const noexcept;

  private:
    CClientConfig config_;
    std::string logFile_;
    bool consoleOutput_;
    bool fileOutput_;
    bool colorOutput_;
    std::string timestampFormat_;
    std::atomic<CLogLevel> logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::mutex logMutex_;
    std::atomic<bool> initialized_;
    void writeToConsole(const std::string& message);
    void writeToFile(const std::string& message);
    std::string formatMessage(CLogLevel level, const std::string& message);
    std::string getLevelString(CLogLevel level) const;
    std::string getTimestamp() const;
};

/* Build a logger from client configuration: level, file and console flags */
std::shared_ptr<CLogger> makeLogger(const CClientConfig& config);

} /* namespace DocWire */
