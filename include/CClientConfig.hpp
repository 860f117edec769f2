/*-------------------------------------------------------------------------
 *
 * CClientConfig.hpp
 *      Client configuration for DocWire.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace DocWire
{

class CConfig;

/* Default port of the document database server */
constexpr uint16_t DEFAULT_SERVER_PORT = 27017;

struct CClientConfig
{
    std::string clientName;
    std::string host;
    uint16_t port;
    std::string logLevel;
    std::string logFile;
    bool consoleLog;
    bool tcpNoDelay;
    std::string configFile;

    CClientConfig()
        : clientName("docwire"), host("localhost"), port(DEFAULT_SERVER_PORT),
          logLevel("INFO"), logFile(""), consoleLog(true), tcpNoDelay(true),
          configFile("")
    {
    }

    void setDefaults();
    void loadFromConfig(const CConfig& config);
    std::error_code loadFromFile(const std::string& filename);
    bool validate() const;
};

} /* namespace DocWire */
