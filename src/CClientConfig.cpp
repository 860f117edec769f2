/*-------------------------------------------------------------------------
 *
 * CClientConfig.cpp
 *		  Client configuration implementation for DocWire
 *
 * Handles client configuration loading, validation, and default values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CClientConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CClientConfig.hpp"

#include "CConfig.hpp"
#include "IInterfaces.hpp"

#include <string>
#include <vector>

using namespace std;

namespace DocWire
{

namespace
{

/* Keys may appear flat or under one of these sections */
const vector<string> kSections = {"", "client.", "logging."};

template <typename T>
bool
lookup(const CConfig& config, const string& key, T& out)
{
	for (const auto& section : kSections)
	{
		auto value = config.get(section + key);
		if (!value)
			continue;

		if (holds_alternative<T>(*value))
		{
			out = get<T>(*value);
			return true;
		}
		if constexpr (is_same_v<T, int>)
		{
			if (holds_alternative<double>(*value))
			{
				out = static_cast<int>(get<double>(*value));
				return true;
			}
			if (holds_alternative<string>(*value))
			{
				try
				{
					out = stoi(get<string>(*value));
					return true;
				}
				catch (const std::exception&)
				{
					continue;
				}
			}
		}
		else if constexpr (is_same_v<T, bool>)
		{
			if (holds_alternative<string>(*value))
			{
				const string& s = get<string>(*value);
				out = (s == "true" || s == "1" || s == "yes" || s == "on");
				return true;
			}
		}
	}
	return false;
}

} /* namespace */

/*
 * setDefaults
 *		Set default configuration values
 */
void
CClientConfig::setDefaults()
{
	clientName = "docwire";
	host = "localhost";
	port = DEFAULT_SERVER_PORT;
	logLevel = "INFO";
	logFile = "";
	consoleLog = true;
	tcpNoDelay = true;
	configFile = "";
}

/*
 * loadFromConfig
 *		Copy recognised keys out of a loaded configuration store.
 *		Keys that are absent leave the current value untouched.
 */
void
CClientConfig::loadFromConfig(const CConfig& config)
{
	int portValue = 0;

	lookup(config, "name", clientName);
	lookup(config, "host", host);
	if (lookup(config, "port", portValue))
	{
		/* Out of range values are caught by validate() */
		port = (portValue > 0 && portValue <= 65535)
				   ? static_cast<uint16_t>(portValue)
				   : 0;
	}
	lookup(config, "level", logLevel);
	lookup(config, "log_level", logLevel);
	lookup(config, "file", logFile);
	lookup(config, "log_file", logFile);
	lookup(config, "console", consoleLog);
	lookup(config, "tcp_nodelay", tcpNoDelay);
}

/*
 * loadFromFile
 *		Load configuration from a .json, .yaml, .yml, .ini or .conf file
 */
std::error_code
CClientConfig::loadFromFile(const std::string& filename)
{
	CConfig config;
	std::error_code ec;

	ec = config.loadFromFile(filename);
	if (ec)
		return ec;

	loadFromConfig(config);
	configFile = filename;
	return std::error_code{};
}

/*
 * validate
 *		Validate configuration values
 */
bool
CClientConfig::validate() const
{
	if (host.empty())
		return false;
	if (port == 0)
		return false;
	if (!parseLogLevel(logLevel))
		return false;
	return true;
}

} /* namespace DocWire */
