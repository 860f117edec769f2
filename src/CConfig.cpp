/*-------------------------------------------------------------------------
 *
 * CConfig.cpp
 *		  Configuration management implementation for DocWire
 *
 * Handles loading and processing of configuration files in JSON, YAML
 * and INI/conf formats. Nested keys are flattened with '.'.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "CConfig.hpp"
#include "CLogger.hpp"

namespace DocWire
{

namespace
{

std::string
trim(const std::string& s)
{
	size_t first = s.find_first_not_of(" \t\r");
	if (first == std::string::npos)
		return std::string();
	size_t last = s.find_last_not_of(" \t\r");
	return s.substr(first, last - first + 1);
}

/*
 * parseScalar
 *		Turn an untyped scalar into bool, int, double or string.
 *		Numbers must consume the whole text to count as numbers.
 */
ConfigValue
parseScalar(const std::string& text)
{
	size_t pos = 0;

	if (text == "true" || text == "false")
		return text == "true";

	try
	{
		if (text.find_first_of(".eE") == std::string::npos)
		{
			int iv = std::stoi(text, &pos);
			if (pos == text.size())
				return iv;
		}
		else
		{
			double dv = std::stod(text, &pos);
			if (pos == text.size())
				return dv;
		}
	}
	catch (const std::invalid_argument&)
	{
		/* not a number, fall through */
	}
	catch (const std::out_of_range&)
	{
		/* too large for int, keep text */
	}
	return text;
}

} /* namespace */

/*
 * CConfig constructor
 *		Initialize configuration manager
 */
CConfig::CConfig() : logger_(nullptr)
{
}

CConfig::~CConfig() = default;

/*
 * loadFromFile
 *		Load configuration from file based on extension
 */
std::error_code
CConfig::loadFromFile(const std::string& filename)
{
	std::string		extension;
	std::ifstream	file;
	std::string		content;
	size_t			dot;

	dot = filename.find_last_of('.');
	if (dot == std::string::npos)
		return std::make_error_code(std::errc::invalid_argument);
	extension = filename.substr(dot + 1);

	file.open(filename);
	if (!file.is_open())
	{
		if (logger_)
			logger_->log(CLogLevel::ERROR,
						 "Cannot open configuration file: '" + filename + "'.");
		return std::make_error_code(std::errc::no_such_file_or_directory);
	}

	content = std::string((std::istreambuf_iterator<char>(file)),
						  std::istreambuf_iterator<char>());
	file.close();

	if (extension == "json")
		return loadFromJson(content);
	else if (extension == "yaml" || extension == "yml")
		return loadFromYaml(content);
	else if (extension == "ini" || extension == "conf")
		return loadFromIni(content);

	return std::make_error_code(std::errc::invalid_argument);
}

/*
 * loadFromJson
 *		Parse JSON configuration content
 */
std::error_code
CConfig::loadFromJson(const std::string& jsonContent)
{
	if (jsonContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		nlohmann::json j = nlohmann::json::parse(jsonContent);
		if (!j.is_object())
			return std::make_error_code(std::errc::invalid_argument);
		processJsonNode("", j);
		return std::error_code{};
	}
	catch (const nlohmann::json::exception& e)
	{
		if (logger_)
		{
			logger_->log(CLogLevel::ERROR,
						 std::string("JSON parsing error: '") + e.what() + "'.");
		}
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processJsonNode
 *		Recursively process JSON nodes to flatten nested structure
 */
void
CConfig::processJsonNode(const std::string& prefix, const nlohmann::json& node)
{
	if (node.is_object())
	{
		for (auto it = node.begin(); it != node.end(); ++it)
		{
			std::string fullKey = prefix.empty() ? it.key() : prefix + "." + it.key();
			processJsonNode(fullKey, it.value());
		}
	}
	else if (node.is_string())
	{
		set(prefix, node.get<std::string>(), ConfigSource::FILE);
	}
	else if (node.is_number_integer())
	{
		int64_t v = node.get<int64_t>();
		if (v >= INT32_MIN && v <= INT32_MAX)
			set(prefix, static_cast<int>(v), ConfigSource::FILE);
		else
			set(prefix, v, ConfigSource::FILE);
	}
	else if (node.is_number_float())
	{
		set(prefix, node.get<double>(), ConfigSource::FILE);
	}
	else if (node.is_boolean())
	{
		set(prefix, node.get<bool>(), ConfigSource::FILE);
	}
	else if (node.is_array())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.is_string())
				arrayValues.push_back(item.get<std::string>());
			else
				arrayValues.push_back(item.dump());
		}
		set(prefix, arrayValues, ConfigSource::FILE);
	}
	else if (node.is_null())
	{
		set(prefix, std::string(""), ConfigSource::FILE);
	}
}

/*
 * loadFromYaml
 *		Parse YAML configuration content
 */
std::error_code
CConfig::loadFromYaml(const std::string& yamlContent)
{
	if (yamlContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		YAML::Node config = YAML::Load(yamlContent);
		if (!config.IsMap())
			return std::make_error_code(std::errc::invalid_argument);
		processYamlNode("", config);
		return std::error_code{};
	}
	catch (const YAML::Exception& e)
	{
		if (logger_)
		{
			logger_->log(CLogLevel::ERROR,
						 std::string("YAML parsing error: '") + e.what() + "'.");
		}
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processYamlNode
 *		Recursively process YAML nodes
 */
void
CConfig::processYamlNode(const std::string& prefix, const YAML::Node& node)
{
	if (node.IsMap())
	{
		for (const auto& pair : node)
		{
			std::string key = pair.first.as<std::string>();
			std::string fullKey = prefix.empty() ? key : prefix + "." + key;
			processYamlNode(fullKey, pair.second);
		}
	}
	else if (node.IsNull())
	{
		set(prefix, std::string(""), ConfigSource::FILE);
	}
	else if (node.IsScalar())
	{
		set(prefix, parseScalar(node.as<std::string>()), ConfigSource::FILE);
	}
	else if (node.IsSequence())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.IsScalar())
			{
				arrayValues.push_back(item.as<std::string>());
			}
			else
			{
				std::stringstream ss;
				ss << item;
				arrayValues.push_back(ss.str());
			}
		}
		set(prefix, arrayValues, ConfigSource::FILE);
	}
}

/*
 * loadFromIni
 *		Parse INI/conf content; [section] names prefix the keys.
 *		Values keep their text unless they read as a number or boolean.
 */
std::error_code
CConfig::loadFromIni(const std::string& iniContent)
{
	std::istringstream	stream(iniContent);
	std::string			line;
	std::string			currentSection;

	if (iniContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	while (std::getline(stream, line))
	{
		line = trim(line);
		if (line.empty() || line[0] == ';' || line[0] == '#')
			continue;

		if (line[0] == '[')
		{
			size_t endBracket = line.find(']');
			if (endBracket == std::string::npos)
				return std::make_error_code(std::errc::invalid_argument);
			currentSection = trim(line.substr(1, endBracket - 1));
			continue;
		}

		size_t equalPos = line.find('=');
		if (equalPos == std::string::npos)
			continue;

		std::string key = trim(line.substr(0, equalPos));
		std::string value = trim(line.substr(equalPos + 1));
		if (key.empty())
			continue;

		std::string fullKey =
			currentSection.empty() ? key : currentSection + "." + key;

		if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
			set(fullKey, value.substr(1, value.size() - 2), ConfigSource::FILE);
		else
			set(fullKey, parseScalar(value), ConfigSource::FILE);
	}

	return std::error_code{};
}

std::string
CConfig::toJson() const
{
	nlohmann::json j = nlohmann::json::object();

	for (const auto& [key, value] : config_values_)
	{
		std::visit([&j, &key](const auto& v) { j[key] = v; }, value);
	}
	return j.dump(2);
}

void
CConfig::set(const std::string& key, const ConfigValue& value,
			 ConfigSource source)
{
	ConfigEntry entry;

	config_values_[key] = value;

	entry.key = key;
	entry.value = value;
	entry.lastModified = std::chrono::system_clock::now();
	entry.source = source;
	config_metadata_[key] = entry;

	if (logger_)
		logger_->log(CLogLevel::DEBUG, "Configuration value set: '" + key + "'.");
}

std::optional<ConfigValue>
CConfig::get(const std::string& key) const
{
	auto it = config_values_.find(key);
	if (it != config_values_.end())
		return it->second;
	return std::nullopt;
}

std::optional<ConfigSource>
CConfig::sourceOf(const std::string& key) const
{
	auto it = config_metadata_.find(key);
	if (it != config_metadata_.end())
		return it->second.source;
	return std::nullopt;
}

bool
CConfig::has(const std::string& key) const
{
	return config_values_.find(key) != config_values_.end();
}

std::vector<std::string>
CConfig::keys() const
{
	std::vector<std::string> result;
	result.reserve(config_values_.size());
	for (const auto& [key, _] : config_values_)
		result.push_back(key);
	return result;
}

void
CConfig::setLogger(std::shared_ptr<CLogger> logger)
{
	logger_ = std::move(logger);
}

std::shared_ptr<CLogger>
CConfig::getLogger() const
{
	return logger_;
}

} // namespace DocWire
