/*-------------------------------------------------------------------------
 *
 * main.cpp
 *		  Command-line client for DocWire
 *
 * Sends insert, update, delete and query messages to a document
 * database server. Documents are given as JSON text.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/main.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CClientConfig.hpp"
#include "CLogger.hpp"
#include "CWireError.hpp"
#include "client/CConnection.hpp"
#include "client/CDocumentOperations.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace DocWire;

static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_WIRE = 2;

static void
usage(const char *progname)
{
	std::cout << "DocWire - document database wire protocol client\n";
	std::cout << "Usage: " << progname
			  << " [OPTIONS] <command> <collection> [ARGS]\n\n";
	std::cout << "Options:\n";
	std::cout << "  -c, --config <file>    Configuration file "
				 "(.json, .yaml, .yml, .ini, .conf)\n";
	std::cout << "  -H, --host <host>      Server host (default localhost)\n";
	std::cout << "  -p, --port <port>      Server port (default 27017)\n";
	std::cout << "  -v, --verbose          Log at DEBUG level\n";
	std::cout << "  -h, --help             Show this help message\n\n";
	std::cout << "Commands:\n";
	std::cout << "  insert <coll> <json> [<json> ...]\n";
	std::cout << "  query  <coll> <json> [skip] [limit] [fieldsJson]\n";
	std::cout << "  update <coll> <selectorJson> <updateJson> [--upsert] [--multi]\n";
	std::cout << "  delete <coll> <selectorJson>\n";
}

static CBsonType
parseDocumentArg(const std::string& json)
{
	auto document = CBsonType::fromJson(json);
	if (!document)
		throw std::invalid_argument("invalid JSON document: " + json);
	return *document;
}

static int32_t
parseIntArg(const std::string& text, const char *what)
{
	size_t pos = 0;
	int value = std::stoi(text, &pos);
	if (pos != text.size())
		throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
	return static_cast<int32_t>(value);
}

static int
runCommand(CConnection& conn, const std::vector<std::string>& args)
{
	const std::string& command = args[0];
	const std::string& collection = args[1];

	if (command == "insert")
	{
		std::vector<CBsonType> documents;

		if (args.size() < 3)
			throw std::invalid_argument("insert needs at least one document");
		for (size_t i = 2; i < args.size(); ++i)
			documents.push_back(parseDocumentArg(args[i]));

		RequestID id = documents.size() == 1
						   ? DocWire::insert(conn, collection, documents[0])
						   : DocWire::insertMany(conn, collection, documents);
		std::cout << "requestID " << id << "\n";
	}
	else if (command == "query")
	{
		int32_t skip = 0;
		int32_t limit = 0;
		std::optional<CBsonType> fields;

		if (args.size() < 3 || args.size() > 6)
			throw std::invalid_argument("query needs <json> [skip] [limit] [fieldsJson]");
		if (args.size() > 3)
			skip = parseIntArg(args[3], "skip");
		if (args.size() > 4)
			limit = parseIntArg(args[4], "limit");
		if (args.size() > 5)
			fields = parseDocumentArg(args[5]);

		auto documents = DocWire::query(conn, collection, {}, skip, limit,
										parseDocumentArg(args[2]), fields);
		for (const auto& document : documents)
			std::cout << document.toJsonRelaxed() << "\n";
	}
	else if (command == "update")
	{
		std::vector<CUpdateFlag> flags;

		if (args.size() < 4)
			throw std::invalid_argument("update needs <selectorJson> <updateJson>");
		for (size_t i = 4; i < args.size(); ++i)
		{
			if (args[i] == "--upsert")
				flags.push_back(CUpdateFlag::Upsert);
			else if (args[i] == "--multi")
				flags.push_back(CUpdateFlag::Multiupdate);
			else
				throw std::invalid_argument("unknown update flag: " + args[i]);
		}

		RequestID id = DocWire::update(conn, collection, flags,
									   parseDocumentArg(args[2]),
									   parseDocumentArg(args[3]));
		std::cout << "requestID " << id << "\n";
	}
	else if (command == "delete" || command == "remove")
	{
		if (args.size() != 3)
			throw std::invalid_argument("delete needs <selectorJson>");

		RequestID id = DocWire::deleteDocuments(conn, collection,
												parseDocumentArg(args[2]));
		std::cout << "requestID " << id << "\n";
	}
	else
	{
		throw std::invalid_argument("unknown command: " + command);
	}
	return EXIT_SUCCESS;
}

int
main(int argc, char **argv)
{
	CClientConfig				config;
	std::string					configFile;
	std::optional<std::string>	hostOverride;
	std::optional<int32_t>		portOverride;
	bool						verbose = false;
	std::vector<std::string>	positional;
	std::shared_ptr<CLogger>	logger;

	try
	{
		for (int i = 1; i < argc; ++i)
		{
			std::string arg = argv[i];

			if (arg == "-h" || arg == "--help")
			{
				usage(argv[0]);
				return EXIT_SUCCESS;
			}
			else if ((arg == "-c" || arg == "--config") && i + 1 < argc)
				configFile = argv[++i];
			else if ((arg == "-H" || arg == "--host") && i + 1 < argc)
				hostOverride = argv[++i];
			else if ((arg == "-p" || arg == "--port") && i + 1 < argc)
				portOverride = parseIntArg(argv[++i], "port");
			else if (arg == "-v" || arg == "--verbose")
				verbose = true;
			else
				positional.push_back(arg);
		}

		if (positional.size() < 2)
		{
			usage(argv[0]);
			return EXIT_USAGE;
		}

		if (!configFile.empty())
		{
			std::error_code err = config.loadFromFile(configFile);
			if (err)
			{
				std::cerr << "Cannot load configuration '" << configFile
						  << "': " << err.message() << "\n";
				return EXIT_USAGE;
			}
		}
		if (hostOverride)
			config.host = *hostOverride;
		if (portOverride)
			config.port = (*portOverride > 0 && *portOverride <= 65535)
							  ? static_cast<uint16_t>(*portOverride)
							  : 0;
		if (verbose)
			config.logLevel = "DEBUG";

		if (!config.validate())
		{
			std::cerr << "Invalid configuration: host, port or log level\n";
			return EXIT_USAGE;
		}
	}
	catch (const std::exception& e)
	{
		std::cerr << "Usage error: " << e.what() << "\n";
		return EXIT_USAGE;
	}

	logger = makeLogger(config);

	try
	{
		CConnection conn = CConnection::connect(config, logger);
		return runCommand(conn, positional);
	}
	catch (const CWireError& e)
	{
		logger->log(CLogLevel::ERROR, e.what());
		if (!config.consoleLog)
			std::cerr << "Error: " << e.what() << "\n";
		return EXIT_WIRE;
	}
	catch (const std::logic_error& e)
	{
		std::cerr << "Usage error: " << e.what() << "\n";
		return EXIT_USAGE;
	}
}
