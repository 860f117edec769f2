/*-------------------------------------------------------------------------
 *
 * client_regression.cpp
 *      End-to-end tests against a running document database server.
 *      Part of the DocWire document database client.
 *
 * The server is taken from DOCWIRE_TEST_HOST / DOCWIRE_TEST_PORT and
 * defaults to localhost:27017. Tests are skipped when nothing answers.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include <cstdlib>
#include <gtest/gtest.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#include "CWireError.hpp"
#include "client/CConnection.hpp"
#include "client/CDocumentOperations.hpp"

using json = nlohmann::json;

namespace DocWire
{
namespace Regression
{

class ClientRegressionTest : public ::testing::Test
{
  protected:
    std::optional<CConnection> conn;
    std::string collection;

    void SetUp() override
    {
        const char* host = std::getenv("DOCWIRE_TEST_HOST");
        const char* port = std::getenv("DOCWIRE_TEST_PORT");

        collection = "docwire_regression.users_" + std::to_string(::getpid());

        try
        {
            conn.emplace(CConnection::connectOnPort(
                host ? host : "localhost",
                port ? static_cast<uint16_t>(std::atoi(port))
                     : DEFAULT_SERVER_PORT));
        }
        catch (const CTransportError& e)
        {
            GTEST_SKIP() << "No server available: " << e.what();
        }
    }

    void TearDown() override
    {
        if (conn && conn->isOpen() && !conn->isBroken())
        {
            try
            {
                deleteDocuments(*conn, collection, CBsonType());
            }
            catch (const CWireError& e)
            {
                std::cerr << "cleanup failed: " << e.what() << std::endl;
            }
        }
    }

    static CBsonType doc(const std::string& text)
    {
        auto parsed = CBsonType::fromJson(text);
        if (!parsed)
            ADD_FAILURE() << "bad test document: " << text;
        return parsed ? *parsed : CBsonType();
    }

    /* Query results as JSON with the server-assigned _id removed */
    json findAsJson(const std::string& selector,
                    const std::optional<std::string>& fields = std::nullopt)
    {
        std::optional<CBsonType> fieldSelector;
        if (fields)
            fieldSelector = doc(*fields);

        json results = json::array();
        for (const auto& d :
             query(*conn, collection, {}, 0, 0, doc(selector), fieldSelector))
        {
            json j = json::parse(d.toJsonRelaxed());
            j.erase("_id");
            results.push_back(j);
        }
        return results;
    }

    void compareResults(const std::string& testName, const json& actual,
                        const std::string& expected)
    {
        json expectedJson = json::parse(expected);

        std::cout << "\n=== Test: " << testName << " ===" << std::endl;
        std::cout << "Actual Result:" << std::endl << actual.dump(2) << std::endl;

        EXPECT_EQ(actual, expectedJson)
            << "JSON results do not match for test: " << testName;
    }
};

TEST_F(ClientRegressionTest, InsertThenQuery)
{
    insert(*conn, collection, doc(R"({"name": "John Doe", "age": 30})"));

    compareResults("insert_query", findAsJson(R"({"name": "John Doe"})"),
                   R"([{"name": "John Doe", "age": 30}])");
}

TEST_F(ClientRegressionTest, InsertManyKeepsOrder)
{
    insertMany(*conn, collection,
               {doc(R"({"seq": 1})"), doc(R"({"seq": 2})"),
                doc(R"({"seq": 3})")});

    compareResults("insert_many", findAsJson("{}"),
                   R"([{"seq": 1}, {"seq": 2}, {"seq": 3}])");
}

TEST_F(ClientRegressionTest, QueryWithFieldSelector)
{
    insert(*conn, collection,
           doc(R"({"name": "Jane", "age": 28, "email": "jane@example.com"})"));

    compareResults("field_selector",
                   findAsJson(R"({"name": "Jane"})", R"({"_id": 0, "age": 1})"),
                   R"([{"age": 28}])");
}

TEST_F(ClientRegressionTest, UpdateDocument)
{
    insert(*conn, collection, doc(R"({"name": "Update Test", "age": 35})"));
    update(*conn, collection, {}, doc(R"({"name": "Update Test"})"),
           doc(R"({"$set": {"age": 36}})"));

    compareResults("update", findAsJson(R"({"name": "Update Test"})"),
                   R"([{"name": "Update Test", "age": 36}])");
}

TEST_F(ClientRegressionTest, UpsertCreatesDocument)
{
    update(*conn, collection, {CUpdateFlag::Upsert},
           doc(R"({"name": "Upserted"})"), doc(R"({"$set": {"age": 1}})"));

    compareResults("upsert", findAsJson(R"({"name": "Upserted"})"),
                   R"([{"name": "Upserted", "age": 1}])");
}

TEST_F(ClientRegressionTest, DeleteDocument)
{
    insertMany(*conn, collection,
               {doc(R"({"name": "Delete Test"})"), doc(R"({"name": "Keep"})")});
    deleteDocuments(*conn, collection, doc(R"({"name": "Delete Test"})"));

    compareResults("delete", findAsJson("{}"), R"([{"name": "Keep"}])");
}

TEST_F(ClientRegressionTest, EmptyResult)
{
    compareResults("empty", findAsJson(R"({"name": "nobody"})"), "[]");
    EXPECT_FALSE(conn->isBroken());
}

} // namespace Regression
} // namespace DocWire
