/*-------------------------------------------------------------------------
 *
 * CDocumentOperations.cpp
 *      Insert, update, delete and query over a CConnection.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "client/CDocumentOperations.hpp"

#include "protocol/CMessageBuilder.hpp"

namespace DocWire
{

RequestID deleteDocuments(CConnection& conn, const std::string& collection,
                          const CBsonType& selector)
{
    return conn.sendMessage(CDocumentOpCode::OP_DELETE,
                            CMessageBuilder::buildDeleteBody(collection, selector));
}

RequestID remove(CConnection& conn, const std::string& collection,
                 const CBsonType& selector)
{
    return deleteDocuments(conn, collection, selector);
}

RequestID insert(CConnection& conn, const std::string& collection,
                 const CBsonType& document)
{
    return conn.sendMessage(CDocumentOpCode::OP_INSERT,
                            CMessageBuilder::buildInsertBody(collection, document));
}

RequestID insertMany(CConnection& conn, const std::string& collection,
                     const std::vector<CBsonType>& documents)
{
    return conn.sendMessage(
        CDocumentOpCode::OP_INSERT,
        CMessageBuilder::buildInsertManyBody(collection, documents));
}

RequestID update(CConnection& conn, const std::string& collection,
                 const std::vector<CUpdateFlag>& flags,
                 const CBsonType& selector, const CBsonType& updateDocument)
{
    return conn.sendMessage(CDocumentOpCode::OP_UPDATE,
                            CMessageBuilder::buildUpdateBody(
                                collection, flags, selector, updateDocument));
}

std::vector<CBsonType> query(CConnection& conn, const std::string& collection,
                             const std::vector<CQueryOption>& options,
                             int32_t numberToSkip, int32_t numberToReturn,
                             const CBsonType& selector,
                             const std::optional<CBsonType>& fieldSelector)
{
    RequestID requestID = conn.sendMessage(
        CDocumentOpCode::OP_QUERY,
        CMessageBuilder::buildQueryBody(collection, options, numberToSkip,
                                        numberToReturn, selector,
                                        fieldSelector));
    return conn.receiveReply(requestID).documents;
}

} /* namespace DocWire */
