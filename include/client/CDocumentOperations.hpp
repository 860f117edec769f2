/*-------------------------------------------------------------------------
 *
 * CDocumentOperations.hpp
 *      Insert, update, delete and query over a CConnection.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../protocol/CBsonType.hpp"
#include "../protocol/CDocumentWireProtocol.hpp"
#include "CConnection.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocWire
{

using RequestID = int32_t;

/*
 * Write-style operations send one envelope and return its request id
 * without waiting for any reply. Collection names are full namespaces
 * such as "db.users".
 */
RequestID deleteDocuments(CConnection& conn, const std::string& collection,
                          const CBsonType& selector);

/* Same as deleteDocuments */
RequestID remove(CConnection& conn, const std::string& collection,
                 const CBsonType& selector);

RequestID insert(CConnection& conn, const std::string& collection,
                 const CBsonType& document);

/*
 * All documents travel in one envelope. No batching is applied; the
 * caller keeps the message under the server's size limit.
 */
RequestID insertMany(CConnection& conn, const std::string& collection,
                     const std::vector<CBsonType>& documents);

RequestID update(CConnection& conn, const std::string& collection,
                 const std::vector<CUpdateFlag>& flags,
                 const CBsonType& selector, const CBsonType& updateDocument);

/*
 * Send OP_QUERY and block for its reply. Only the first batch is
 * returned; OP_GET_MORE is never issued.
 */
std::vector<CBsonType> query(CConnection& conn, const std::string& collection,
                             const std::vector<CQueryOption>& options,
                             int32_t numberToSkip, int32_t numberToReturn,
                             const CBsonType& selector,
                             const std::optional<CBsonType>& fieldSelector =
                                 std::nullopt);

} /* namespace DocWire */
