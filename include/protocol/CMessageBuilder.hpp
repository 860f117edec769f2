/*-------------------------------------------------------------------------
 *
 * CMessageBuilder.hpp
 *      Builds request bodies and length-prefixed envelopes for the
 *      write-style operations and OP_QUERY.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBsonType.hpp"
#include "CDocumentWireProtocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocWire
{

class CMessageBuilder
{
  public:
    /* int32 0 | cstring collection | int32 0 | selector */
    static std::vector<uint8_t> buildDeleteBody(const std::string& collection,
                                                const CBsonType& selector);

    /* int32 0 | cstring collection | document */
    static std::vector<uint8_t> buildInsertBody(const std::string& collection,
                                                const CBsonType& document);

    /* int32 0 | cstring collection | documents in input order */
    static std::vector<uint8_t>
    buildInsertManyBody(const std::string& collection,
                        const std::vector<CBsonType>& documents);

    /*
     * int32 options | cstring collection | int32 skip | int32 return |
     * selector | [fieldSelector]. A missing field selector adds no bytes.
     */
    static std::vector<uint8_t>
    buildQueryBody(const std::string& collection,
                   const std::vector<CQueryOption>& options,
                   int32_t numberToSkip, int32_t numberToReturn,
                   const CBsonType& selector,
                   const std::optional<CBsonType>& fieldSelector);

    /* int32 0 | cstring collection | int32 flags | selector | update */
    static std::vector<uint8_t>
    buildUpdateBody(const std::string& collection,
                    const std::vector<CUpdateFlag>& flags,
                    const CBsonType& selector, const CBsonType& update);

    /*
     * Prefix body with the 16-byte header: int32(16 + body) | requestID |
     * int32 0 | opcode. Throws std::length_error when the envelope would
     * not fit an int32 length.
     */
    static std::vector<uint8_t> packMessage(CDocumentOpCode opcode,
                                            int32_t requestID,
                                            const std::vector<uint8_t>& body);
};

} /* namespace DocWire */
