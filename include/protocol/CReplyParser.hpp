/*-------------------------------------------------------------------------
 *
 * CReplyParser.hpp
 *      Reads and validates an OP_REPLY envelope answering one OP_QUERY.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBsonType.hpp"
#include "CDocumentWireProtocol.hpp"

#include <cstdint>
#include <vector>

namespace DocWire
{

class IDuplexStream;

/**
 * Parser stage. On failure the parser stays in the stage that failed.
 */
enum class CReplyState : uint8_t
{
    AwaitHeader = 0,
    AwaitReplyBlock = 1,
    AwaitDocuments = 2,
    Done = 3
};

const char* replyStateName(CReplyState state) noexcept;

struct CDocumentReply
{
    CDocumentMessageHeader header;
    CDocumentReplyHeader reply;
    std::vector<CBsonType> documents; /* In wire order */
};

/**
 * One parser per expected reply. The stages are also exposed on their
 * own so that a caller holding a complete buffer can run them directly.
 * Every failure throws: CUnknownOpcodeError, CProtocolError or, from
 * readReply(), CTransportError.
 */
class CReplyParser
{
  public:
    explicit CReplyParser(int32_t expectedRequestID);

    /* Blocking read of header, reply block and documents from stream */
    CDocumentReply readReply(IDuplexStream& stream);

    /* Parse a complete envelope held in memory */
    CDocumentReply parseReply(const uint8_t* data, size_t size);

    /* Stage 1: decode 16 bytes and check opcode, responseTo and length */
    CDocumentMessageHeader parseMessageHeader(const uint8_t* data, size_t size);

    /* Stage 2: decode 20 bytes and check responseFlags == 0 */
    CDocumentReplyHeader parseReplyHeader(const uint8_t* data, size_t size);

    /*
     * Stage 3: decode exactly numberReturned documents that together
     * occupy exactly size bytes.
     */
    std::vector<CBsonType> parseDocuments(const uint8_t* data, size_t size,
                                          int32_t numberReturned);

    CReplyState state() const noexcept
    {
        return state_;
    }
    int32_t expectedRequestID() const noexcept
    {
        return expectedRequestID_;
    }

    /* messageLength minus the two fixed blocks */
    static size_t documentRegionSize(const CDocumentMessageHeader& header);

  private:
    int32_t expectedRequestID_;
    CReplyState state_;
};

} /* namespace DocWire */
