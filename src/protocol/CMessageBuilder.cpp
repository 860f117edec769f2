/*-------------------------------------------------------------------------
 *
 * CMessageBuilder.cpp
 *      Request framing for the document wire protocol.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CMessageBuilder.hpp"

#include <limits>
#include <stdexcept>

namespace DocWire
{

/* Reserved int32 fields are always written as zero */
static constexpr int32_t RESERVED = 0;

std::vector<uint8_t> CMessageBuilder::buildDeleteBody(
    const std::string& collection, const CBsonType& selector)
{
    CWireWriter writer;

    writer.appendInt32(RESERVED);
    writer.appendCString(collection);
    writer.appendInt32(RESERVED); /* flags */
    writer.appendDocument(selector);
    return writer.release();
}

std::vector<uint8_t> CMessageBuilder::buildInsertBody(
    const std::string& collection, const CBsonType& document)
{
    CWireWriter writer;

    writer.appendInt32(RESERVED);
    writer.appendCString(collection);
    writer.appendDocument(document);
    return writer.release();
}

std::vector<uint8_t> CMessageBuilder::buildInsertManyBody(
    const std::string& collection, const std::vector<CBsonType>& documents)
{
    CWireWriter writer;

    writer.appendInt32(RESERVED);
    writer.appendCString(collection);
    for (const auto& document : documents)
        writer.appendDocument(document);
    return writer.release();
}

std::vector<uint8_t> CMessageBuilder::buildQueryBody(
    const std::string& collection, const std::vector<CQueryOption>& options,
    int32_t numberToSkip, int32_t numberToReturn, const CBsonType& selector,
    const std::optional<CBsonType>& fieldSelector)
{
    CWireWriter writer;

    writer.appendInt32(encodeQueryOptions(options));
    writer.appendCString(collection);
    writer.appendInt32(numberToSkip);
    writer.appendInt32(numberToReturn);
    writer.appendDocument(selector);
    if (fieldSelector)
        writer.appendDocument(*fieldSelector);
    return writer.release();
}

std::vector<uint8_t> CMessageBuilder::buildUpdateBody(
    const std::string& collection, const std::vector<CUpdateFlag>& flags,
    const CBsonType& selector, const CBsonType& update)
{
    CWireWriter writer;

    writer.appendInt32(RESERVED);
    writer.appendCString(collection);
    writer.appendInt32(encodeUpdateFlags(flags));
    writer.appendDocument(selector);
    writer.appendDocument(update);
    return writer.release();
}

std::vector<uint8_t> CMessageBuilder::packMessage(
    CDocumentOpCode opcode, int32_t requestID, const std::vector<uint8_t>& body)
{
    CDocumentMessageHeader header;
    CWireWriter writer;

    if (body.size() >
        static_cast<size_t>(std::numeric_limits<int32_t>::max()) -
            MESSAGE_HEADER_SIZE)
        throw std::length_error("message body too large for an int32 length");

    header.messageLength =
        static_cast<int32_t>(MESSAGE_HEADER_SIZE + body.size());
    header.requestID = requestID;
    header.responseTo = 0;
    header.opCode = opcodeToWire(opcode);

    writer.appendBytes(header.serialize());
    writer.appendBytes(body);
    return writer.release();
}

} /* namespace DocWire */
