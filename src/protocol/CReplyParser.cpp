/*-------------------------------------------------------------------------
 *
 * CReplyParser.cpp
 *      OP_REPLY parsing for the document wire protocol.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "protocol/CReplyParser.hpp"

#include "CWireError.hpp"
#include "network/IDuplexStream.hpp"

#include <string>

namespace DocWire
{

/* Smallest encoded document: length prefix and terminator */
static constexpr size_t MIN_DOCUMENT_BYTES = 5;

const char* replyStateName(CReplyState state) noexcept
{
    switch (state)
    {
    case CReplyState::AwaitHeader:
        return "AwaitHeader";
    case CReplyState::AwaitReplyBlock:
        return "AwaitReplyBlock";
    case CReplyState::AwaitDocuments:
        return "AwaitDocuments";
    case CReplyState::Done:
        return "Done";
    }
    return "Unknown";
}

CReplyParser::CReplyParser(int32_t expectedRequestID)
    : expectedRequestID_(expectedRequestID), state_(CReplyState::AwaitHeader)
{
}

size_t CReplyParser::documentRegionSize(const CDocumentMessageHeader& header)
{
    return static_cast<size_t>(header.messageLength) - MESSAGE_HEADER_SIZE -
           REPLY_HEADER_SIZE;
}

CDocumentMessageHeader CReplyParser::parseMessageHeader(const uint8_t* data,
                                                        size_t size)
{
    CDocumentMessageHeader header;

    if (!header.deserialize(data, size))
        throw CProtocolError(CWireErrorKind::MessageLength,
                             static_cast<int64_t>(MESSAGE_HEADER_SIZE),
                             static_cast<int64_t>(size),
                             "short message header");

    /* Unknown values raise CUnknownOpcodeError before the REPLY check */
    CDocumentOpCode opcode = wireToOpcode(header.opCode);
    if (opcode != CDocumentOpCode::OP_REPLY)
        throw CProtocolError(CWireErrorKind::UnexpectedOpcode,
                             opcodeToWire(CDocumentOpCode::OP_REPLY),
                             header.opCode, opcodeName(opcode));

    if (header.responseTo != expectedRequestID_)
        throw CProtocolError(CWireErrorKind::ResponseToMismatch,
                             expectedRequestID_, header.responseTo);

    if (header.messageLength <
        static_cast<int32_t>(MESSAGE_HEADER_SIZE + REPLY_HEADER_SIZE))
        throw CProtocolError(
            CWireErrorKind::MessageLength,
            static_cast<int64_t>(MESSAGE_HEADER_SIZE + REPLY_HEADER_SIZE),
            header.messageLength, "messageLength below the fixed reply size");

    if (header.messageLength > MAX_MESSAGE_SIZE)
        throw CProtocolError(CWireErrorKind::MessageLength, MAX_MESSAGE_SIZE,
                             header.messageLength,
                             "messageLength above the maximum message size");

    state_ = CReplyState::AwaitReplyBlock;
    return header;
}

CDocumentReplyHeader CReplyParser::parseReplyHeader(const uint8_t* data,
                                                    size_t size)
{
    CDocumentReplyHeader reply;

    if (!reply.deserialize(data, size))
        throw CProtocolError(CWireErrorKind::MessageLength,
                             static_cast<int64_t>(REPLY_HEADER_SIZE),
                             static_cast<int64_t>(size), "short reply block");

    if (reply.responseFlags != 0)
        throw CProtocolError(CWireErrorKind::ResponseFlags, 0,
                             reply.responseFlags,
                             describeReplyFlags(reply.responseFlags));

    if (reply.numberReturned < 0)
        throw CProtocolError(CWireErrorKind::DocumentRegion, 0,
                             reply.numberReturned, "negative numberReturned");

    state_ = CReplyState::AwaitDocuments;
    return reply;
}

std::vector<CBsonType> CReplyParser::parseDocuments(const uint8_t* data,
                                                    size_t size,
                                                    int32_t numberReturned)
{
    std::vector<CBsonType> documents;
    size_t offset = 0;

    /* Every document takes at least five bytes of the region */
    if (numberReturned < 0 ||
        static_cast<size_t>(numberReturned) > size / MIN_DOCUMENT_BYTES)
        throw CProtocolError(CWireErrorKind::DocumentRegion,
                             static_cast<int64_t>(size / MIN_DOCUMENT_BYTES),
                             numberReturned,
                             "numberReturned exceeds what " +
                                 std::to_string(size) + " bytes can hold");

    documents.reserve(static_cast<size_t>(numberReturned));
    for (int32_t i = 0; i < numberReturned; ++i)
    {
        size_t consumed = 0;
        auto document = CBsonType::decode(data + offset, size - offset, consumed);
        if (!document)
            throw CProtocolError(CWireErrorKind::DocumentRegion, numberReturned,
                                 i,
                                 "document " + std::to_string(i) +
                                     " does not decode at offset " +
                                     std::to_string(offset) + " of " +
                                     std::to_string(size));
        documents.push_back(std::move(*document));
        offset += consumed;
    }

    if (offset != size)
        throw CProtocolError(CWireErrorKind::DocumentRegion,
                             static_cast<int64_t>(size),
                             static_cast<int64_t>(offset),
                             "trailing bytes after the last document");

    state_ = CReplyState::Done;
    return documents;
}

CDocumentReply CReplyParser::parseReply(const uint8_t* data, size_t size)
{
    CDocumentReply result;

    if (size < MESSAGE_HEADER_SIZE)
        throw CProtocolError(CWireErrorKind::MessageLength,
                             static_cast<int64_t>(MESSAGE_HEADER_SIZE),
                             static_cast<int64_t>(size), "short message header");
    result.header = parseMessageHeader(data, MESSAGE_HEADER_SIZE);

    if (size != static_cast<size_t>(result.header.messageLength))
        throw CProtocolError(CWireErrorKind::MessageLength,
                             result.header.messageLength,
                             static_cast<int64_t>(size),
                             "buffer size differs from messageLength");

    result.reply = parseReplyHeader(data + MESSAGE_HEADER_SIZE, REPLY_HEADER_SIZE);
    result.documents =
        parseDocuments(data + MESSAGE_HEADER_SIZE + REPLY_HEADER_SIZE,
                       documentRegionSize(result.header),
                       result.reply.numberReturned);
    return result;
}

CDocumentReply CReplyParser::readReply(IDuplexStream& stream)
{
    CDocumentReply result;
    uint8_t headerBytes[MESSAGE_HEADER_SIZE];
    uint8_t replyBytes[REPLY_HEADER_SIZE];
    std::error_code ec;

    ec = stream.readExact(headerBytes, sizeof(headerBytes));
    if (ec)
        throw CTransportError("reading reply header", ec);
    result.header = parseMessageHeader(headerBytes, sizeof(headerBytes));

    ec = stream.readExact(replyBytes, sizeof(replyBytes));
    if (ec)
        throw CTransportError("reading reply block", ec);
    result.reply = parseReplyHeader(replyBytes, sizeof(replyBytes));

    std::vector<uint8_t> body(documentRegionSize(result.header));
    if (!body.empty())
    {
        ec = stream.readExact(body.data(), body.size());
        if (ec)
            throw CTransportError("reading reply documents", ec);
    }
    result.documents =
        parseDocuments(body.data(), body.size(), result.reply.numberReturned);
    return result;
}

} /* namespace DocWire */
