/*-------------------------------------------------------------------------
 *
 * CDocumentWireProtocol.hpp
 *      Document Wire Protocol definitions for DocWire: opcodes, option
 *      and flag bits, the fixed message and reply headers, and the
 *      little-endian field writer/reader used to frame them.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace DocWire
{

class CBsonType;

/* Fixed block sizes on the wire */
constexpr size_t MESSAGE_HEADER_SIZE = 16;
constexpr size_t REPLY_HEADER_SIZE = 20;

/* Largest envelope accepted from a server */
constexpr int32_t MAX_MESSAGE_SIZE = 48000000;

/**
 * Document Wire Protocol OpCodes
 */
enum class CDocumentOpCode : int32_t
{
    OP_REPLY = 1,        /* Reply to a client request; responseTo is set */
    OP_MSG = 1000,       /* Generic message followed by a string */
    OP_UPDATE = 2001,
    OP_INSERT = 2002,
    OP_GET_BY_OID = 2003,
    OP_QUERY = 2004,
    OP_GET_MORE = 2005,  /* Recognized, never sent */
    OP_DELETE = 2006,
    OP_KILL_CURSORS = 2007
};

int32_t opcodeToWire(CDocumentOpCode opcode) noexcept;

/* Throws CUnknownOpcodeError for values outside the table */
CDocumentOpCode wireToOpcode(int32_t value);

const char* opcodeName(CDocumentOpCode opcode) noexcept;

/**
 * OP_QUERY option bits
 */
enum class CQueryOption : uint8_t
{
    TailableCursor,
    SlaveOK,
    OpLogReplay,
    NoCursorTimeout
};

/**
 * OP_UPDATE flag bits
 */
enum class CUpdateFlag : uint8_t
{
    Upsert,
    Multiupdate
};

int32_t queryOptionBit(CQueryOption option) noexcept;
int32_t updateFlagBit(CUpdateFlag flag) noexcept;

/* Bitwise OR of each element's bit; empty set gives 0 */
int32_t encodeQueryOptions(const std::vector<CQueryOption>& options) noexcept;
int32_t encodeUpdateFlags(const std::vector<CUpdateFlag>& flags) noexcept;

/**
 * OP_REPLY responseFlags bits. Any of them set fails a reply.
 */
enum class CReplyFlags : int32_t
{
    CURSOR_NOT_FOUND = 0x00000001,
    QUERY_FAILURE = 0x00000002,
    SHARD_CONFIG_STALE = 0x00000004,
    AWAIT_CAPABLE = 0x00000008
};

/* "QUERY_FAILURE|CURSOR_NOT_FOUND" style rendering for error messages */
std::string describeReplyFlags(int32_t flags);

/**
 * Document Wire Protocol Message Header (16 bytes)
 */
struct CDocumentMessageHeader
{
    int32_t messageLength; /* Total size including header */
    int32_t requestID;     /* Chosen by sender */
    int32_t responseTo;    /* For replies, echo requestID of request. Zero for
                              requests */
    int32_t opCode;        /* Operation code, raw wire value */

    CDocumentMessageHeader()
        : messageLength(0), requestID(0), responseTo(0), opCode(0)
    {
    }

    /* Serialize header to bytes */
    std::vector<uint8_t> serialize() const;

    /* Deserialize header from exactly MESSAGE_HEADER_SIZE bytes */
    bool deserialize(const uint8_t* data, size_t size);
};

/**
 * OP_REPLY block following the message header (20 bytes)
 */
struct CDocumentReplyHeader
{
    int32_t responseFlags;
    int64_t cursorID;
    int32_t startingFrom;
    int32_t numberReturned;

    CDocumentReplyHeader()
        : responseFlags(0), cursorID(0), startingFrom(0), numberReturned(0)
    {
    }

    std::vector<uint8_t> serialize() const;

    /* Deserialize from exactly REPLY_HEADER_SIZE bytes */
    bool deserialize(const uint8_t* data, size_t size);
};

/**
 * Appends fixed-width little-endian fields to a growing buffer.
 */
class CWireWriter
{
  public:
    CWireWriter() = default;

    void appendInt32(int32_t value);
    void appendInt64(int64_t value);

    /* Raw bytes followed by one 0x00; throws std::invalid_argument when
       value itself contains a 0x00 */
    void appendCString(const std::string& value);

    void appendBytes(const uint8_t* data, size_t size);
    void appendBytes(const std::vector<uint8_t>& data);
    void appendDocument(const CBsonType& document);

    size_t size() const noexcept
    {
        return buffer_.size();
    }
    const std::vector<uint8_t>& data() const noexcept
    {
        return buffer_;
    }
    std::vector<uint8_t> release() noexcept;

  private:
    std::vector<uint8_t> buffer_;
};

/**
 * Reads fixed-width little-endian fields from a byte range. Each read
 * returns false, leaving the offset unchanged, when too few bytes remain.
 */
class CWireReader
{
  public:
    CWireReader(const uint8_t* data, size_t size)
        : data_(data), size_(size), offset_(0)
    {
    }

    bool readInt32(int32_t& result);
    bool readInt64(int64_t& result);
    bool readCString(std::string& result);

    size_t offset() const noexcept
    {
        return offset_;
    }
    size_t remaining() const noexcept
    {
        return size_ - offset_;
    }

  private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

} /* namespace DocWire */
