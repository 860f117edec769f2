/*-------------------------------------------------------------------------
 *
 * CDocumentWireProtocol.cpp
 *      Document Wire Protocol implementation for DocWire.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "protocol/CDocumentWireProtocol.hpp"

#include "CWireError.hpp"
#include "protocol/CBsonType.hpp"

#include <bson/bson.h>

#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace DocWire
{

namespace
{

struct OpcodeEntry
{
    CDocumentOpCode opcode;
    const char* name;
};

const OpcodeEntry kOpcodes[] = {
    {CDocumentOpCode::OP_REPLY, "OP_REPLY"},
    {CDocumentOpCode::OP_MSG, "OP_MSG"},
    {CDocumentOpCode::OP_UPDATE, "OP_UPDATE"},
    {CDocumentOpCode::OP_INSERT, "OP_INSERT"},
    {CDocumentOpCode::OP_GET_BY_OID, "OP_GET_BY_OID"},
    {CDocumentOpCode::OP_QUERY, "OP_QUERY"},
    {CDocumentOpCode::OP_GET_MORE, "OP_GET_MORE"},
    {CDocumentOpCode::OP_DELETE, "OP_DELETE"},
    {CDocumentOpCode::OP_KILL_CURSORS, "OP_KILL_CURSORS"},
};

/* Option and flag bits are fixed by the wire format, not by enum order */
struct QueryOptionEntry
{
    CQueryOption option;
    int32_t bit;
};

const QueryOptionEntry kQueryOptionBits[] = {
    {CQueryOption::TailableCursor, 2},
    {CQueryOption::SlaveOK, 4},
    {CQueryOption::OpLogReplay, 8},
    {CQueryOption::NoCursorTimeout, 16},
};

struct UpdateFlagEntry
{
    CUpdateFlag flag;
    int32_t bit;
};

const UpdateFlagEntry kUpdateFlagBits[] = {
    {CUpdateFlag::Upsert, 1 << 0},
    {CUpdateFlag::Multiupdate, 1 << 1},
};

struct ReplyFlagEntry
{
    CReplyFlags flag;
    const char* name;
};

const ReplyFlagEntry kReplyFlagNames[] = {
    {CReplyFlags::CURSOR_NOT_FOUND, "CURSOR_NOT_FOUND"},
    {CReplyFlags::QUERY_FAILURE, "QUERY_FAILURE"},
    {CReplyFlags::SHARD_CONFIG_STALE, "SHARD_CONFIG_STALE"},
    {CReplyFlags::AWAIT_CAPABLE, "AWAIT_CAPABLE"},
};

void putInt32(uint8_t* out, int32_t value)
{
    uint32_t le = BSON_UINT32_TO_LE(static_cast<uint32_t>(value));
    std::memcpy(out, &le, sizeof(le));
}

int32_t getInt32(const uint8_t* in)
{
    uint32_t le;
    std::memcpy(&le, in, sizeof(le));
    return static_cast<int32_t>(BSON_UINT32_FROM_LE(le));
}

void putInt64(uint8_t* out, int64_t value)
{
    uint64_t le = BSON_UINT64_TO_LE(static_cast<uint64_t>(value));
    std::memcpy(out, &le, sizeof(le));
}

int64_t getInt64(const uint8_t* in)
{
    uint64_t le;
    std::memcpy(&le, in, sizeof(le));
    return static_cast<int64_t>(BSON_UINT64_FROM_LE(le));
}

} /* namespace */

/*-------------------------------------------------------------------------
 * Opcode and flag codec
 *-------------------------------------------------------------------------*/

int32_t opcodeToWire(CDocumentOpCode opcode) noexcept
{
    return static_cast<int32_t>(opcode);
}

CDocumentOpCode wireToOpcode(int32_t value)
{
    for (const auto& entry : kOpcodes)
    {
        if (opcodeToWire(entry.opcode) == value)
            return entry.opcode;
    }
    throw CUnknownOpcodeError(value);
}

const char* opcodeName(CDocumentOpCode opcode) noexcept
{
    for (const auto& entry : kOpcodes)
    {
        if (entry.opcode == opcode)
            return entry.name;
    }
    return "OP_UNKNOWN";
}

int32_t queryOptionBit(CQueryOption option) noexcept
{
    for (const auto& entry : kQueryOptionBits)
    {
        if (entry.option == option)
            return entry.bit;
    }
    return 0;
}

int32_t updateFlagBit(CUpdateFlag flag) noexcept
{
    for (const auto& entry : kUpdateFlagBits)
    {
        if (entry.flag == flag)
            return entry.bit;
    }
    return 0;
}

int32_t encodeQueryOptions(const std::vector<CQueryOption>& options) noexcept
{
    int32_t bits = 0;
    for (CQueryOption option : options)
        bits |= queryOptionBit(option);
    return bits;
}

int32_t encodeUpdateFlags(const std::vector<CUpdateFlag>& flags) noexcept
{
    int32_t bits = 0;
    for (CUpdateFlag flag : flags)
        bits |= updateFlagBit(flag);
    return bits;
}

std::string describeReplyFlags(int32_t flags)
{
    std::string result;
    int32_t known = 0;

    for (const auto& entry : kReplyFlagNames)
    {
        int32_t bit = static_cast<int32_t>(entry.flag);
        known |= bit;
        if (flags & bit)
        {
            if (!result.empty())
                result += "|";
            result += entry.name;
        }
    }
    if (flags & ~known)
    {
        if (!result.empty())
            result += "|";
        char unknown[16];
        std::snprintf(unknown, sizeof(unknown), "0x%x",
                      static_cast<unsigned int>(flags & ~known));
        result += unknown;
    }
    return result.empty() ? "NONE" : result;
}

/*-------------------------------------------------------------------------
 * CDocumentMessageHeader implementation
 *-------------------------------------------------------------------------*/

std::vector<uint8_t> CDocumentMessageHeader::serialize() const
{
    std::vector<uint8_t> result(MESSAGE_HEADER_SIZE);

    putInt32(result.data(), messageLength);
    putInt32(result.data() + 4, requestID);
    putInt32(result.data() + 8, responseTo);
    putInt32(result.data() + 12, opCode);

    return result;
}

bool CDocumentMessageHeader::deserialize(const uint8_t* data, size_t size)
{
    if (!data || size != MESSAGE_HEADER_SIZE)
        return false;

    CWireReader reader(data, size);
    return reader.readInt32(messageLength) && reader.readInt32(requestID) &&
           reader.readInt32(responseTo) && reader.readInt32(opCode);
}

/*-------------------------------------------------------------------------
 * CDocumentReplyHeader implementation
 *-------------------------------------------------------------------------*/

std::vector<uint8_t> CDocumentReplyHeader::serialize() const
{
    std::vector<uint8_t> result(REPLY_HEADER_SIZE);

    putInt32(result.data(), responseFlags);
    putInt64(result.data() + 4, cursorID);
    putInt32(result.data() + 12, startingFrom);
    putInt32(result.data() + 16, numberReturned);

    return result;
}

bool CDocumentReplyHeader::deserialize(const uint8_t* data, size_t size)
{
    if (!data || size != REPLY_HEADER_SIZE)
        return false;

    CWireReader reader(data, size);
    return reader.readInt32(responseFlags) && reader.readInt64(cursorID) &&
           reader.readInt32(startingFrom) && reader.readInt32(numberReturned);
}

/*-------------------------------------------------------------------------
 * CWireWriter implementation
 *-------------------------------------------------------------------------*/

void CWireWriter::appendInt32(int32_t value)
{
    size_t at = buffer_.size();
    buffer_.resize(at + sizeof(int32_t));
    putInt32(buffer_.data() + at, value);
}

void CWireWriter::appendInt64(int64_t value)
{
    size_t at = buffer_.size();
    buffer_.resize(at + sizeof(int64_t));
    putInt64(buffer_.data() + at, value);
}

void CWireWriter::appendCString(const std::string& value)
{
    if (value.find('\0') != std::string::npos)
        throw std::invalid_argument("cstring field contains an embedded NUL");

    buffer_.insert(buffer_.end(), value.begin(), value.end());
    buffer_.push_back(0x00); /* Null terminator */
}

void CWireWriter::appendBytes(const uint8_t* data, size_t size)
{
    buffer_.insert(buffer_.end(), data, data + size);
}

void CWireWriter::appendBytes(const std::vector<uint8_t>& data)
{
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void CWireWriter::appendDocument(const CBsonType& document)
{
    const bson_t* handle = document.getBsonHandle();
    if (!handle)
        throw std::invalid_argument("document has no BSON storage");

    appendBytes(bson_get_data(handle), handle->len);
}

std::vector<uint8_t> CWireWriter::release() noexcept
{
    std::vector<uint8_t> out;
    out.swap(buffer_);
    return out;
}

/*-------------------------------------------------------------------------
 * CWireReader implementation
 *-------------------------------------------------------------------------*/

bool CWireReader::readInt32(int32_t& result)
{
    if (remaining() < sizeof(int32_t))
        return false;
    result = getInt32(data_ + offset_);
    offset_ += sizeof(int32_t);
    return true;
}

bool CWireReader::readInt64(int64_t& result)
{
    if (remaining() < sizeof(int64_t))
        return false;
    result = getInt64(data_ + offset_);
    offset_ += sizeof(int64_t);
    return true;
}

bool CWireReader::readCString(std::string& result)
{
    size_t end = offset_;

    while (end < size_ && data_[end] != 0x00)
        end++;
    if (end >= size_)
        return false;

    result.assign(reinterpret_cast<const char*>(data_ + offset_), end - offset_);
    offset_ = end + 1; /* Skip null terminator */
    return true;
}

} /* namespace DocWire */
