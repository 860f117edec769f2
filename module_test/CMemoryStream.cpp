/*-------------------------------------------------------------------------
 *
 * CMemoryStream.cpp
 *      In-memory duplex stream for unit tests.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CMemoryStream.hpp"

#include <cstring>
#include <stdexcept>

namespace DocWire
{
namespace Test
{

std::error_code CMemoryStream::writeAll(const uint8_t* data, size_t size)
{
    if (!open_)
        return std::make_error_code(std::errc::not_connected);
    if (throwOnWrite_)
        throw std::runtime_error("memory stream write failure");
    if (writeError_)
        return writeError_;
    ++writeCalls_;
    written_.insert(written_.end(), data, data + size);
    return {};
}

std::error_code CMemoryStream::readExact(uint8_t* data, size_t size)
{
    if (!open_)
        return std::make_error_code(std::errc::not_connected);
    if (throwOnRead_)
        throw std::runtime_error("memory stream read failure");
    if (readError_)
        return readError_;
    if (input_.size() - readOffset_ < size)
    {
        /* Peer went away mid-message */
        readOffset_ = input_.size();
        return std::make_error_code(std::errc::connection_reset);
    }
    if (size > 0)
        std::memcpy(data, input_.data() + readOffset_, size);
    readOffset_ += size;
    return {};
}

void CMemoryStream::close() noexcept
{
    open_ = false;
}

bool CMemoryStream::isOpen() const noexcept
{
    return open_;
}

std::string CMemoryStream::peerName() const
{
    return "memory";
}

void CMemoryStream::feed(const std::vector<uint8_t>& bytes)
{
    input_.insert(input_.end(), bytes.begin(), bytes.end());
}

void putInt32(std::vector<uint8_t>& out, int32_t value)
{
    uint32_t v = static_cast<uint32_t>(value);
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void putInt64(std::vector<uint8_t>& out, int64_t value)
{
    uint64_t v = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

int32_t getInt32(const std::vector<uint8_t>& in, size_t offset)
{
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i)
        v = (v << 8) | in.at(offset + static_cast<size_t>(i));
    return static_cast<int32_t>(v);
}

std::vector<uint8_t> makeReply(int32_t responseTo, int32_t responseFlags,
                               int64_t cursorID,
                               const std::vector<std::vector<uint8_t>>& documents,
                               int32_t opCode)
{
    std::vector<uint8_t> region;
    for (const auto& doc : documents)
        region.insert(region.end(), doc.begin(), doc.end());

    std::vector<uint8_t> out;
    putInt32(out, static_cast<int32_t>(36 + region.size()));
    putInt32(out, 777);
    putInt32(out, responseTo);
    putInt32(out, opCode);
    putInt32(out, responseFlags);
    putInt64(out, cursorID);
    putInt32(out, 0);
    putInt32(out, static_cast<int32_t>(documents.size()));
    out.insert(out.end(), region.begin(), region.end());
    return out;
}

} /* namespace Test */
} /* namespace DocWire */
