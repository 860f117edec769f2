/*-------------------------------------------------------------------------
 *
 * CMemoryStream.hpp
 *      In-memory duplex stream for unit tests: records every write and
 *      serves reads from a scripted input buffer.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "network/IDuplexStream.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace DocWire
{
namespace Test
{

class CMemoryStream : public IDuplexStream
{
  public:
    CMemoryStream()
        : open_(true), readOffset_(0), writeCalls_(0), throwOnWrite_(false),
          throwOnRead_(false)
    {
    }

    std::error_code writeAll(const uint8_t* data, size_t size) override;
    std::error_code readExact(uint8_t* data, size_t size) override;
    void close() noexcept override;
    bool isOpen() const noexcept override;
    std::string peerName() const override;

    /* Append bytes the next reads will return */
    void feed(const std::vector<uint8_t>& bytes);

    /* Fail every following write or read with code */
    void failWrites(std::error_code code)
    {
        writeError_ = code;
    }
    void failReads(std::error_code code)
    {
        readError_ = code;
    }

    /* Throw std::runtime_error from every following write or read */
    void throwOnWrite(bool enable)
    {
        throwOnWrite_ = enable;
    }
    void throwOnRead(bool enable)
    {
        throwOnRead_ = enable;
    }

    const std::vector<uint8_t>& written() const noexcept
    {
        return written_;
    }
    size_t writeCalls() const noexcept
    {
        return writeCalls_;
    }
    size_t unread() const noexcept
    {
        return input_.size() - readOffset_;
    }

  private:
    bool open_;
    std::vector<uint8_t> input_;
    size_t readOffset_;
    std::vector<uint8_t> written_;
    size_t writeCalls_;
    std::error_code writeError_;
    std::error_code readError_;
    bool throwOnWrite_;
    bool throwOnRead_;
};

/* Little-endian field helpers for building expected and scripted bytes */
void putInt32(std::vector<uint8_t>& out, int32_t value);
void putInt64(std::vector<uint8_t>& out, int64_t value);
int32_t getInt32(const std::vector<uint8_t>& in, size_t offset);

/* A complete OP_REPLY envelope with the given documents */
std::vector<uint8_t> makeReply(int32_t responseTo, int32_t responseFlags,
                               int64_t cursorID,
                               const std::vector<std::vector<uint8_t>>& documents,
                               int32_t opCode = 1);

} /* namespace Test */
} /* namespace DocWire */
