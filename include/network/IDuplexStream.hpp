/*-------------------------------------------------------------------------
 *
 * IDuplexStream.hpp
 *      Connected, blocking, bidirectional byte stream.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace DocWire
{

class IDuplexStream
{
  public:
    virtual ~IDuplexStream() = default;

    /* Write all size bytes or fail */
    virtual std::error_code writeAll(const uint8_t* data, size_t size) = 0;

    /* Block until exactly size bytes were read or fail */
    virtual std::error_code readExact(uint8_t* data, size_t size) = 0;

    virtual void close() noexcept = 0;
    virtual bool isOpen() const noexcept = 0;

    /* "host:port" or another human-readable description of the peer */
    virtual std::string peerName() const = 0;
};

} /* namespace DocWire */
