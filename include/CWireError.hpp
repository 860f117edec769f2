/*-------------------------------------------------------------------------
 *
 * CWireError.hpp
 *      Exceptions raised by the DocWire client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace DocWire
{

enum class CWireErrorKind : uint8_t
{
    Transport = 0,        /* stream unreadable/unwritable, connect failed */
    UnexpectedOpcode = 1, /* reply header opcode is not OP_REPLY */
    ResponseToMismatch = 2,
    ResponseFlags = 3,    /* nonzero responseFlags in the reply block */
    MessageLength = 4,    /* declared length shorter than the fixed blocks */
    DocumentRegion = 5,   /* trailing bytes do not hold numberReturned docs */
    UnknownOpcode = 6
};

const char* wireErrorKindName(CWireErrorKind kind) noexcept;

/**
 * Base of every error raised by the wire layer. After any of these the
 * connection's stream position is unknown and the connection is unusable.
 */
class CWireError : public std::runtime_error
{
  public:
    CWireError(CWireErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind)
    {
    }

    CWireErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    CWireErrorKind kind_;
};

class CTransportError : public CWireError
{
  public:
    CTransportError(const std::string& what, std::error_code code)
        : CWireError(CWireErrorKind::Transport,
                     what + ": " + code.message()),
          code_(code)
    {
    }

    std::error_code code() const noexcept
    {
        return code_;
    }

  private:
    std::error_code code_;
};

/**
 * Structural violation of a reply. Carries the violated check together
 * with the expected and observed values.
 */
class CProtocolError : public CWireError
{
  public:
    CProtocolError(CWireErrorKind kind, int64_t expected, int64_t observed,
                   const std::string& detail = "");

    int64_t expected() const noexcept
    {
        return expected_;
    }
    int64_t observed() const noexcept
    {
        return observed_;
    }

  private:
    int64_t expected_;
    int64_t observed_;
};

class CUnknownOpcodeError : public CWireError
{
  public:
    explicit CUnknownOpcodeError(int32_t value)
        : CWireError(CWireErrorKind::UnknownOpcode,
                     "unrecognized opcode " + std::to_string(value)),
          value_(value)
    {
    }

    int32_t value() const noexcept
    {
        return value_;
    }

  private:
    int32_t value_;
};

} /* namespace DocWire */
