/*-------------------------------------------------------------------------
 *
 * CWireError.cpp
 *      Exceptions raised by the DocWire client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CWireError.hpp"

namespace DocWire
{

const char* wireErrorKindName(CWireErrorKind kind) noexcept
{
    switch (kind)
    {
    case CWireErrorKind::Transport:
        return "transport";
    case CWireErrorKind::UnexpectedOpcode:
        return "unexpected opcode";
    case CWireErrorKind::ResponseToMismatch:
        return "responseTo mismatch";
    case CWireErrorKind::ResponseFlags:
        return "nonzero response flags";
    case CWireErrorKind::MessageLength:
        return "bad message length";
    case CWireErrorKind::DocumentRegion:
        return "malformed document region";
    case CWireErrorKind::UnknownOpcode:
        return "unknown opcode";
    }
    return "unknown";
}

CProtocolError::CProtocolError(CWireErrorKind kind, int64_t expected,
                               int64_t observed, const std::string& detail)
    : CWireError(kind, std::string("protocol violation (") +
                           wireErrorKindName(kind) + "): expected " +
                           std::to_string(expected) + ", observed " +
                           std::to_string(observed) +
                           (detail.empty() ? "" : " - " + detail)),
      expected_(expected), observed_(observed)
{
}

} /* namespace DocWire */
