/*-------------------------------------------------------------------------
 *
 * CConnection.hpp
 *      Client session over one duplex byte stream.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CClientConfig.hpp"
#include "../CLogger.hpp"
#include "../network/IDuplexStream.hpp"
#include "../protocol/CDocumentWireProtocol.hpp"
#include "../protocol/CReplyParser.hpp"
#include "../protocol/CRequestIdGenerator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DocWire
{

/**
 * Owns the stream and the request-id sequence for its lifetime.
 *
 * A connection serves one caller thread and has at most one query in
 * flight: replies are read off the stream in order and must answer the
 * request just sent. Sharing a connection between threads needs
 * external locking around each send/receive pair.
 *
 * Any transport or protocol error leaves the stream position unknown;
 * the connection then refuses further traffic and must be replaced.
 */
class CConnection
{
  public:
    /* Throws CTransportError when the server cannot be reached */
    static CConnection connect(const std::string& host,
                               std::shared_ptr<CLogger> logger = nullptr);
    static CConnection connectOnPort(const std::string& host, uint16_t port,
                                     std::shared_ptr<CLogger> logger = nullptr);
    static CConnection connect(const CClientConfig& config,
                               std::shared_ptr<CLogger> logger = nullptr);

    /* Adopt a connected stream; seed fixes the request-id sequence */
    explicit CConnection(std::unique_ptr<IDuplexStream> stream,
                         std::shared_ptr<CLogger> logger = nullptr,
                         std::optional<uint64_t> seed = std::nullopt);
    ~CConnection();

    CConnection(const CConnection&) = delete;
    CConnection& operator=(const CConnection&) = delete;
    CConnection(CConnection&&) noexcept;
    CConnection& operator=(CConnection&&) noexcept;

    /*
     * Frame body under a fresh request id and write the envelope in one
     * stream write. Returns the request id.
     */
    int32_t sendMessage(CDocumentOpCode opcode, const std::vector<uint8_t>& body);

    /* Block for the OP_REPLY answering requestID */
    CDocumentReply receiveReply(int32_t requestID);

    void close() noexcept;
    bool isOpen() const noexcept;
    bool isBroken() const noexcept
    {
        return broken_;
    }
    std::string peerName() const;

  private:
    void ensureUsable() const;

    std::unique_ptr<IDuplexStream> stream_;
    CRequestIdGenerator idGenerator_;
    std::shared_ptr<CLogger> logger_;
    bool broken_;
};

} /* namespace DocWire */
