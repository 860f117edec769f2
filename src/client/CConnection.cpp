/*-------------------------------------------------------------------------
 *
 * CConnection.cpp
 *      Client session over one duplex byte stream.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "client/CConnection.hpp"

#include "CLogMacros.hpp"
#include "CWireError.hpp"
#include "network/CTcpStream.hpp"
#include "protocol/CMessageBuilder.hpp"

#include <utility>

using namespace std;

namespace DocWire
{

CConnection CConnection::connect(const std::string& host,
                                 std::shared_ptr<CLogger> logger)
{
    return connectOnPort(host, DEFAULT_SERVER_PORT, std::move(logger));
}

CConnection CConnection::connectOnPort(const std::string& host, uint16_t port,
                                       std::shared_ptr<CLogger> logger)
{
    error_code ec;
    auto stream = CTcpStream::connect(host, port, ec, logger);
    if (!stream)
        throw CTransportError("connecting to " + host + ":" + to_string(port),
                              ec);
    return CConnection(std::move(stream), std::move(logger));
}

CConnection CConnection::connect(const CClientConfig& config,
                                 std::shared_ptr<CLogger> logger)
{
    error_code ec;
    auto stream =
        CTcpStream::connect(config.host, config.port, ec, logger, config.tcpNoDelay);
    if (!stream)
        throw CTransportError("connecting to " + config.host + ":" +
                                  to_string(config.port),
                              ec);
    return CConnection(std::move(stream), std::move(logger));
}

CConnection::CConnection(std::unique_ptr<IDuplexStream> stream,
                         std::shared_ptr<CLogger> logger,
                         std::optional<uint64_t> seed)
    : stream_(std::move(stream)),
      idGenerator_(seed ? CRequestIdGenerator(*seed) : CRequestIdGenerator()),
      logger_(std::move(logger)), broken_(false)
{
    if (!stream_)
        throw CTransportError("creating connection",
                              make_error_code(errc::not_connected));
}

CConnection::~CConnection()
{
    close();
}

CConnection::CConnection(CConnection&& other) noexcept
    : stream_(std::move(other.stream_)),
      idGenerator_(std::move(other.idGenerator_)),
      logger_(std::move(other.logger_)), broken_(other.broken_)
{
}

CConnection& CConnection::operator=(CConnection&& other) noexcept
{
    if (this != &other)
    {
        close();
        stream_ = std::move(other.stream_);
        idGenerator_ = std::move(other.idGenerator_);
        logger_ = std::move(other.logger_);
        broken_ = other.broken_;
    }
    return *this;
}

void CConnection::ensureUsable() const
{
    if (!stream_ || !stream_->isOpen())
        throw CTransportError("using closed connection",
                              make_error_code(errc::not_connected));
    if (broken_)
        throw CTransportError("using connection after a wire error",
                              make_error_code(errc::not_connected));
}

int32_t CConnection::sendMessage(CDocumentOpCode opcode,
                                 const std::vector<uint8_t>& body)
{
    ensureUsable();

    int32_t requestID = idGenerator_.next();
    vector<uint8_t> message = CMessageBuilder::packMessage(opcode, requestID, body);

    error_code ec;
    try
    {
        ec = stream_->writeAll(message.data(), message.size());
    }
    catch (...)
    {
        /* Part of the envelope may already be on the wire */
        broken_ = true;
        throw;
    }
    if (ec)
    {
        broken_ = true;
        throw CTransportError(string("sending ") + opcodeName(opcode), ec);
    }

    debug_log(string("Sent ") + opcodeName(opcode) + " requestID=" +
              to_string(requestID) + " length=" + to_string(message.size()) +
              " to " + stream_->peerName() + ".");
    return requestID;
}

CDocumentReply CConnection::receiveReply(int32_t requestID)
{
    ensureUsable();

    CReplyParser parser(requestID);
    try
    {
        CDocumentReply reply = parser.readReply(*stream_);
        debug_log("Received OP_REPLY responseTo=" + to_string(requestID) +
                  " numberReturned=" + to_string(reply.reply.numberReturned) +
                  " cursorID=" + to_string(reply.reply.cursorID) + ".");
        return reply;
    }
    catch (const CWireError& e)
    {
        broken_ = true;
        error_log(string("Reply for requestID=") + to_string(requestID) +
                  " failed in " + replyStateName(parser.state()) + ": " +
                  e.what());
        throw;
    }
    catch (...)
    {
        /* The stream sits somewhere inside a reply */
        broken_ = true;
        throw;
    }
}

void CConnection::close() noexcept
{
    if (stream_)
        stream_->close();
}

bool CConnection::isOpen() const noexcept
{
    return stream_ && stream_->isOpen();
}

std::string CConnection::peerName() const
{
    return stream_ ? stream_->peerName() : std::string();
}

} /* namespace DocWire */
