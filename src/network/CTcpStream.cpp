/*-------------------------------------------------------------------------
 *
 * CTcpStream.cpp
 *      TCP client stream for DocWire.
 *      Part of the DocWire document database client.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "network/CTcpStream.hpp"

#include "CLogMacros.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std;

namespace DocWire
{

namespace
{

/* Map getaddrinfo failures onto portable error codes */
error_code resolveError(int gaiError)
{
    switch (gaiError)
    {
    case EAI_NONAME:
#ifdef EAI_NODATA
#if EAI_NODATA != EAI_NONAME
    case EAI_NODATA:
#endif
#endif
        return make_error_code(errc::host_unreachable);
    case EAI_AGAIN:
        return make_error_code(errc::resource_unavailable_try_again);
    case EAI_MEMORY:
        return make_error_code(errc::not_enough_memory);
    case EAI_SYSTEM:
        return error_code(errno, system_category());
    default:
        return make_error_code(errc::address_not_available);
    }
}

} /* namespace */

CTcpStream::CTcpStream(ConnectedTag, int socket, std::string peer,
                       std::shared_ptr<CLogger> logger)
    : socket_(socket), peer_(std::move(peer)), logger_(std::move(logger))
{
}

CTcpStream::~CTcpStream()
{
    close();
}

std::unique_ptr<CTcpStream>
CTcpStream::connect(const std::string& host, uint16_t port, std::error_code& ec,
                    std::shared_ptr<CLogger> logger, bool noDelay)
{
    addrinfo hints{};
    addrinfo* results = nullptr;
    string peer = host + ":" + to_string(port);
    int rc;

    ec.clear();
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    rc = getaddrinfo(host.c_str(), to_string(port).c_str(), &hints, &results);
    if (rc != 0)
    {
        ec = resolveError(rc);
        if (logger)
            logger->log(CLogLevel::ERROR, "Cannot resolve '" + host +
                                              "': " + gai_strerror(rc) + ".");
        return nullptr;
    }

    int fd = -1;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next)
    {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == -1)
        {
            ec = error_code(errno, system_category());
            continue;
        }

        int crc;
        do
        {
            crc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        } while (crc == -1 && errno == EINTR);

        if (crc == 0)
        {
            ec.clear();
            break;
        }

        ec = error_code(errno, system_category());
        if (logger)
            logger->log(CLogLevel::DEBUG, "Connect attempt to " + peer +
                                              " failed: " + ec.message() + ".");
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd == -1)
    {
        if (!ec)
            ec = make_error_code(errc::host_unreachable);
        if (logger)
            logger->log(CLogLevel::ERROR, "Failed to connect to " + peer +
                                              ": " + ec.message() + ".");
        return nullptr;
    }

    if (noDelay)
    {
        int opt = 1;
        if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0 &&
            logger)
            logger->log(CLogLevel::WARN,
                        std::string("Failed to set TCP_NODELAY: ") +
                            strerror(errno) + ".");
    }

    if (logger)
        logger->log(CLogLevel::INFO, "Connected to " + peer + ".");
    return std::make_unique<CTcpStream>(ConnectedTag{}, fd, peer, logger);
}

std::error_code CTcpStream::writeAll(const uint8_t* data, size_t size)
{
    size_t totalSent = 0;

    if (socket_ == -1)
        return make_error_code(errc::not_connected);

    while (totalSent < size)
    {
        ssize_t sent =
            ::send(socket_, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sent < 0)
        {
            if (errno == EINTR)
                continue;
            error_code ec(errno, system_category());
            error_log("Send to " + peer_ + " failed: " + ec.message() + ".");
            return ec;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return error_code{};
}

std::error_code CTcpStream::readExact(uint8_t* data, size_t size)
{
    size_t totalRead = 0;

    if (socket_ == -1)
        return make_error_code(errc::not_connected);

    while (totalRead < size)
    {
        ssize_t bytesRead = ::recv(socket_, data + totalRead, size - totalRead, 0);
        if (bytesRead == 0)
        {
            error_log("Connection closed by " + peer_ + " after " +
                      to_string(totalRead) + " of " + to_string(size) +
                      " bytes.");
            return make_error_code(errc::connection_reset);
        }
        if (bytesRead < 0)
        {
            if (errno == EINTR)
                continue;
            error_code ec(errno, system_category());
            error_log("Receive from " + peer_ + " failed: " + ec.message() + ".");
            return ec;
        }
        totalRead += static_cast<size_t>(bytesRead);
    }
    return error_code{};
}

void CTcpStream::close() noexcept
{
    if (socket_ == -1)
        return;
    ::shutdown(socket_, SHUT_RDWR);
    ::close(socket_);
    socket_ = -1;
}

bool CTcpStream::isOpen() const noexcept
{
    return socket_ != -1;
}

std::string CTcpStream::peerName() const
{
    return peer_;
}

} /* namespace DocWire */
