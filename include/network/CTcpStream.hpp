/*-------------------------------------------------------------------------
 *
 * CTcpStream.hpp
 *      TCP client stream for DocWire.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CLogger.hpp"
#include "IDuplexStream.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace DocWire
{

class CTcpStream : public IDuplexStream
{
  public:
    /*
     * Resolve host and connect to the first address that accepts.
     * Returns nullptr and sets ec on failure.
     */
    static std::unique_ptr<CTcpStream>
    connect(const std::string& host, uint16_t port, std::error_code& ec,
            std::shared_ptr<CLogger> logger = nullptr, bool noDelay = true);

    ~CTcpStream() override;

    CTcpStream(const CTcpStream&) = delete;
    CTcpStream& operator=(const CTcpStream&) = delete;

    std::error_code writeAll(const uint8_t* data, size_t size) override;
    std::error_code readExact(uint8_t* data, size_t size) override;
    void close() noexcept override;
    bool isOpen() const noexcept override;
    std::string peerName() const override;

    int nativeHandle() const noexcept
    {
        return socket_;
    }

  private:
    /* Limits construction to connect() while allowing make_unique */
    struct ConnectedTag
    {
        explicit ConnectedTag() = default;
    };

  public:
    CTcpStream(ConnectedTag, int socket, std::string peer,
               std::shared_ptr<CLogger> logger);

  private:
    int socket_;
    std::string peer_;
    std::shared_ptr<CLogger> logger_;
};

} /* namespace DocWire */
