////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/iomux/conn_status.hpp>
#include <pfs/iomux/posix/inet_socket.hpp>

IOMUX__NAMESPACE_BEGIN

namespace posix {

class tcp_listener;

/**
 * POSIX Inet TCP socket
 */
class tcp_socket: public inet_socket
{
    friend class tcp_listener;

protected:
    /**
     * Constructs POSIX TCP accepted socket.
     */
    tcp_socket (native_type sock, socket4_addr const & saddr);

public:
    tcp_socket (tcp_socket const & s) = delete;
    tcp_socket & operator = (tcp_socket const & s) = delete;

    /**
     * Constructs uninitialized (invalid) TCP socket.
     */
    IOMUX__EXPORT tcp_socket ();

    IOMUX__EXPORT tcp_socket (tcp_socket && s) noexcept;
    IOMUX__EXPORT tcp_socket & operator = (tcp_socket && s) noexcept;
    IOMUX__EXPORT ~tcp_socket ();

    /**
     * Connects to the TCP server @a remote_saddr.
     *
     * @return @c conn_status::failure if error occurred while connecting,
     *         @c conn_status::unreachable if network is down or unreachable,
     *         @c conn_status::connected if connection established successfully or
     *         @c conn_status::connecting if connection in progress.
     */
    IOMUX__EXPORT conn_status connect (socket4_addr const & remote_saddr, error * perr = nullptr);

    /**
     * Shutdown connection.
     */
    IOMUX__EXPORT void disconnect (error * perr = nullptr);
};

} // namespace posix

IOMUX__NAMESPACE_END
