////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2023-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2024.05.14 Renamed to tcp_listener.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/iomux/error.hpp>
#include <pfs/iomux/exports.hpp>
#include <pfs/iomux/posix/tcp_socket.hpp>

IOMUX__NAMESPACE_BEGIN

namespace posix {

/**
 * POSIX Inet TCP listener
 */
class tcp_listener: public inet_socket
{
public:
    /**
     * Constructs invalid (uninitialized) TCP listener.
     */
    IOMUX__EXPORT tcp_listener ();

    /**
     * Constructs POSIX TCP listener to be bound to @a saddr.
     * Port @c 0 selects an ephemeral port, see saddr() after listen().
     */
    IOMUX__EXPORT tcp_listener (socket4_addr const & saddr, error * perr = nullptr);

public:
    /**
     * Bind the socket to address and listen for connections on a socket.
     *
     * @param backlog The maximum length to which the queue of pending connections may grow.
     */
    IOMUX__EXPORT bool listen (int backlog, error * perr = nullptr);

    /**
     * Accepts a connection. Accepted socket is non-blocking.
     *
     * @return Invalid socket if there is no pending connection or on error.
     */
    IOMUX__EXPORT tcp_socket accept (error * perr = nullptr);
};

} // namespace posix

IOMUX__NAMESPACE_END
