////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.13 Stream sockets only, native() is the descriptor accessor.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/iomux/descriptor_accessor.hpp>
#include <pfs/iomux/error.hpp>
#include <pfs/iomux/exports.hpp>
#include <pfs/iomux/namespace.hpp>
#include <pfs/iomux/socket4_addr.hpp>
#include <ios>
#include <netinet/in.h>

IOMUX__NAMESPACE_BEGIN

namespace posix {

/**
 * Non-blocking IPv4 stream socket, base for listener and connection sockets.
 */
class inet_socket
{
public:
    using native_type = native_descriptor;
    static native_type constexpr kINVALID_SOCKET = kINVALID_DESCRIPTOR;

protected:
    native_type _socket { kINVALID_SOCKET };

    // Bound address for listener.
    // Server address for connected socket.
    // Peer address for accepted socket.
    socket4_addr _saddr;

protected:
    /**
     * Constructs invalid POSIX socket
     */
    inet_socket ();

    /**
     * Constructs POSIX socket from native socket.
     */
    inet_socket (native_type sock, socket4_addr const & saddr);

    inet_socket (inet_socket const &) = delete;
    inet_socket & operator = (inet_socket const &) = delete;

    IOMUX__EXPORT ~inet_socket ();

    IOMUX__EXPORT inet_socket (inet_socket &&) noexcept;
    IOMUX__EXPORT inet_socket & operator = (inet_socket &&) noexcept;

protected:
    /**
     * Creates non-blocking close-on-exec stream socket if not created yet.
     */
    bool open_stream (error * perr);

    static bool bind (native_type sock, socket4_addr const & saddr, error * perr);

    static sockaddr_in to_sockaddr (socket4_addr const & saddr) noexcept;
    static socket4_addr from_sockaddr (sockaddr_in const & sa) noexcept;

public:
    /**
     *  Checks if socket is valid
     */
    IOMUX__EXPORT operator bool () const noexcept;

    /**
     * Raw descriptor of the socket or @c kINVALID_SOCKET if socket is invalid.
     */
    IOMUX__EXPORT native_type native () const noexcept;

    IOMUX__EXPORT socket4_addr saddr () const noexcept;

    /**
     * Receives at most @a len bytes into @a data without blocking.
     *
     * @return Number of bytes received, @c 0 if there is no data available
     *         or peer performed an orderly shutdown, @c -1 on error.
     */
    IOMUX__EXPORT std::streamsize recv (char * data, std::streamsize len, error * perr = nullptr);

    /**
     * Sends @a data message with @a len bytes without blocking.
     *
     * @return Number of bytes sent (may be less than @a len if the send buffer
     *         is full) or @c -1 on error.
     */
    IOMUX__EXPORT std::streamsize send (char const * data, std::streamsize len, error * perr = nullptr);

    /**
     * Closes the native socket. Socket becomes invalid.
     */
    IOMUX__EXPORT void close () noexcept;
};

} // namespace posix

IOMUX__NAMESPACE_END
