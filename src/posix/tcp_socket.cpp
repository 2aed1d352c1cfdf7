////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/posix/tcp_socket.hpp"
#include <pfs/i18n.hpp>
#include <cerrno>
#include <utility>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

IOMUX__NAMESPACE_BEGIN

namespace posix {

tcp_socket::tcp_socket () : inet_socket() {}

// Accepted socket
tcp_socket::tcp_socket (native_type sock, socket4_addr const & saddr)
    : inet_socket(sock, saddr)
{}

tcp_socket::tcp_socket (tcp_socket && other) noexcept
    : inet_socket(std::move(other))
{}

tcp_socket & tcp_socket::operator = (tcp_socket && other) noexcept
{
    inet_socket::operator = (std::move(other));
    return *this;
}

tcp_socket::~tcp_socket () = default;

conn_status tcp_socket::connect (socket4_addr const & remote_saddr, error * perr)
{
    if (!open_stream(perr))
        return conn_status::failure;

    _saddr = remote_saddr;

    auto sa = to_sockaddr(remote_saddr);
    auto rc = ::connect(_socket, reinterpret_cast<sockaddr *>(& sa), sizeof(sa));

    if (rc == 0)
        return conn_status::connected;

    if (errno == EINPROGRESS || errno == EWOULDBLOCK)
        return conn_status::connecting;

    if (errno == ENETUNREACH || errno == ENETDOWN)
        return conn_status::unreachable;

    pfs::throw_or(perr, error {
          make_error_code(errc::socket_error)
        , tr::f_("connect failure: {}", to_string(remote_saddr))
        , pfs::system_error_text()
    });

    return conn_status::failure;
}

void tcp_socket::disconnect (error * perr)
{
    if (_socket == kINVALID_SOCKET)
        return;

    if (::shutdown(_socket, SHUT_RDWR) == 0)
        return;

    // Peer already gone
    if (errno == ENOTCONN || errno == ECONNRESET)
        return;

    pfs::throw_or(perr, error {
          make_error_code(errc::socket_error)
        , tr::_("shutdown failure")
        , pfs::system_error_text()
    });
}

} // namespace posix

IOMUX__NAMESPACE_END
