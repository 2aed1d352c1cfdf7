////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.13 Ephemeral port support, non-blocking accepted sockets.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/posix/tcp_listener.hpp"
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>

IOMUX__NAMESPACE_BEGIN

namespace posix {

tcp_listener::tcp_listener () : inet_socket() {}

tcp_listener::tcp_listener (socket4_addr const & saddr, error * perr)
    : inet_socket()
{
    if (!open_stream(perr))
        return;

    _saddr = saddr;
}

bool tcp_listener::listen (int backlog, error * perr)
{
    if (!bind(_socket, _saddr, perr))
        return false;

    auto rc = ::listen(_socket, backlog);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("listen failure: {}", to_string(_saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    // Resolve ephemeral port
    if (_saddr.port == 0) {
        sockaddr_in sa;
        socklen_t addrlen = sizeof(sa);

        std::memset(& sa, 0, sizeof(sa));

        rc = ::getsockname(_socket, reinterpret_cast<sockaddr *>(& sa), & addrlen);

        if (rc != 0) {
            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::_("get socket name failure")
                , pfs::system_error_text()
            });

            return false;
        }

        _saddr.port = from_sockaddr(sa).port;
    }

    return true;
}

tcp_socket tcp_listener::accept (error * perr)
{
    sockaddr_in sa;
    socklen_t addrlen = sizeof(sa);

    auto sock = ::accept4(_socket, reinterpret_cast<sockaddr *>(& sa), & addrlen
        , SOCK_NONBLOCK | SOCK_CLOEXEC);

    if (sock >= 0)
        return tcp_socket{sock, from_sockaddr(sa)};

    // No pending connections
    if (errno == EAGAIN || errno == EWOULDBLOCK)
        return tcp_socket{};

    pfs::throw_or(perr, error {
          make_error_code(errc::socket_error)
        , tr::_("socket accept failure")
        , pfs::system_error_text()
    });

    return tcp_socket{};
}

} // namespace posix

IOMUX__NAMESPACE_END
