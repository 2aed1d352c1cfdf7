////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.13 Stream sockets only.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/posix/inet_socket.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <cerrno>
#include <cstring>
#include <utility>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

IOMUX__NAMESPACE_BEGIN

namespace posix {

constexpr inet_socket::native_type inet_socket::kINVALID_SOCKET;

inet_socket::inet_socket () = default;

inet_socket::inet_socket (native_type sock, socket4_addr const & saddr)
    : _socket(sock)
    , _saddr(saddr)
{}

inet_socket::inet_socket (inet_socket && other) noexcept
    : _socket(other._socket)
    , _saddr(other._saddr)
{
    other._socket = kINVALID_SOCKET;
}

inet_socket & inet_socket::operator = (inet_socket && other) noexcept
{
    if (this != & other) {
        close();
        _socket = other._socket;
        _saddr  = other._saddr;
        other._socket = kINVALID_SOCKET;
    }

    return *this;
}

inet_socket::~inet_socket ()
{
    close();
}

static bool enable_option (inet_socket::native_type sock, int optname, error * perr)
{
    int yes = 1;

    if (::setsockopt(sock, SOL_SOCKET, optname, & yes, sizeof(yes)) == 0)
        return true;

    pfs::throw_or(perr, error {
          make_error_code(errc::socket_error)
        , tr::f_("set socket option failure: {}", optname)
        , pfs::system_error_text()
    });

    return false;
}

bool inet_socket::open_stream (error * perr)
{
    if (_socket != kINVALID_SOCKET)
        return true;

    auto sock = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);

    if (sock < 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::_("create stream socket failure")
            , pfs::system_error_text()
        });

        return false;
    }

    // Descriptor is owned from here, close() releases it on option failure
    _socket = sock;

    if (!enable_option(_socket, SO_REUSEADDR, perr) || !enable_option(_socket, SO_KEEPALIVE, perr)) {
        close();
        return false;
    }

    return true;
}

sockaddr_in inet_socket::to_sockaddr (socket4_addr const & saddr) noexcept
{
    sockaddr_in sa;

    std::memset(& sa, 0, sizeof(sa));

    sa.sin_family      = AF_INET;
    sa.sin_port        = pfs::to_network_order(saddr.port);
    sa.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    return sa;
}

socket4_addr inet_socket::from_sockaddr (sockaddr_in const & sa) noexcept
{
    auto addr = pfs::to_native_order(static_cast<std::uint32_t>(sa.sin_addr.s_addr));
    auto port = pfs::to_native_order(static_cast<std::uint16_t>(sa.sin_port));

    return socket4_addr{inet4_addr{addr}, port};
}

bool inet_socket::bind (native_type sock, socket4_addr const & saddr, error * perr)
{
    auto sa = to_sockaddr(saddr);

    if (::bind(sock, reinterpret_cast<sockaddr *>(& sa), sizeof(sa)) != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::socket_error)
            , tr::f_("bind name to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        });

        return false;
    }

    return true;
}

inet_socket::operator bool () const noexcept
{
    return _socket != kINVALID_SOCKET;
}

inet_socket::native_type inet_socket::native () const noexcept
{
    return _socket;
}

socket4_addr inet_socket::saddr () const noexcept
{
    return _saddr;
}

std::streamsize inet_socket::recv (char * data, std::streamsize len, error * perr)
{
    auto n = ::recv(_socket, data, static_cast<std::size_t>(len), MSG_DONTWAIT);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            n = 0;
        } else {
            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::_("receive data failure")
                , pfs::system_error_text()
            });

            return -1;
        }
    }

    return static_cast<std::streamsize>(n);
}

std::streamsize inet_socket::send (char const * data, std::streamsize len, error * perr)
{
    std::streamsize total_sent = 0;

    while (len > 0) {
        // No SIGPIPE on broken connection, EPIPE is reported instead
        auto n = ::send(_socket, data + total_sent, static_cast<std::size_t>(len)
            , MSG_NOSIGNAL | MSG_DONTWAIT);

        if (n < 0) {
            if (errno == EINTR)
                continue;

            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;

            pfs::throw_or(perr, error {
                  make_error_code(errc::socket_error)
                , tr::_("send failure")
                , pfs::system_error_text()
            });

            return -1;
        }

        total_sent += n;
        len -= n;
    }

    return total_sent;
}

void inet_socket::close () noexcept
{
    if (_socket != kINVALID_SOCKET) {
        ::close(_socket);
        _socket = kINVALID_SOCKET;
    }
}

} // namespace posix

IOMUX__NAMESPACE_END
