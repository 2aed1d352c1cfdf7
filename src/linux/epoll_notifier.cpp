////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.12 Reworked into epoll_notifier.
//      2026.10.18 Atomic descriptor for concurrent close.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/linux/epoll_notifier.hpp"
#include "pfs/iomux/trace.hpp"
#include <pfs/i18n.hpp>
#include <cerrno>
#include <unistd.h>

IOMUX__NAMESPACE_BEGIN

namespace linux_os {

constexpr std::uint32_t const epoll_notifier::DEFAULT_INTEREST;

epoll_notifier::epoll_notifier ()
{
    auto eid = ::epoll_create1(EPOLL_CLOEXEC);

    if (eid < 0) {
        throw error {
              make_error_code(errc::init_error)
            , tr::_("epoll create failure")
            , pfs::system_error_text()
        };
    }

    _eid.store(eid);

    IOMUX__TRACE("epoll", "created: eid={}", eid);
}

epoll_notifier::~epoll_notifier ()
{
    close();
}

int epoll_notifier::native () const noexcept
{
    return _eid.load();
}

bool epoll_notifier::add (native_descriptor fd, std::uint32_t interest, error * perr)
{
    struct epoll_event ev;
    ev.events = interest;
    ev.data.fd = fd;

    auto rc = ::epoll_ctl(_eid.load(), EPOLL_CTL_ADD, fd, & ev);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::registration_error)
            , tr::f_("epoll add descriptor ({}) failure", fd)
            , pfs::system_error_text()
        });

        return false;
    }

    IOMUX__TRACE("epoll", "descriptor added: eid={}, fd={}", _eid.load(), fd);
    return true;
}

bool epoll_notifier::remove (native_descriptor fd, error * perr)
{
    // Non-null event pointer for kernels before 2.6.9
    struct epoll_event ev {};
    auto rc = ::epoll_ctl(_eid.load(), EPOLL_CTL_DEL, fd, & ev);

    if (rc != 0) {
        pfs::throw_or(perr, error {
              make_error_code(errc::registration_error)
            , tr::f_("epoll delete descriptor ({}) failure", fd)
            , pfs::system_error_text()
        });

        return false;
    }

    IOMUX__TRACE("epoll", "descriptor removed: eid={}, fd={}", _eid.load(), fd);
    return true;
}

int epoll_notifier::wait (event_type * events, int maxevents, int timeout_millis)
{
    return ::epoll_wait(_eid.load(), events, maxevents, timeout_millis);
}

void epoll_notifier::close () noexcept
{
    // Only one of concurrent callers gets the descriptor to close
    auto eid = _eid.exchange(-1);

    if (eid >= 0)
        ::close(eid);
}

} // namespace linux_os

IOMUX__NAMESPACE_END
