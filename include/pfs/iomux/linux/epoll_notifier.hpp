////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
//      2026.10.12 Reworked into epoll_notifier: strict registration,
//                 single-shot wait.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/iomux/descriptor_accessor.hpp>
#include <pfs/iomux/error.hpp>
#include <pfs/iomux/exports.hpp>
#include <pfs/iomux/namespace.hpp>
#include <atomic>
#include <cstdint>
#include <sys/epoll.h>

IOMUX__NAMESPACE_BEGIN

namespace linux_os {

/**
 * Owner of the kernel epoll instance.
 */
class epoll_notifier
{
public:
    using event_type = epoll_event;

    // Level-triggered "input ready" and "peer hangup" interest
    static constexpr std::uint32_t const DEFAULT_INTEREST = EPOLLIN | EPOLLHUP;

private:
    std::atomic<int> _eid {-1};

public:
    /**
     * Creates epoll instance.
     *
     * @throws iomux::error with errc::init_error on failure.
     */
    IOMUX__EXPORT epoll_notifier ();
    IOMUX__EXPORT ~epoll_notifier ();

    epoll_notifier (epoll_notifier const &) = delete;
    epoll_notifier & operator = (epoll_notifier const &) = delete;
    epoll_notifier (epoll_notifier &&) = delete;
    epoll_notifier & operator = (epoll_notifier &&) = delete;

public:
    IOMUX__EXPORT int native () const noexcept;

    /**
     * Registers @a fd with the @a interest events mask.
     * Already registered descriptor is a failure (errc::registration_error).
     */
    IOMUX__EXPORT bool add (native_descriptor fd, std::uint32_t interest = DEFAULT_INTEREST
        , error * perr = nullptr);

    /**
     * Deregisters @a fd. Unknown descriptor is a failure (errc::registration_error).
     */
    IOMUX__EXPORT bool remove (native_descriptor fd, error * perr = nullptr);

    /**
     * Single epoll_wait(2) call, no retry on EINTR.
     *
     * @return Number of ready events stored in @a events or -1 with @c errno set.
     */
    IOMUX__EXPORT int wait (event_type * events, int maxevents, int timeout_millis);

    /**
     * Closes epoll instance. Subsequent calls fail with EBADF.
     *
     * Does not wake a thread already blocked in wait(): stop waiters before
     * closing.
     */
    IOMUX__EXPORT void close () noexcept;

    static native_descriptor descriptor (event_type const & ev) noexcept
    {
        return ev.data.fd;
    }
};

} // namespace linux_os

IOMUX__NAMESPACE_END
