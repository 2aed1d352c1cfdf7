////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
//      2026.10.14 Added wait with timeout.
//      2026.10.18 Table type is a template parameter.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "callback.hpp"
#include "descriptor_accessor.hpp"
#include "descriptor_table.hpp"
#include "error.hpp"
#include "multiplexer_options.hpp"
#include "namespace.hpp"
#include "trace.hpp"
#include <pfs/i18n.hpp>
#include <chrono>
#include <cerrno>
#include <cstddef>
#include <limits>
#include <vector>

#if IOMUX__EPOLL_ENABLED
#   include "linux/epoll_notifier.hpp"
#endif

IOMUX__NAMESPACE_BEGIN

/**
 * Readiness multiplexer: translates kernel readiness events for registered
 * descriptors back into connection handles.
 *
 * Connections are referenced, not owned. A connection must stay valid until
 * the matching remove() completes and must be removed before it is closed.
 *
 * The blocking wait runs outside the table lock, so add() and remove() may
 * proceed from other threads while wait() is blocked in the kernel.
 */
template <typename Connection
#if IOMUX__EPOLL_ENABLED
    , typename Notifier = linux_os::epoll_notifier
#else
    , typename Notifier
#endif
    , typename Accessor = descriptor_accessor<Connection>
    , typename Table = descriptor_table<Connection>>
class multiplexer
{
public:
    using connection_type = Connection;
    using notifier_type = Notifier;
    using accessor_type = Accessor;
    using table_type = Table;
    using event_type = typename notifier_type::event_type;

private:
    multiplexer_options _opts;
    notifier_type _notifier;
    table_type _table;

public:
    mutable callback_t<void (std::size_t)> on_milestone = [] (std::size_t) {};

    // Descriptor reported by the kernel has no table entry (concurrent remove
    // or add in progress). Such descriptors are skipped by wait().
    mutable callback_t<void (native_descriptor)> on_stale = [] (native_descriptor) {};

public:
    /**
     * Creates empty multiplexer.
     *
     * @throws iomux::error with errc::init_error if kernel notifier can not be created.
     */
    explicit multiplexer (multiplexer_options opts = multiplexer_options{})
        : _opts(opts)
    {
        if (_opts.event_capacity <= 0)
            _opts.event_capacity = 1;
    }

    ~multiplexer () = default;

    multiplexer (multiplexer const &) = delete;
    multiplexer & operator = (multiplexer const &) = delete;
    multiplexer (multiplexer &&) = delete;
    multiplexer & operator = (multiplexer &&) = delete;

public:
    /**
     * Registers @a conn for level-triggered input and hangup readiness.
     *
     * @return @c true on success. On failure (errc::descriptor_extraction_error
     *         or errc::registration_error) the table is left unmodified.
     */
    bool add (connection_type & conn, error * perr = nullptr)
    {
        auto fd = accessor_type::extract(conn, perr);

        if (fd < 0)
            return false;

        if (!_notifier.add(fd, notifier_type::DEFAULT_INTEREST, perr))
            return false;

        std::size_t count = 0;

        try {
            count = _table.insert(fd, conn);
        } catch (...) {
            error err;
            _notifier.remove(fd, & err);
            throw;
        }

        notify_milestone(count);
        return true;
    }

    /**
     * Deregisters @a conn.
     *
     * @return @c true on success. Removing never added (or already removed)
     *         connection fails with errc::registration_error.
     */
    bool remove (connection_type & conn, error * perr = nullptr)
    {
        auto fd = accessor_type::extract(conn, perr);

        if (fd < 0)
            return false;

        if (!_notifier.remove(fd, perr))
            return false;

        auto count = _table.erase(fd);

        notify_milestone(count);
        return true;
    }

    /**
     * Blocks until at least one registered connection is ready.
     *
     * Interrupted waits (EINTR) are retried. Any other failure is reported as
     * errc::wait_error and an empty result is returned, the multiplexer
     * remains usable.
     *
     * @return Ready connections in the order reported by the kernel, at most
     *         @c event_capacity of them.
     */
    std::vector<connection_type *> wait (error * perr = nullptr)
    {
        return wait_events(-1, perr);
    }

    /**
     * Same as wait(error *) but returns an empty result if no connection
     * became ready within @a timeout. Negative @a timeout blocks indefinitely.
     */
    std::vector<connection_type *> wait (std::chrono::milliseconds timeout, error * perr = nullptr)
    {
        if (timeout < std::chrono::milliseconds{0})
            return wait_events(-1, perr);

        auto const max_millis = static_cast<std::chrono::milliseconds::rep>(
            (std::numeric_limits<int>::max)());

        auto millis = timeout.count() > max_millis ? max_millis : timeout.count();

        return wait_events(static_cast<int>(millis), perr);
    }

    /**
     * Closes the kernel notifier. All registrations are dropped with it.
     * Must not run concurrently with add(), remove() or wait().
     *
     * @throws std::system_error if the table lock can not be acquired
     *         (the notifier is closed already).
     */
    void close ()
    {
        _notifier.close();
        _table.clear();
    }

    std::size_t size () const
    {
        return _table.size();
    }

    bool empty () const
    {
        return _table.empty();
    }

    bool contains (native_descriptor fd) const
    {
        return _table.contains(fd);
    }

    notifier_type & notifier () noexcept
    {
        return _notifier;
    }

    multiplexer_options const & options () const noexcept
    {
        return _opts;
    }

private:
    void notify_milestone (std::size_t count)
    {
        if (_opts.milestone_step > 0 && count > 0 && count % _opts.milestone_step == 0)
            on_milestone(count);
    }

    std::vector<connection_type *> wait_events (int timeout_millis, error * perr)
    {
        using clock_type = std::chrono::steady_clock;

        std::vector<connection_type *> result;
        std::vector<event_type> events(static_cast<std::size_t>(_opts.event_capacity));
        auto deadline = clock_type::now() + std::chrono::milliseconds{timeout_millis};
        int n = 0;

        for (;;) {
            n = _notifier.wait(events.data(), _opts.event_capacity, timeout_millis);

            if (n >= 0)
                break;

            if (errno != EINTR) {
                pfs::throw_or(perr, error {
                      make_error_code(errc::wait_error)
                    , tr::_("wait for events failure")
                    , pfs::system_error_text()
                });

                return result;
            }

            IOMUX__TRACE("multiplexer", "wait interrupted, retrying");

            if (timeout_millis > 0) {
                auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - clock_type::now()).count();

                timeout_millis = remain > 0 ? static_cast<int>(remain) : 0;
            }
        }

        if (n == 0)
            return result;

        std::vector<native_descriptor> fds;
        std::vector<native_descriptor> missed;

        fds.reserve(static_cast<std::size_t>(n));
        result.reserve(static_cast<std::size_t>(n));

        for (int i = 0; i < n; i++)
            fds.push_back(notifier_type::descriptor(events[i]));

        _table.resolve(fds, result, missed);

        for (auto fd: missed)
            on_stale(fd);

        return result;
    }
};

IOMUX__NAMESPACE_END
