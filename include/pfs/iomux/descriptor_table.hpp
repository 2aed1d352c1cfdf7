////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "descriptor_accessor.hpp"
#include "namespace.hpp"
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

IOMUX__NAMESPACE_BEGIN

/**
 * Concurrency-safe mapping of raw descriptor to connection handle.
 *
 * The table does not own connections, it stores non-owning pointers.
 * Writers (insert, erase) take the lock exclusively, readers share it.
 */
template <typename Connection>
class descriptor_table
{
public:
    using connection_type = Connection;

private:
    mutable std::shared_timed_mutex _mtx;
    std::unordered_map<native_descriptor, connection_type *> _map;

public:
    descriptor_table () = default;

    descriptor_table (descriptor_table const &) = delete;
    descriptor_table & operator = (descriptor_table const &) = delete;
    descriptor_table (descriptor_table &&) = delete;
    descriptor_table & operator = (descriptor_table &&) = delete;

public:
    /**
     * Maps @a fd to @a conn (replaces existing mapping if any).
     *
     * @return Table size after insertion.
     */
    std::size_t insert (native_descriptor fd, connection_type & conn)
    {
        std::unique_lock<std::shared_timed_mutex> locker{_mtx};
        _map[fd] = & conn;
        return _map.size();
    }

    /**
     * Removes mapping for @a fd.
     *
     * @return Table size after removal.
     */
    std::size_t erase (native_descriptor fd)
    {
        std::unique_lock<std::shared_timed_mutex> locker{_mtx};
        _map.erase(fd);
        return _map.size();
    }

    connection_type * find (native_descriptor fd) const
    {
        std::shared_lock<std::shared_timed_mutex> locker{_mtx};
        auto pos = _map.find(fd);
        return pos == _map.end() ? nullptr : pos->second;
    }

    /**
     * Translates @a fds into connections under a single shared lock preserving
     * order. Descriptors without mapping are appended to @a missed.
     */
    void resolve (std::vector<native_descriptor> const & fds
        , std::vector<connection_type *> & found
        , std::vector<native_descriptor> & missed) const
    {
        std::shared_lock<std::shared_timed_mutex> locker{_mtx};

        for (auto fd: fds) {
            auto pos = _map.find(fd);

            if (pos != _map.end())
                found.push_back(pos->second);
            else
                missed.push_back(fd);
        }
    }

    void clear ()
    {
        std::unique_lock<std::shared_timed_mutex> locker{_mtx};
        _map.clear();
    }

    bool contains (native_descriptor fd) const
    {
        std::shared_lock<std::shared_timed_mutex> locker{_mtx};
        return _map.find(fd) != _map.end();
    }

    std::size_t size () const
    {
        std::shared_lock<std::shared_timed_mutex> locker{_mtx};
        return _map.size();
    }

    bool empty () const
    {
        return size() == 0;
    }
};

IOMUX__NAMESPACE_END
