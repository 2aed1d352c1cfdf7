////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.12 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "namespace.hpp"
#include <pfs/i18n.hpp>

IOMUX__NAMESPACE_BEGIN

using native_descriptor = int;
constexpr native_descriptor const kINVALID_DESCRIPTOR = -1;

/**
 * Resolves the raw OS descriptor of a connection handle.
 *
 * The primary template relies on the explicit `native()` method of the
 * connection (see posix::inet_socket). Specialize it for connection types
 * that expose the descriptor differently.
 */
template <typename Connection>
struct descriptor_accessor
{
    /**
     * Returns raw descriptor of @a conn or @c kINVALID_DESCRIPTOR
     * if connection has no one (errc::descriptor_extraction_error).
     */
    static native_descriptor extract (Connection const & conn, error * perr = nullptr)
    {
        auto fd = static_cast<native_descriptor>(conn.native());

        if (fd < 0) {
            pfs::throw_or(perr, error {
                  make_error_code(errc::descriptor_extraction_error)
                , tr::_("connection has no native descriptor")
            });

            return kINVALID_DESCRIPTOR;
        }

        return fd;
    }
};

IOMUX__NAMESPACE_END
