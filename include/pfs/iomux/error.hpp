////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2021.06.21 Initial version.
//      2025.03.11 Refactored.
//      2026.10.12 Error codes for multiplexer operations.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

IOMUX__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , init_error                  // Kernel notifier can not be created
    , descriptor_extraction_error // Connection handle has no native descriptor
    , registration_error          // Descriptor (de)registration with the notifier failed
    , wait_error                  // Waiting for readiness failed (except EINTR)
    , socket_error
};

class error_category : public std::error_category
{
public:
    IOMUX__EXPORT virtual char const * name () const noexcept override;
    IOMUX__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

IOMUX__NAMESPACE_END
