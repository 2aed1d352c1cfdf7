////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version
//      2026.10.12 Multiplexer error codes.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/error.hpp"
#include <pfs/i18n.hpp>

IOMUX__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "iomux::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::init_error:
            return tr::_("notifier initialization error");
        case errc::descriptor_extraction_error:
            return tr::_("descriptor extraction error");
        case errc::registration_error:
            return tr::_("descriptor registration error");
        case errc::wait_error:
            return tr::_("wait for events error");
        case errc::socket_error:
            return tr::_("socket error");

        default: return tr::_("unknown multiplexer error");
    }
}

IOMUX__NAMESPACE_END
