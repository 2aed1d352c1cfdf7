////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2026.10.13 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <cstddef>

IOMUX__NAMESPACE_BEGIN

struct multiplexer_options
{
    // Maximum number of events reported by a single wait call.
    // Remaining ready descriptors are reported by subsequent calls.
    int event_capacity {100};

    // Milestone observer is notified when the number of registered connections
    // becomes a multiple of this value. Zero disables notification.
    std::size_t milestone_step {100};
};

IOMUX__NAMESPACE_END
