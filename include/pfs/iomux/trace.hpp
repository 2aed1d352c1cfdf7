////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2025.01.10 Initial version.
//      2026.10.14 Trace output goes through fmt only, no timestamps.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if IOMUX__TRACE_ENABLED
#   include <pfs/fmt.hpp>
#   include <cstdio>

#   define IOMUX__TRACE(t, f, ...) {                                           \
        fmt::print(stdout, "[T] {}: " f "\n", t , ##__VA_ARGS__);              \
        fflush(stdout);}
#else // IOMUX__TRACE_ENABLED
#   define IOMUX__TRACE(t, f, ...)
#endif // !IOMUX__TRACE_ENABLED
