////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2021-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// References:
//
// Changelog:
//      2021.06.21 Initial version.
//      2026.10.12 Renamed to IOMUX__ prefix.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef IOMUX__STATIC
#   ifndef IOMUX__EXPORT
#       if _MSC_VER
#           if defined(IOMUX__EXPORTS)
#               define IOMUX__EXPORT __declspec(dllexport)
#           else
#               define IOMUX__EXPORT __declspec(dllimport)
#           endif
#       else
#           define IOMUX__EXPORT
#       endif
#   endif
#else
#   define IOMUX__EXPORT
#endif // !IOMUX__STATIC
