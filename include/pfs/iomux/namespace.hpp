////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2024-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2024.12.26 Initial version.
//      2026.10.12 Renamed to IOMUX__ prefix.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef IOMUX__NAMESPACE_NAME
#   define IOMUX__NAMESPACE_NAME iomux
#   define IOMUX__NAMESPACE_BEGIN namespace IOMUX__NAMESPACE_NAME {
#   define IOMUX__NAMESPACE_END }
#endif
