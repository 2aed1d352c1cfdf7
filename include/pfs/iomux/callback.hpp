////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2025.05.06 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <functional>

IOMUX__NAMESPACE_BEGIN

template <typename T>
using callback_t = std::function<T>;

IOMUX__NAMESPACE_END
