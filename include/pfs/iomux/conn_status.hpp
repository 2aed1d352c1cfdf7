////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2021 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// Changelog:
//      2023.01.01 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"

IOMUX__NAMESPACE_BEGIN

enum class conn_status {
      failure     = -1
    , unreachable = -2
    , connected   =  0
    , connecting  =  1
};

IOMUX__NAMESPACE_END
