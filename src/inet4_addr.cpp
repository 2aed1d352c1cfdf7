////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// References:
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.13 Dotted-decimal parser only.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/iomux/inet4_addr.hpp"
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <algorithm>
#include <system_error>

IOMUX__NAMESPACE_BEGIN

pfs::optional<inet4_addr> inet4_addr::parse (char const * s, std::size_t n)
{
    std::uint8_t parts[4] = {0, 0, 0, 0};
    auto first = s;
    auto last = s + n;

    for (int i = 0; i < 4; i++) {
        auto delim_pos = std::find(first, last, '.');

        // Last part must not be followed by a delimiter, others must
        if ((i < 3 && delim_pos == last) || (i == 3 && delim_pos != last))
            return pfs::nullopt;

        if (first == delim_pos)
            return pfs::nullopt;

        std::error_code ec;
        auto part = pfs::to_integer(first, delim_pos
            , std::uint16_t{0}, std::uint16_t{255}, ec);

        if (ec)
            return pfs::nullopt;

        parts[i] = static_cast<std::uint8_t>(part);
        first = delim_pos == last ? last : delim_pos + 1;
    }

    return inet4_addr{parts[0], parts[1], parts[2], parts[3]};
}

pfs::optional<inet4_addr> inet4_addr::parse (std::string const & s)
{
    return parse(s.c_str(), s.size());
}

std::string to_string (inet4_addr const & addr)
{
    auto a = static_cast<std::uint32_t>(addr);

    return fmt::format("{}.{}.{}.{}"
        , (a >> 24) & 0xFF
        , (a >> 16) & 0xFF
        , (a >> 8) & 0xFF
        , a & 0xFF);
}

IOMUX__NAMESPACE_END
