////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `iomux-lib`.
//
// References:
//
// Changelog:
//      2017.07.03 Initial version.
//      2026.10.13 Reduced to dotted-decimal form only.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

IOMUX__NAMESPACE_BEGIN

/**
 * @brief Satisfies Concepts:
 *        @li CopyConstructible
 *        @li CopyAssignable
 */
class inet4_addr
{
private:
    std::uint32_t _addr {0};

public:
    inet4_addr () = default;

    /**
     * @brief Constructs inet4_addr from four numeric parts.
     *
     * @details Each of the four numeric parts specifies a byte of the address;
     *          the bytes are assigned in left-to-right order to produce the binary address.
     */
    inet4_addr (std::uint8_t a, std::uint8_t b, std::uint8_t c, std::uint8_t d)
        : _addr(0)
    {
        _addr |= (static_cast<std::uint32_t>(a) << 24);
        _addr |= (static_cast<std::uint32_t>(b) << 16);
        _addr |= (static_cast<std::uint32_t>(c) << 8);
        _addr |= static_cast<std::uint32_t>(d);
    }

    inet4_addr (std::uint32_t a) : _addr(a)
    {}

    explicit operator std::uint32_t () const noexcept
    {
        return _addr;
    }

public: // static
    /**
     * Parses IPv4 address in dotted-decimal notation ("a.b.c.d").
     */
    static IOMUX__EXPORT pfs::optional<inet4_addr> parse (char const * s, std::size_t n);
    static IOMUX__EXPORT pfs::optional<inet4_addr> parse (std::string const & s);
};

/**
 * Converts IPv4 address to string with format "a.b.c.d".
 */
IOMUX__EXPORT std::string to_string (inet4_addr const & addr);

inline bool operator == (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) == static_cast<std::uint32_t>(b);
}

inline bool operator != (inet4_addr const & a, inet4_addr const & b)
{
    return static_cast<std::uint32_t>(a) != static_cast<std::uint32_t>(b);
}

inline bool is_loopback (inet4_addr const & addr)
{
    return addr == inet4_addr{127, 0, 0, 1};
}

IOMUX__NAMESPACE_END
