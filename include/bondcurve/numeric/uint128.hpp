#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include <bondcurve/numeric/error.hpp>

namespace bondcurve::numeric {

using uint128 = boost::multiprecision::uint128_t;
using uint512 = boost::multiprecision::uint512_t;

constexpr std::size_t uint128_size = 16;

using uint128_bytes = std::array< std::byte, uint128_size >;

result< uint128 > checked_add( const uint128& lhs, const uint128& rhs );
result< uint128 > checked_sub( const uint128& lhs, const uint128& rhs );
result< uint128 > checked_mul( const uint128& lhs, const uint128& rhs );

/**
 * Amounts are stored and broadcast as 16 little endian bytes.
 */
uint128_bytes to_little_endian( const uint128& value );
result< uint128 > from_little_endian( std::span< const std::byte > bytes );

/**
 * Parse an unsigned decimal string. Leading '+' signs, whitespace and
 * separators are rejected.
 */
result< uint128 > from_string( std::string_view sv );

} // namespace bondcurve::numeric
