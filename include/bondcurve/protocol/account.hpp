#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <bondcurve/protocol/error.hpp>

namespace bondcurve::protocol {

constexpr std::size_t account_length = 32;

/**
 * Opaque caller identity handed to the engine by whoever authenticated the
 * caller. The engine never interprets the bytes.
 */
struct account: std::array< std::byte, account_length >
{};

result< account > account_from_hex( std::string_view sv );
std::string to_hex( const account& a );

} // namespace bondcurve::protocol
