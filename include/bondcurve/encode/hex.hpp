#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <bondcurve/encode/error.hpp>

namespace bondcurve::encode {

/**
 * Lower case hex with a leading "0x".
 */
std::string to_hex( std::span< const std::byte > s ) noexcept;

/**
 * Accepts upper or lower case digits with or without a leading "0x".
 */
result< std::vector< std::byte > > from_hex( std::string_view sv ) noexcept;

} // namespace bondcurve::encode
