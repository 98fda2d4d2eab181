#pragma once

#include <expected>
#include <system_error>

namespace bondcurve::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok,
  curve_not_initialized,
  insufficient_token_balance,
  insufficient_supply,
  unexpected_object
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace bondcurve::program

template<>
struct std::is_error_code_enum< bondcurve::program::program_errc >: public std::true_type
{};
