#pragma once

#include <expected>
#include <system_error>

namespace bondcurve::numeric {

enum class numeric_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  overflow,
  underflow,
  precision_failure,
  invalid_length,
  invalid_format
};

const std::error_category& numeric_category() noexcept;

std::error_code make_error_code( numeric_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace bondcurve::numeric

template<>
struct std::is_error_code_enum< bondcurve::numeric::numeric_errc >: public std::true_type
{};
