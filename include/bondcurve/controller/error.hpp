#pragma once

#include <expected>
#include <system_error>

namespace bondcurve::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  not_open,
  read_only_context
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace bondcurve::controller

template<>
struct std::is_error_code_enum< bondcurve::controller::controller_errc >: public std::true_type
{};
