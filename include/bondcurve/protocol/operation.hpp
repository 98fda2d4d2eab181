#pragma once

#include <variant>

#include <bondcurve/numeric/uint128.hpp>
#include <bondcurve/protocol/account.hpp>

namespace bondcurve::protocol {

struct initialize_curve
{
  account caller{};
  numeric::uint128 reserve = 0;
};

struct buy_token
{
  account caller{};
  numeric::uint128 vstoken_amount = 0;
};

struct sell_token
{
  account caller{};
  numeric::uint128 token_amount = 0;
};

using operation = std::variant< initialize_curve, buy_token, sell_token >;

} // namespace bondcurve::protocol
