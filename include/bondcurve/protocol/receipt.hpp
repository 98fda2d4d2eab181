#pragma once

#include <vector>

#include <bondcurve/numeric/uint128.hpp>
#include <bondcurve/protocol/event.hpp>

namespace bondcurve::protocol {

struct receipt
{
  // Tokens minted by a buy, VSToken returned by a sell, zero for initialize
  numeric::uint128 amount = 0;
  std::vector< event > events;
};

} // namespace bondcurve::protocol
