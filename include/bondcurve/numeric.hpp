#pragma once

#include <bondcurve/numeric/error.hpp>
#include <bondcurve/numeric/fixed_point.hpp>
#include <bondcurve/numeric/uint128.hpp>
