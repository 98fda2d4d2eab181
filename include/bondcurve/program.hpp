#pragma once

#include <bondcurve/program/bonding_curve.hpp>
#include <bondcurve/program/error.hpp>
#include <bondcurve/program/pricing.hpp>
#include <bondcurve/program/system_interface.hpp>
