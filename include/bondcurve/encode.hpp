#pragma once

#include <bondcurve/encode/error.hpp>
#include <bondcurve/encode/hex.hpp>
