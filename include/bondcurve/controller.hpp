#pragma once

#include <bondcurve/controller/controller.hpp>
#include <bondcurve/controller/error.hpp>
