#pragma once

#include <bondcurve/log/log.hpp>
