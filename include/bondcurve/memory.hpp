#pragma once

#include <bondcurve/memory/memory.hpp>
