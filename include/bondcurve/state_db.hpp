#pragma once

#include <bondcurve/state_db/database.hpp>
#include <bondcurve/state_db/error.hpp>
#include <bondcurve/state_db/state_delta.hpp>
#include <bondcurve/state_db/state_node.hpp>
#include <bondcurve/state_db/types.hpp>
