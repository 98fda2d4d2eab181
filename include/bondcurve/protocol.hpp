#pragma once

#include <bondcurve/protocol/account.hpp>
#include <bondcurve/protocol/error.hpp>
#include <bondcurve/protocol/event.hpp>
#include <bondcurve/protocol/operation.hpp>
#include <bondcurve/protocol/receipt.hpp>
