#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <bondcurve/log/formatter.hpp>
#include <bondcurve/log/frontend.hpp>

namespace bondcurve::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Set the filtering level of the root logger by name ("debug", "info",
 * "warning", ...). Throws on an unknown name.
 */
void set_level( std::string_view level );

} // namespace bondcurve::log
