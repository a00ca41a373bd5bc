#pragma once

#include <optional>
#include <string_view>

#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include <vapp/log/formatter.hpp>
#include <vapp/log/frontend.hpp>

namespace vapp::log {

void initialize( quill::LogLevel level = quill::LogLevel::Info ) noexcept;
logger* instance() noexcept;

// Accepts trace, debug, info, warning, error and critical.
std::optional< quill::LogLevel > level_from_string( std::string_view level ) noexcept;

} // namespace vapp::log
