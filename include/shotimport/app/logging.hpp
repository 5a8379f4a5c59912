#pragma once

#include <shotimport/core/error.hpp>
#include <expected>
#include <string_view>

namespace shotimport::app {

/// Sets the default spdlog logger's level ("trace" .. "critical", "off") and the shared pattern.
/// An unknown level name is ErrorCode::InvalidConfig and leaves the logger untouched.
std::expected<void, core::ImportError> configure_logging(std::string_view level);

}  // namespace shotimport::app
