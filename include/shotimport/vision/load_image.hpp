#pragma once

#include <shotimport/core/error.hpp>
#include <shotimport/core/stage_payload.hpp>
#include <expected>
#include <string>

namespace shotimport::vision {

/// Load a screenshot file as raw input (BGR8 or Grayscale8 image, size, source = path).
/// Fails with ErrorCode::LoadFailed when the file cannot be decoded.
std::expected<core::RawInput, core::ImportError> load_raw_input(const std::string& path);

}  // namespace shotimport::vision
