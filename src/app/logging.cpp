#include <shotimport/app/logging.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>

namespace shotimport::app {

std::expected<void, core::ImportError> configure_logging(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps every unknown name to off.
  if (parsed == spdlog::level::off && name != "off") {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidConfig,
                                            fmt::format("unknown log level '{}'", name)));
  }
  spdlog::set_level(parsed);
  spdlog::set_pattern("%H:%M:%S.%e %^%-5l%$ [t%t] %v");
  return {};
}

}  // namespace shotimport::app
