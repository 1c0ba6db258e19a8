#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace aeroinspect::core {

/// Shared "aeroinspect" logger (colored stderr sink, keeping stdout for results), created on first use. Thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Sets the level from a name ("trace", "debug", "info", "warn", "error", "off").
/// Unknown names leave the level unchanged and return false.
bool set_log_level(std::string_view level);

}  // namespace aeroinspect::core
