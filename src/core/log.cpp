#include <aeroinspect/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace aeroinspect::core {

namespace {

constexpr const char* kLoggerName = "aeroinspect";

std::shared_ptr<spdlog::logger> create_logger() {
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [t%t] %v");
  created->set_level(spdlog::level::info);
  return created;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = create_logger();
  return instance;
}

bool set_log_level(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for it.
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

}  // namespace aeroinspect::core
