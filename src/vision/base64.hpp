#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace aeroinspect::vision::detail {

/// Standard base64 (RFC 4648 alphabet, '=' padding).
std::string base64_encode(std::span<const std::uint8_t> bytes);

}  // namespace aeroinspect::vision::detail
