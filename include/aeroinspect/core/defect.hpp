#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aeroinspect::core {

/// Aircraft surface defect class. The numeric value is the model class id.
enum class DefectClass : std::uint8_t {
  DamagedRivet,
  MissingRivet,
  FiliformCorrosion,
  MissingPanel,
  PaintDetachment,
  Scratch,
  CompositeDamage,
  RandomDamage,
  BurnMark,
  ScorchMark,
  MetalFatigue,
  Crack,
};

inline constexpr std::size_t kDefectClassCount = 12;

/// Which detector produced a detection.
enum class DetectionSource : std::uint8_t {
  Primary,
  Secondary,
  Ensemble,
};

/// Axis-aligned bounding box in image pixel coordinates (top-left x/y, width, height).
struct BBox {
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};

  [[nodiscard]] float right() const noexcept { return x + width; }
  [[nodiscard]] float bottom() const noexcept { return y + height; }
  [[nodiscard]] float area() const noexcept { return width * height; }
};

/// Single predicted defect instance.
struct Detection {
  DefectClass defect_class{DefectClass::RandomDamage};
  float confidence{0.f};
  BBox bbox{};
  DetectionSource source{DetectionSource::Primary};
  std::optional<std::string> description;  // free text from the remote model
};

/// Snake-case wire name ("damaged_rivet", "crack", ...).
[[nodiscard]] std::string_view to_string(DefectClass c) noexcept;
[[nodiscard]] std::string_view to_string(DetectionSource s) noexcept;

/// Parses a wire name; nullopt for anything outside the 12-class allowlist.
[[nodiscard]] std::optional<DefectClass> defect_class_from_string(std::string_view name);

/// Maps a model class id to a defect class; nullopt if out of range.
[[nodiscard]] std::optional<DefectClass> defect_class_from_id(std::int64_t class_id) noexcept;

/// All classes in model-id order.
[[nodiscard]] const std::array<DefectClass, kDefectClassCount>& all_defect_classes() noexcept;

}  // namespace aeroinspect::core
