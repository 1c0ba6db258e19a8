#include <aeroinspect/core/defect.hpp>

namespace aeroinspect::core {

namespace {

constexpr std::array<std::string_view, kDefectClassCount> kClassNames = {
    "damaged_rivet",    "missing_rivet", "filiform_corrosion", "missing_panel",
    "paint_detachment", "scratch",       "composite_damage",   "random_damage",
    "burn_mark",        "scorch_mark",   "metal_fatigue",      "crack",
};

constexpr std::array<DefectClass, kDefectClassCount> kAllClasses = {
    DefectClass::DamagedRivet,    DefectClass::MissingRivet, DefectClass::FiliformCorrosion,
    DefectClass::MissingPanel,    DefectClass::PaintDetachment, DefectClass::Scratch,
    DefectClass::CompositeDamage, DefectClass::RandomDamage, DefectClass::BurnMark,
    DefectClass::ScorchMark,      DefectClass::MetalFatigue, DefectClass::Crack,
};

}  // namespace

std::string_view to_string(DefectClass c) noexcept {
  const auto idx = static_cast<std::size_t>(c);
  return idx < kClassNames.size() ? kClassNames[idx] : std::string_view("unknown");
}

std::string_view to_string(DetectionSource s) noexcept {
  switch (s) {
    case DetectionSource::Primary:
      return "primary";
    case DetectionSource::Secondary:
      return "secondary";
    case DetectionSource::Ensemble:
      return "ensemble";
    default:
      return "unknown";
  }
}

std::optional<DefectClass> defect_class_from_string(std::string_view name) {
  for (std::size_t i = 0; i < kClassNames.size(); ++i) {
    if (kClassNames[i] == name) {
      return kAllClasses[i];
    }
  }
  return std::nullopt;
}

std::optional<DefectClass> defect_class_from_id(std::int64_t class_id) noexcept {
  if (class_id < 0 || static_cast<std::size_t>(class_id) >= kAllClasses.size()) {
    return std::nullopt;
  }
  return kAllClasses[static_cast<std::size_t>(class_id)];
}

const std::array<DefectClass, kDefectClassCount>& all_defect_classes() noexcept {
  return kAllClasses;
}

}  // namespace aeroinspect::core
