#include <aeroinspect/core/ensemble_aggregator.hpp>
#include <aeroinspect/core/geometry.hpp>
#include <aeroinspect/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>

namespace aeroinspect::core {

namespace {

struct CandidatePair {
  std::size_t primary;
  std::size_t secondary;
  float iou;
};

/// Copies well-formed detections, forcing the source tag; malformed ones become warnings.
std::vector<Detection> sanitize(std::span<const Detection> input,
                                DetectionSource source,
                                std::vector<std::string>& warnings) {
  std::vector<Detection> out;
  out.reserve(input.size());
  for (const auto& d : input) {
    const bool confidence_ok = std::isfinite(d.confidence) && d.confidence >= 0.f &&
                               d.confidence <= 1.f;
    if (!confidence_ok || !is_well_formed(d.bbox)) {
      warnings.push_back(fmt::format("dropped malformed {} detection ({})",
                                     to_string(source), to_string(d.defect_class)));
      continue;
    }
    Detection copy = d;
    copy.source = source;
    out.push_back(std::move(copy));
  }
  return out;
}

/// Overlapping pairs (IoU > 0 and >= threshold) that satisfy \p want, best IoU first.
/// Ties are broken by index so the assignment is deterministic.
template <typename Predicate>
std::vector<CandidatePair> overlapping_pairs(const std::vector<Detection>& primary,
                                             const std::vector<Detection>& secondary,
                                             const std::vector<bool>& primary_used,
                                             const std::vector<bool>& secondary_used,
                                             float threshold,
                                             Predicate want) {
  std::vector<CandidatePair> pairs;
  for (std::size_t i = 0; i < primary.size(); ++i) {
    if (primary_used[i]) continue;
    for (std::size_t j = 0; j < secondary.size(); ++j) {
      if (secondary_used[j] || !want(primary[i], secondary[j])) continue;
      const float overlap = iou(primary[i].bbox, secondary[j].bbox);
      if (overlap > 0.f && overlap >= threshold) {
        pairs.push_back({i, j, overlap});
      }
    }
  }
  std::sort(pairs.begin(), pairs.end(), [](const CandidatePair& a, const CandidatePair& b) {
    if (a.iou != b.iou) return a.iou > b.iou;
    if (a.primary != b.primary) return a.primary < b.primary;
    return a.secondary < b.secondary;
  });
  return pairs;
}

Detection merge(const Detection& p, const Detection& s) {
  Detection m;
  m.defect_class = p.defect_class;
  m.confidence = (p.confidence + s.confidence) / 2.f;
  m.bbox.x = (p.bbox.x + s.bbox.x) / 2.f;
  m.bbox.y = (p.bbox.y + s.bbox.y) / 2.f;
  m.bbox.width = (p.bbox.width + s.bbox.width) / 2.f;
  m.bbox.height = (p.bbox.height + s.bbox.height) / 2.f;
  m.source = DetectionSource::Ensemble;
  m.description = s.description;
  return m;
}

/// A detection entering conflict resolution: a merged pair or an unmatched singleton.
struct Candidate {
  Detection detection;
  bool from_primary;
  bool from_secondary;
  float score;  // sum of confidence x detector weight over its contributors
};

/// Groups candidates that overlap (IoU > 0 and >= threshold), transitively.
/// Returns the cluster root per candidate; the root is the cluster's lowest index.
std::vector<std::size_t> overlap_clusters(const std::vector<Candidate>& candidates,
                                          float threshold) {
  std::vector<std::size_t> parent(candidates.size());
  for (std::size_t k = 0; k < parent.size(); ++k) parent[k] = k;
  const auto find = [&parent](std::size_t k) {
    while (parent[k] != k) {
      parent[k] = parent[parent[k]];
      k = parent[k];
    }
    return k;
  };
  for (std::size_t a = 0; a < candidates.size(); ++a) {
    for (std::size_t b = a + 1; b < candidates.size(); ++b) {
      const float overlap = iou(candidates[a].detection.bbox, candidates[b].detection.bbox);
      if (overlap <= 0.f || overlap < threshold) continue;
      const std::size_t ra = find(a);
      const std::size_t rb = find(b);
      if (ra == rb) continue;
      parent[std::max(ra, rb)] = std::min(ra, rb);
    }
  }
  for (std::size_t k = 0; k < parent.size(); ++k) parent[k] = find(k);
  return parent;
}

/// Highest summed score wins. Ties prefer a class the primary detector reported,
/// then the lower class id.
DefectClass vote(const std::vector<Candidate>& candidates, const std::vector<std::size_t>& members) {
  struct Tally {
    DefectClass defect_class;
    float score;
    bool primary_backed;
  };
  std::vector<Tally> tallies;
  for (std::size_t k : members) {
    const Candidate& c = candidates[k];
    auto it = std::find_if(tallies.begin(), tallies.end(), [&c](const Tally& t) {
      return t.defect_class == c.detection.defect_class;
    });
    if (it == tallies.end()) {
      tallies.push_back({c.detection.defect_class, 0.f, false});
      it = std::prev(tallies.end());
    }
    it->score += c.score;
    it->primary_backed = it->primary_backed || c.from_primary;
  }
  const auto better = [](const Tally& a, const Tally& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.primary_backed != b.primary_backed) return a.primary_backed;
    return static_cast<int>(a.defect_class) < static_cast<int>(b.defect_class);
  };
  return std::min_element(tallies.begin(), tallies.end(), better)->defect_class;
}

}  // namespace

EnsembleAggregator::EnsembleAggregator(EnsembleConfig config) : config_(config) {}

AggregationOutcome EnsembleAggregator::aggregate(std::span<const Detection> primary_in,
                                                 std::span<const Detection> secondary_in) const {
  AggregationOutcome outcome;
  const auto primary = sanitize(primary_in, DetectionSource::Primary, outcome.warnings);
  const auto secondary = sanitize(secondary_in, DetectionSource::Secondary, outcome.warnings);

  std::vector<bool> primary_used(primary.size(), false);
  std::vector<bool> secondary_used(secondary.size(), false);
  std::vector<Detection> combined;
  combined.reserve(primary.size() + secondary.size());

  const auto same_class = [](const Detection& a, const Detection& b) {
    return a.defect_class == b.defect_class;
  };
  std::vector<float> merged_scores;
  std::size_t merged_count = 0;
  for (const auto& pair : overlapping_pairs(primary, secondary, primary_used, secondary_used,
                                            config_.match_iou_threshold, same_class)) {
    if (primary_used[pair.primary] || secondary_used[pair.secondary]) continue;
    primary_used[pair.primary] = true;
    secondary_used[pair.secondary] = true;
    combined.push_back(merge(primary[pair.primary], secondary[pair.secondary]));
    merged_scores.push_back(primary[pair.primary].confidence * config_.primary_weight +
                            secondary[pair.secondary].confidence * config_.secondary_weight);
    ++merged_count;
    logger()->debug("match: {} iou={:.3f}", to_string(primary[pair.primary].defect_class),
                    pair.iou);
  }

  // Matched pairs and leftovers become candidates; overlapping candidates form clusters.
  std::vector<Candidate> candidates;
  candidates.reserve(combined.size() + primary.size() + secondary.size());
  for (std::size_t k = 0; k < combined.size(); ++k) {
    candidates.push_back({std::move(combined[k]), true, true, merged_scores[k]});
  }
  combined.clear();
  for (std::size_t i = 0; i < primary.size(); ++i) {
    if (!primary_used[i]) {
      candidates.push_back({primary[i], true, false, primary[i].confidence * config_.primary_weight});
    }
  }
  for (std::size_t j = 0; j < secondary.size(); ++j) {
    if (!secondary_used[j]) {
      candidates.push_back(
          {secondary[j], false, true, secondary[j].confidence * config_.secondary_weight});
    }
  }

  const auto cluster_of = overlap_clusters(candidates, config_.match_iou_threshold);
  std::vector<bool> in_conflict(candidates.size(), false);
  std::vector<bool> keep(candidates.size(), false);
  std::size_t voted_count = 0;
  for (std::size_t root = 0; root < candidates.size(); ++root) {
    if (cluster_of[root] != root) continue;
    std::vector<std::size_t> members;
    bool has_primary = false;
    bool has_secondary = false;
    bool mixed_classes = false;
    for (std::size_t k = 0; k < candidates.size(); ++k) {
      if (cluster_of[k] != root) continue;
      if (!members.empty() &&
          candidates[k].detection.defect_class != candidates[members.front()].detection.defect_class) {
        mixed_classes = true;
      }
      has_primary = has_primary || candidates[k].from_primary;
      has_secondary = has_secondary || candidates[k].from_secondary;
      members.push_back(k);
    }
    if (!mixed_classes || !has_primary || !has_secondary) continue;

    const DefectClass winner = vote(candidates, members);
    for (std::size_t k : members) {
      in_conflict[k] = true;
      keep[k] = candidates[k].detection.defect_class == winner;
    }
    ++voted_count;
    logger()->debug("class conflict over {} detections -> {}", members.size(), to_string(winner));
  }

  for (std::size_t k = 0; k < candidates.size(); ++k) {
    Candidate& c = candidates[k];
    if (in_conflict[k]) {
      if (!keep[k]) continue;
      c.detection.source = DetectionSource::Ensemble;
    } else if (!(c.from_primary && c.from_secondary) &&
               c.detection.confidence <= config_.single_detector_min_confidence) {
      continue;
    }
    combined.push_back(std::move(c.detection));
  }

  auto deduplicated = suppress_overlaps(std::move(combined), config_.nms_iou_threshold);
  outcome.detections.reserve(deduplicated.size());
  for (auto& d : deduplicated) {
    if (d.confidence >= config_.min_final_confidence) {
      outcome.detections.push_back(std::move(d));
    }
  }

  logger()->info("aggregated primary={} secondary={} -> merged={} voted={} final={}",
                 primary.size(), secondary.size(), merged_count, voted_count,
                 outcome.detections.size());
  return outcome;
}

}  // namespace aeroinspect::core
