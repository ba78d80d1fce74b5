#include "mediadup/thresholds.hh"

#include <algorithm>
#include <utility>

namespace mediadup {

inline namespace detail_v1 {

namespace {

void require(bool cond, const char *field, const std::string &why) {
  if (!cond) {
    throw config_error(std::string("invalid threshold ") + field + ": " + why);
  }
}

bool is_unit(double v) noexcept { return v >= 0.0 && v <= 1.0; }

}  // namespace

void validate(const thresholds_t &th) {
  require(th.image_distance <= code_bits, "imageDistance",
          "must be within [0, 64]");
  require(th.video_frame_distance <= code_bits, "videoFrameDistance",
          "must be within [0, 64]");
  require(is_unit(th.duration_tolerance_pct), "durationTolerancePct",
          "must be within [0, 1]");
  require(is_unit(th.name_similarity_threshold), "nameSimilarityThreshold",
          "must be within [0, 1]");
  require(th.confirmation_band.lower <= th.confirmation_band.upper,
          "confirmationBand", "lower bound exceeds upper bound");
  require(th.confirmation_band.upper <= code_bits, "confirmationBand",
          "must be within [0, 64]");
  require(th.confirmation_hash_distance <= code_bits,
          "confirmationHashDistance", "must be within [0, 64]");
  require(th.hash_score_ceiling > 0, "hashScoreCeiling", "must be positive");
  require(th.capture_window_sec > 0.0, "captureTimeWindowSec",
          "must be positive");
  require(th.size_class_tolerance_pct > 0.0 &&
              th.size_class_tolerance_pct < 1.0,
          "sizeClassTolerancePct", "must be within (0, 1)");
  require(th.index_depth_ceiling >= 1, "indexDepthCeiling",
          "must be at least 1");
  require(th.limits.max_bucket_size >= 2, "limits.maxBucketSize",
          "must be at least 2");

  const auto &w = th.weights;
  require(is_unit(w.checksum), "weights.checksum", "must be within [0, 1]");
  require(is_unit(w.hash), "weights.hash", "must be within [0, 1]");
  require(is_unit(w.name), "weights.name", "must be within [0, 1]");
  require(is_unit(w.capture_time), "weights.captureTime",
          "must be within [0, 1]");
  require(is_unit(w.duration), "weights.duration", "must be within [0, 1]");
  require(is_unit(w.metadata), "weights.metadata", "must be within [0, 1]");
  require(is_unit(w.policy), "weights.policy", "must be within [0, 1]");

  const auto &p = th.penalties;
  for (auto v : {p.checksum_missing, p.hash_missing, p.name_missing,
                 p.capture_time_missing, p.duration_missing}) {
    require(v <= 0.0 && v >= -1.0, "penalties", "must be within [-1, 0]");
  }
}

void thresholds_t::ignore_pair(std::string_view lhs, std::string_view rhs) {
  if (rhs < lhs) {
    std::swap(lhs, rhs);
  }
  ignored_pairs.emplace(file_id_t(lhs), file_id_t(rhs));
}

bool thresholds_t::is_ignored(std::string_view lhs,
                              std::string_view rhs) const {
  if (ignored_pairs.empty()) {
    return false;
  }
  if (rhs < lhs) {
    std::swap(lhs, rhs);
  }
  return ignored_pairs.contains({file_id_t(lhs), file_id_t(rhs)});
}

double dup_threshold(const thresholds_t &th) noexcept {
  auto raw = 1.0 - static_cast<double>(th.image_distance) /
                       static_cast<double>(th.hash_score_ceiling);
  return th.weights.hash * std::clamp(raw, 0.0, 1.0);
}

}  // namespace detail_v1

}  // namespace mediadup
