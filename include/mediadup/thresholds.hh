#pragma once

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hh"
#include "file_record.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief invalid threshold configuration, raised before any scan work
 */
class config_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// how a group's confidence is derived from its members'
enum class group_confidence_t : uint8_t { minimum, maximum, mean };

struct band_t {
  uint32_t lower = dflt_band_lower;
  uint32_t upper = dflt_band_upper;

  inline constexpr bool contains(uint32_t d) const noexcept {
    return d >= lower && d <= upper;
  }
};

struct weights_t {
  double checksum = dflt_weight_checksum;
  double hash = dflt_weight_hash;
  double name = dflt_weight_name;
  double capture_time = dflt_weight_capture_time;
  double duration = dflt_weight_duration;
  double metadata = dflt_weight_metadata;
  // cap of a companion-file link bonus
  double policy = dflt_weight_policy;
};

// values are <= 0
struct penalties_t {
  double checksum_missing = dflt_penalty_checksum;
  double hash_missing = dflt_penalty_hash;
  double name_missing = dflt_penalty_name;
  double capture_time_missing = dflt_penalty_capture_time;
  double duration_missing = dflt_penalty_duration;
};

// companion-file links between records sharing a name stem
struct policies_t {
  bool raw_jpeg = true;
  bool live_photo = true;
  bool sidecar = true;
};

// comparison budgets, hitting one marks every group incomplete
struct limits_t {
  // linear pairing pool of a bucket and its neighbors, past it hashless
  // records are only paired with records sharing their name stem
  uint32_t max_bucket_size = dflt_max_bucket_size;
  // candidate pairs kept per bucket (and checks per stem for links), 0 off
  uint64_t max_comparisons_per_bucket = dflt_max_comparisons_per_bucket;
};

/**
 * @brief the whole tunable contract of a run, immutable once a scan starts
 */
struct thresholds_t {
  uint32_t image_distance = dflt_image_distance;
  uint32_t video_frame_distance = dflt_video_frame_distance;
  double duration_tolerance_pct = dflt_duration_tolerance_pct;
  double name_similarity_threshold = dflt_name_similarity;
  band_t confirmation_band;
  uint32_t confirmation_hash_distance = dflt_confirmation_distance;
  // distance at which the hash signal reaches zero
  uint32_t hash_score_ceiling = dflt_hash_score_ceiling;
  double capture_window_sec = dflt_capture_window_sec;
  double size_class_tolerance_pct = dflt_size_class_tolerance_pct;
  weights_t weights;
  penalties_t penalties;
  group_confidence_t group_confidence = group_confidence_t::minimum;
  // most preferred first, lower case, no dot
  std::vector<std::string> format_preference = {
      "dng", "cr3", "cr2", "nef", "nrw", "arw", "orf", "pef", "rw2", "raf",
      "sr2", "srw", "raw", "tiff", "tif", "png", "heic", "heif", "jpg", "jpeg",
      "mov", "mp4", "flac", "wav", "m4a", "mp3"};
  uint64_t index_bucket_ceiling = dflt_index_bucket_ceiling;
  uint32_t index_depth_ceiling = dflt_index_depth_ceiling;
  policies_t policies;
  limits_t limits;
  // pairs the user dismissed, stored with the smaller id first
  std::set<std::pair<file_id_t, file_id_t>> ignored_pairs;

  /**
   * @brief dismisses a pair, it is never compared or linked again
   */
  void ignore_pair(std::string_view lhs, std::string_view rhs);
  bool is_ignored(std::string_view lhs, std::string_view rhs) const;

  // hash distance limit for the media type
  inline uint32_t distance_limit(media_t media) const noexcept {
    return media == media_t::video ? video_frame_distance : image_distance;
  }
  // radius used to query the neighbor index, surfaces borderline pairs too
  inline uint32_t query_radius(media_t media) const noexcept {
    auto limit = distance_limit(media);
    return limit > confirmation_band.upper ? limit : confirmation_band.upper;
  }
};

/**
 * @brief checks every field
 *
 * @throws config_error naming the first offending field
 */
void validate(const thresholds_t &thresholds);

/**
 * @brief confidence a pair needs when no hash distance decides it:
 * the hash contribution at exactly imageDistance.
 */
double dup_threshold(const thresholds_t &thresholds) noexcept;

}  // namespace detail_v1

}  // namespace mediadup
