#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "candidate.hh"
#include "confidence.hh"
#include "file_record.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief raw, threshold independent measurements of one candidate pair.
 * Computed once per scan and reused when re-ranking.
 */
struct pair_measure_t {
  candidate_pair_t pair;
  media_t media = media_t::photo;
  bool checksum_known = false;
  bool checksum_equal = false;
  // both sides are photos or both videos, so a hash distance is expected
  bool hash_applicable = false;
  // primary hash distance, video: max over aligned frames
  std::optional<uint32_t> distance;
  std::optional<uint32_t> secondary_distance;
  std::optional<double> name_similarity;
  std::optional<double> capture_delta_sec;
  // both video or both audio, so a duration is expected
  bool duration_applicable = false;
  // |da - db| / max(da, db)
  std::optional<double> duration_delta_pct;
  // mean of size and pixel-dimension similarity, nullopt without data
  std::optional<double> metadata_similarity;
  // either record is flagged partial upstream
  bool partial = false;

  bool operator==(const pair_measure_t &) const = default;
};

pair_measure_t measure_pair(const candidate_pair_t &pair,
                            std::span<const file_record_t> records);

/**
 * @brief 1 - |a - b| / max(a, b) averaged over byte size and, when both
 * records carry them, width and height
 */
std::optional<double> metadata_similarity(const file_record_t &lhs,
                                          const file_record_t &rhs) noexcept;

/**
 * @brief maps measurements to signals and penalties. A missing input yields
 * a penalty on that key, never a zero signal. Equal checksums short-circuit
 * to confidence 1.0 with the checksum signal alone; an enabled companion-file
 * link short-circuits to its policy signal alone.
 */
breakdown_t score_pair(const pair_measure_t &measure,
                       const thresholds_t &thresholds);

/**
 * @brief lower-cased file name without extension, separators and variant
 * suffixes like "copy", "(1)" or a trailing "-2"
 */
std::string normalize_stem(std::string_view file_name);

/**
 * @brief lower-cased extension without the dot, empty if none
 */
std::string file_extension(std::string_view file_name);

double jaro_winkler(std::string_view lhs, std::string_view rhs) noexcept;

/**
 * @brief similarity of two normalized stems, nullopt if either is empty
 */
std::optional<double> name_similarity(std::string_view lhs_name,
                                      std::string_view rhs_name);

// rawScore decay curves
double hash_raw_score(uint32_t distance, uint32_t ceiling) noexcept;
double capture_raw_score(double delta_sec, double window_sec) noexcept;
double duration_raw_score(double delta_pct, double tolerance_pct) noexcept;

}  // namespace detail_v1

}  // namespace mediadup
