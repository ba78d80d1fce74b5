#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediadup {

inline namespace detail_v1 {

enum class signal_key_t : uint8_t {
  checksum,
  hash,
  name,
  capture_time,
  duration,
  // size and pixel dimension similarity
  metadata,
  // companion-file link bonus
  policy
};

enum class penalty_key_t : uint8_t {
  checksum_missing,
  hash_missing,
  name_missing,
  capture_time_missing,
  duration_missing
};

// "checksum", "hash", "name", "captureTime", "duration", "metadata", "policy"
std::string_view to_string(signal_key_t key) noexcept;
// "checksumMissing", "hashMissing", ...
std::string_view to_string(penalty_key_t key) noexcept;

// signal a penalty stands in for
signal_key_t penalized_signal(penalty_key_t key) noexcept;
// penalty emitted when the signal cannot be computed, none for the
// supplementary metadata and policy signals
std::optional<penalty_key_t> missing_penalty(signal_key_t key) noexcept;

/**
 * @brief one weighted piece of evidence, contribution in [0, weight]
 */
struct signal_t {
  signal_key_t key = signal_key_t::checksum;
  double weight = 0.0;
  double raw_score = 0.0;
  double contribution = 0.0;
  std::string rationale;

  /**
   * @brief clamps raw_score to [0, 1] and derives contribution
   */
  static signal_t make(signal_key_t key, double weight, double raw_score,
                       std::string rationale);

  bool operator==(const signal_t &) const = default;
};

/**
 * @brief negative contribution for a signal that could not be computed
 */
struct penalty_t {
  penalty_key_t key = penalty_key_t::hash_missing;
  double value = 0.0;
  std::string rationale;

  bool operator==(const penalty_t &) const = default;
};

struct breakdown_t {
  // clamp(sum(contribution) + sum(value), 0, 1)
  double confidence = 0.0;
  std::vector<signal_t> signals;
  std::vector<penalty_t> penalties;

  bool operator==(const breakdown_t &) const = default;
};

/**
 * @brief sums signals and penalties into a clamped confidence
 */
double aggregate(const std::vector<signal_t> &signals,
                 const std::vector<penalty_t> &penalties) noexcept;

}  // namespace detail_v1

}  // namespace mediadup
