#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "confidence.hh"
#include "file_record.hh"
#include "group_result.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

enum class verdict_t : uint8_t { pass, warn, fail };

std::string_view to_string(verdict_t verdict) noexcept;

/**
 * @brief contribution > 0.3 passes, > 0.1 warns, anything else fails.
 * A penalty on the same key always fails.
 */
verdict_t verdict_for(double contribution, bool penalized) noexcept;

/**
 * @brief one auditable line of evidence, format only
 */
struct evidence_item_t {
  // signal key, penalties prefixed "penalty_"
  std::string id;
  std::string label;
  std::string distance_text;
  std::string threshold_text;
  verdict_t verdict = verdict_t::fail;
  // penalties carry their negative value
  double contribution = 0.0;

  bool operator==(const evidence_item_t &) const = default;
};

// "[pass] Hash Distance: 3 / 5", measured value and configured limit
std::string to_line(const evidence_item_t &item);

// "2s", "90s" -> "1.5m", "2h"
std::string format_seconds(double seconds);

/**
 * @brief evidence of one member, sorted by contribution desc
 *
 * @param media decides between image and video distance thresholds
 */
std::vector<evidence_item_t> format_evidence(const member_t &member,
                                             media_t media,
                                             const thresholds_t &thresholds);

/**
 * @brief evidence of a whole group: every member's signals folded by
 * maximum contribution per key, penalties de-duplicated by key
 */
std::vector<evidence_item_t> format_evidence(const group_result_t &group,
                                             const thresholds_t &thresholds);

}  // namespace detail_v1

}  // namespace mediadup
