#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "confidence.hh"
#include "file_record.hh"

namespace mediadup {

inline namespace detail_v1 {

struct member_t {
  file_id_t file_id;
  // strongest edge linking the member into its group, in [0, 1]
  double confidence = 0.0;
  // best contribution per key over the member's edges
  std::vector<signal_t> signals;
  // keys no edge could compute
  std::vector<penalty_t> penalties;
  std::vector<std::string> rationale;
  uint64_t file_size = 0;

  bool operator==(const member_t &) const = default;
};

/**
 * @brief one equivalence class of at least two duplicates
 */
struct group_result_t {
  // 32 hex digits, stable for the same member set
  std::string group_id;
  // sorted by file_id
  std::vector<member_t> members;
  double confidence = 0.0;
  std::vector<std::string> rationale_lines;
  std::optional<file_id_t> keeper;
  // a member was partial, video frames were truncated or the scan cancelled
  bool incomplete = false;
  media_t media = media_t::photo;

  // bytes freed by removing every member but the keeper
  uint64_t reclaimable_size() const noexcept;

  bool operator==(const group_result_t &) const = default;
};

}  // namespace detail_v1

}  // namespace mediadup
