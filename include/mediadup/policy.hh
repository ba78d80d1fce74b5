#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "file_record.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

enum class policy_t : uint8_t { raw_jpeg, live_photo, sidecar };

// "policy.raw-jpeg", "policy.live-photo", "policy.sidecar"
std::string_view to_string(policy_t policy) noexcept;

// confidence a link asks for, capped by the policy weight
double policy_bonus(policy_t policy) noexcept;

bool policy_enabled(policy_t policy, const policies_t &policies) noexcept;

bool is_raw_extension(std::string_view ext) noexcept;

struct policy_link_t {
  uint32_t a = 0;
  uint32_t b = 0;
  policy_t policy = policy_t::raw_jpeg;

  bool operator==(const policy_link_t &) const = default;
};

struct policy_links_t {
  // sorted, a < b, one link per pair
  std::vector<policy_link_t> links;
  // links dropped because the user dismissed the pair
  uint64_t ignored = 0;
  // a stem needed more checks than limits.max_comparisons_per_bucket
  bool capped = false;
};

/**
 * @brief links companion files that share a normalized name stem: a RAW and
 * its JPEG rendition, a Live Photo still and its clip, an XMP sidecar and the
 * asset it describes. Pure.
 *
 * @param records immutable scan input
 * @param thresholds enabled policies, ignored pairs and the check budget
 */
policy_links_t find_policy_links(std::span<const file_record_t> records,
                                 const thresholds_t &thresholds);

}  // namespace detail_v1

}  // namespace mediadup
