#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bucketer.hh"
#include "file_record.hh"
#include "neighbor_index.hh"
#include "policy.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief unordered pair of record indices, a < b
 */
struct candidate_pair_t {
  uint32_t a = 0;
  uint32_t b = 0;
  // index-aligned keyframes compared, min of both counts (video only)
  uint32_t frames = 0;
  // frame counts differed, the longer list was cut
  bool truncated = false;
  // set when the pair is a companion-file link rather than a lookalike
  std::optional<policy_t> policy;

  inline bool same_pair(const candidate_pair_t &rhs) const noexcept {
    return a == rhs.a && b == rhs.b;
  }
  inline std::strong_ordering operator<=>(
      const candidate_pair_t &rhs) const noexcept {
    if (auto cmp = a <=> rhs.a; cmp != 0) {
      return cmp;
    }
    return b <=> rhs.b;
  }
  inline bool operator==(const candidate_pair_t &rhs) const noexcept {
    return same_pair(rhs);
  }
};

/**
 * @brief pairs two records, ordering the indices and deriving the video
 * frame alignment
 */
candidate_pair_t make_pair(std::span<const file_record_t> records, uint32_t i,
                           uint32_t j) noexcept;

/**
 * @brief frozen index of one bucket's hashed records. Video records insert
 * one entry per keyframe.
 */
struct bucket_index_t {
  struct entry_t {
    uint32_t record;
    uint32_t frame;
  };

  neighbor_index_t index{dflt_index_bucket_ceiling, dflt_index_depth_ceiling};
  std::vector<entry_t> entries;
};

/**
 * @brief builds and freezes the index of one bucket, single writer
 */
bucket_index_t build_index(const bucket_t &bucket,
                           std::span<const file_record_t> records,
                           const thresholds_t &thresholds);

struct candidate_stats_t {
  uint64_t distance_evals = 0;
  // pairs dropped because the user dismissed them
  uint64_t ignored = 0;
  // hashless pool exceeded limits.max_bucket_size, paired by stem only
  bool name_blocked = false;
  // pairs were cut at limits.max_comparisons_per_bucket
  bool capped = false;
};

/**
 * @brief candidate pairs owned by one bucket: hashed records query their own
 * and the lower neighbor's index; hashless records pair linearly with the
 * bucket and both neighbors, or with same-stem records once that pool grows
 * past limits.max_bucket_size.
 *
 * @param bucket_idx bucket to generate for
 * @param part the whole partition
 * @param indexes frozen indexes, one per bucket
 * @param[out] stats distance evaluations and limit hits, accumulated
 * @return sorted, de-duplicated pairs, ignored pairs removed, at most
 * limits.max_comparisons_per_bucket of them
 */
std::vector<candidate_pair_t> generate_candidates(
    std::size_t bucket_idx, const partition_t &part,
    std::span<const bucket_index_t> indexes,
    std::span<const file_record_t> records, const thresholds_t &thresholds,
    candidate_stats_t &stats);

/**
 * @brief sorts and drops repeated pairs in place
 */
void dedupe_pairs(std::vector<candidate_pair_t> &pairs);

}  // namespace detail_v1

}  // namespace mediadup
