#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "file_record.hh"
#include "group_result.hh"
#include "scorer.hh"
#include "thresholds.hh"
#include "union_find.hh"

namespace mediadup {

inline namespace detail_v1 {

enum class pair_verdict_t : uint8_t {
  duplicate,
  // inside the confirmation band but unconfirmed, kept for manual review
  similar,
  distinct
};

std::string_view to_string(pair_verdict_t verdict) noexcept;

struct scored_pair_t {
  pair_measure_t measure;
  breakdown_t breakdown;
  pair_verdict_t verdict = pair_verdict_t::distinct;
  // "hash:0.32 (dHash distance=5)", "penalty_hashMissing:-0.10 (...)", ...
  std::vector<std::string> rationale;

  bool operator==(const scored_pair_t &) const = default;
};

/**
 * @brief duplicate decision for one pair.
 *
 * Equal checksums and enabled companion-file links always merge. With a
 * hash distance d and limit L, d <= L
 * merges unless d lies in the confirmation band, where an available
 * secondary hash must also pass; an unconfirmed in-band pair is similar.
 * Without a hash distance the pair merges when its confidence reaches
 * dup_threshold().
 */
pair_verdict_t classify(const pair_measure_t &measure,
                        const breakdown_t &breakdown,
                        const thresholds_t &thresholds) noexcept;

/**
 * @brief score_pair, classify and the pair's rationale trail in one step
 */
scored_pair_t evaluate_pair(const pair_measure_t &measure,
                            const thresholds_t &thresholds);

enum class node_state_t : uint8_t { unvisited, scored, merged, finalized };

std::string_view to_string(node_state_t state) noexcept;

/**
 * @brief single-owner clustering state of one scan. Pairs are fed in
 * sequentially once scoring is done.
 */
class cluster_t {
  union_find_t _sets;
  std::vector<node_state_t> _state;
  // indices of the observed pairs that were merged
  std::vector<uint32_t> _merged_edges;
  bool _finalized = false;

 public:
  explicit cluster_t(std::size_t record_count);

  /**
   * @brief marks both ends scored, unions them on a duplicate verdict
   *
   * @param pair_idx index of the pair in the caller's scored list
   * @throws std::logic_error after finalize()
   */
  void observe(const scored_pair_t &pair, uint32_t pair_idx);

  /**
   * @brief closes the clustering
   *
   * @return equivalence classes with at least two records, each sorted by
   * record index, classes ordered by their first index
   */
  std::vector<std::vector<uint32_t>> finalize();

  inline node_state_t state(uint32_t record) const noexcept {
    return _state[record];
  }
  inline const std::vector<uint32_t> &merged_edges() const noexcept {
    return _merged_edges;
  }
  inline std::size_t set_count() const noexcept { return _sets.set_count(); }
};

/**
 * @brief reasons a scan may have missed pairs; any of them marks every group
 * incomplete
 */
struct scan_gaps_t {
  bool cancelled = false;
  bool time_budget_hit = false;
  // a bucket was name-blocked or cut at its comparison ceiling
  bool limited = false;

  inline bool any() const noexcept {
    return cancelled || time_budget_hit || limited;
  }
};

/**
 * @brief turns equivalence classes into results: members sorted by id,
 * signals folded by maximum contribution, keeper suggested, stable group id.
 *
 * @param classes output of cluster_t::finalize()
 * @param pairs every observed pair
 * @param merged_edges indices into pairs that were unioned
 * @param gaps marks every group incomplete and explains why
 * @return groups ordered by confidence desc, then first member id
 */
std::vector<group_result_t> build_groups(
    std::span<const file_record_t> records,
    const std::vector<std::vector<uint32_t>> &classes,
    std::span<const scored_pair_t> pairs,
    std::span<const uint32_t> merged_edges, const thresholds_t &thresholds,
    const scan_gaps_t &gaps);

}  // namespace detail_v1

}  // namespace mediadup
