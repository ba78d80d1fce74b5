#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "cluster.hh"
#include "file_record.hh"
#include "group_result.hh"
#include "scorer.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief scan-wide cancellation flag, checked between buckets and between
 * candidate-pair batches
 */
class cancel_token_t {
  std::atomic<bool> _cancelled{false};

 public:
  inline void cancel() noexcept { _cancelled.store(true); }
  inline bool cancelled() const noexcept { return _cancelled.load(); }
};

// caller-supplied resource pressure
struct resource_hint_t {
  // 0 idle, 1 saturated
  double cpu_pressure = 0.0;
  // bytes, 0 = unlimited
  uint64_t memory_budget = 0;
};

/**
 * @brief worker count under pressure, shrinks toward 1 and never fails
 *
 * @param max_thread upper bound requested by the caller
 * @param hint resource pressure
 * @param bytes_per_worker working set of one worker
 */
uint32_t adaptive_concurrency(uint32_t max_thread, const resource_hint_t &hint,
                              uint64_t bytes_per_worker) noexcept;

struct scan_options_t {
  uint32_t max_thread = 4;
  resource_hint_t hint;
  // optional, not owned
  const cancel_token_t *cancel = nullptr;
  // wall-clock budget for the parallel stages, nullopt = unlimited.
  // Exact and companion-file pairs are always resolved.
  std::optional<std::chrono::milliseconds> time_budget;
};

struct scan_metrics_t {
  uint64_t total_files = 0;
  uint64_t buckets = 0;
  uint64_t degraded_buckets = 0;
  uint64_t candidate_pairs = 0;
  // exact duplicates resolved by the checksum short-circuit
  uint64_t checksum_pairs = 0;
  // companion-file links, merged without comparison
  uint64_t policy_links = 0;
  // pairs dropped because the user dismissed them
  uint64_t ignored_pairs = 0;
  // buckets that were name-blocked or cut at the comparison ceiling
  uint64_t limited_buckets = 0;
  bool time_budget_hit = false;
  // candidate pairs actually scored
  uint64_t comparisons = 0;
  // n * (n - 1) / 2
  uint64_t naive_comparisons = 0;
  double reduction_pct = 0.0;
  // hamming evaluations inside the neighbor indexes
  uint64_t distance_evals = 0;
  uint64_t groups = 0;
  uint64_t incomplete_groups = 0;
  uint64_t similar_pairs = 0;
  uint64_t elapsed_ms = 0;
  uint32_t workers = 0;
};

struct scan_result_t {
  std::vector<group_result_t> groups;
  // similar-not-duplicate pairs, kept for manual review
  std::vector<scored_pair_t> similar;
  scan_metrics_t metrics;
  bool cancelled = false;
  // threshold independent, reused by rerank()
  std::vector<pair_measure_t> measures;
  // index radii the candidates were generated with
  uint32_t photo_radius = 0;
  uint32_t video_radius = 0;
  std::size_t record_count = 0;
};

/**
 * @brief detects duplicate groups in a fully delivered record set.
 *
 * @param records immutable scan input
 * @param thresholds run configuration
 * @param options worker count, pressure hints, cancellation and time budget
 * @return groups ordered by confidence, stable for stable input
 * @throws config_error before any work if thresholds are invalid
 */
scan_result_t scan(std::span<const file_record_t> records,
                   const thresholds_t &thresholds,
                   const scan_options_t &options = {});

/**
 * @brief re-scores and re-clusters the measurements of a previous scan under
 * new thresholds, no candidate generation or hashing. Newly ignored pairs
 * are dropped; limit hits of the previous scan carry over.
 *
 * @param records the same records the previous scan saw
 * @throws config_error if thresholds are invalid
 * @throws std::invalid_argument if records do not match the previous scan
 */
scan_result_t rerank(std::span<const file_record_t> records,
                     const scan_result_t &previous,
                     const thresholds_t &thresholds,
                     const scan_options_t &options = {});

}  // namespace detail_v1

}  // namespace mediadup
