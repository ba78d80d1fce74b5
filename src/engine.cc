#include "mediadup/engine.hh"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>

#include "mediadup/bucketer.hh"
#include "mediadup/candidate.hh"
#include "mediadup/config.hh"
#include "mediadup/oss.hh"
#include "mediadup/policy.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

namespace mediadup {

inline namespace detail_v1 {

namespace {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

inline bool is_cancelled(const cancel_token_t *cancel) noexcept {
  return cancel != nullptr && cancel->cancelled();
}

/**
 * @brief cancellation plus an optional deadline. A job that finds the
 * deadline passed skips its work and latches expired().
 */
class interrupt_t {
  const cancel_token_t *_cancel;
  std::optional<std::chrono::steady_clock::time_point> _deadline;
  std::atomic<bool> _expired{false};

 public:
  interrupt_t(const cancel_token_t *cancel,
              std::optional<std::chrono::milliseconds> budget) noexcept
      : _cancel(cancel) {
    if (budget.has_value()) {
      _deadline = std::chrono::steady_clock::now() + *budget;
    }
  }

  bool stop() noexcept {
    if (is_cancelled(_cancel)) {
      return true;
    }
    if (_deadline.has_value() &&
        std::chrono::steady_clock::now() >= *_deadline) {
      _expired.store(true);
      return true;
    }
    return false;
  }
  inline bool cancelled() const noexcept { return is_cancelled(_cancel); }
  inline bool expired() const noexcept { return _expired.load(); }
};

void index_bucket(std::size_t bucket_idx, const partition_t &part,
                  std::span<const file_record_t> records,
                  const thresholds_t &thresholds,
                  std::vector<bucket_index_t> &indexes, interrupt_t *intr) {
  if (intr->stop()) {
    return;
  }
  // every job owns its own slot
  indexes[bucket_idx] = build_index(part.buckets[bucket_idx], records, thresholds);
  const auto &index = indexes[bucket_idx].index;
  if (index.degraded()) {
    const auto &key = part.buckets[bucket_idx].key;
    oss(log_stream()) << "[warn] bucket " << to_string(key.media) << '/'
                      << key.size_class << " degraded to linear scan, "
                      << index.size() << " entries\n";
  }
}

void candidates_of(std::size_t bucket_idx, const partition_t &part,
                   std::span<const bucket_index_t> indexes,
                   std::span<const file_record_t> records,
                   const thresholds_t &thresholds,
                   std::vector<candidate_pair_t> &pairs,
                   scan_metrics_t &metrics, std::mutex &mtx,
                   interrupt_t *intr) {
  if (intr->stop()) {
    return;
  }
  candidate_stats_t stats;
  auto local = generate_candidates(bucket_idx, part, indexes, records,
                                   thresholds, stats);
  if (stats.name_blocked || stats.capped) {
    const auto &key = part.buckets[bucket_idx].key;
    oss(log_stream()) << "[warn] bucket " << to_string(key.media) << '/'
                      << key.size_class
                      << (stats.name_blocked
                              ? " exceeds the bucket size limit, hashless "
                                "records paired by name"
                              : "")
                      << (stats.capped ? " capped at the comparison limit" : "")
                      << '\n';
  }
  {
    std::lock_guard lck(mtx);
    pairs.insert(pairs.end(), local.begin(), local.end());
    metrics.distance_evals += stats.distance_evals;
    metrics.ignored_pairs += stats.ignored;
    if (stats.name_blocked || stats.capped) {
      ++metrics.limited_buckets;
    }
  }
}

void score_batch(std::span<const candidate_pair_t> batch,
                 std::span<const file_record_t> records,
                 const thresholds_t &thresholds,
                 std::vector<scored_pair_t> &scored, std::mutex &mtx,
                 interrupt_t *intr) {
  if (intr->stop()) {
    return;
  }
  std::vector<scored_pair_t> local;
  local.reserve(batch.size());
  for (const auto &pair : batch) {
    local.push_back(evaluate_pair(measure_pair(pair, records), thresholds));
  }
  {
    std::lock_guard lck(mtx);
    std::move(local.begin(), local.end(), std::back_inserter(scored));
  }
}

void rescore_batch(std::span<const pair_measure_t> batch,
                   const thresholds_t &thresholds,
                   std::vector<scored_pair_t> &scored, std::mutex &mtx,
                   interrupt_t *intr) {
  if (intr->stop()) {
    return;
  }
  std::vector<scored_pair_t> local;
  local.reserve(batch.size());
  for (const auto &measure : batch) {
    local.push_back(evaluate_pair(measure, thresholds));
  }
  {
    std::lock_guard lck(mtx);
    std::move(local.begin(), local.end(), std::back_inserter(scored));
  }
}

/**
 * @brief dispatches fn over score_batch_sz slices of items
 */
template <typename Tp, typename Fn>
std::vector<scored_pair_t> score_parallel(std::span<const Tp> items,
                                          uint32_t workers, Fn &&fn) {
  std::vector<scored_pair_t> scored;
  scored.reserve(items.size());
  std::mutex mtx;
  boost::asio::thread_pool pool(workers);
  for (std::size_t st = 0; st < items.size(); st += score_batch_sz) {
    auto len = std::min(score_batch_sz, items.size() - st);
    boost::asio::post(pool, std::bind(fn, items.subspan(st, len),
                                      std::ref(scored), std::ref(mtx)));
  }
  pool.join();
  // batches finish in any order
  std::sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.measure.pair < rhs.measure.pair;
  });
  return scored;
}

// sequential reducer: clustering, group building and the result summary
void reduce(std::span<const file_record_t> records,
            std::vector<scored_pair_t> scored, const thresholds_t &thresholds,
            scan_result_t &result) {
  cluster_t cluster(records.size());
  for (uint32_t i = 0; i < scored.size(); ++i) {
    cluster.observe(scored[i], i);
    if (scored[i].verdict == pair_verdict_t::similar) {
      const auto &measure = scored[i].measure;
      oss(log_stream()) << "[log] similar-not-duplicate: "
                        << records[measure.pair.a].id << " ~ "
                        << records[measure.pair.b].id
                        << " distance=" << measure.distance.value_or(0)
                        << '\n';
      result.similar.push_back(scored[i]);
    }
  }
  auto classes = cluster.finalize();
  scan_gaps_t gaps{result.cancelled, result.metrics.time_budget_hit,
                   result.metrics.limited_buckets > 0};
  result.groups = build_groups(records, classes, scored, cluster.merged_edges(),
                               thresholds, gaps);

  result.measures.clear();
  result.measures.reserve(scored.size());
  for (const auto &sp : scored) {
    result.measures.push_back(sp.measure);
  }

  auto &metrics = result.metrics;
  metrics.groups = result.groups.size();
  metrics.incomplete_groups = static_cast<uint64_t>(
      std::count_if(result.groups.begin(), result.groups.end(),
                    [](const auto &g) { return g.incomplete; }));
  metrics.similar_pairs = result.similar.size();
}

}  // namespace

uint32_t adaptive_concurrency(uint32_t max_thread, const resource_hint_t &hint,
                              uint64_t bytes_per_worker) noexcept {
  auto pressure = std::clamp(hint.cpu_pressure, 0.0, 1.0);
  auto workers = static_cast<uint32_t>(
      std::floor(static_cast<double>(max_thread) * (1.0 - pressure)));
  if (hint.memory_budget > 0 && bytes_per_worker > 0) {
    auto affordable = hint.memory_budget / bytes_per_worker;
    if (affordable < workers) {
      workers = static_cast<uint32_t>(affordable);
    }
  }
  return std::max(workers, 1U);
}

scan_result_t MEDIADUP_EXPORT scan(std::span<const file_record_t> records,
                   const thresholds_t &thresholds,
                   const scan_options_t &options) {
  validate(thresholds);

  timer_t total;
  timer_t timer;
  scan_result_t result;
  auto &metrics = result.metrics;
  result.record_count = records.size();
  result.photo_radius = thresholds.query_radius(media_t::photo);
  result.video_radius = thresholds.query_radius(media_t::video);
  metrics.total_files = records.size();
  metrics.naive_comparisons =
      records.size() < 2 ? 0 : records.size() * (records.size() - 1) / 2;
  metrics.workers = adaptive_concurrency(
      options.max_thread, options.hint, score_batch_sz * sizeof(scored_pair_t));
  const auto workers = metrics.workers;
  interrupt_t intr(options.cancel, options.time_budget);
  oss(log_stream()) << "[log] scan " << records.size() << " files with "
                    << workers << " workers\n";

  // partition
  oss(log_stream()) << "[log] bucketize...\n";
  auto part = bucketize(records, thresholds);
  metrics.buckets = part.buckets.size();
  std::vector<candidate_pair_t> exact;
  exact.reserve(part.checksum_pairs.size());
  for (auto [a, b] : part.checksum_pairs) {
    if (thresholds.is_ignored(records[a].id, records[b].id)) {
      ++metrics.ignored_pairs;
      continue;
    }
    exact.push_back(make_pair(records, a, b));
  }
  dedupe_pairs(exact);
  metrics.checksum_pairs = exact.size();
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";
  oss(log_stream()) << "[log] bucket count: " << part.buckets.size()
                    << ", checksum duplicates: " << part.folded << '\n';

  // companion files, linked by name stem across media types
  oss(log_stream()) << "[log] link companion files...\n";
  auto found = find_policy_links(records, thresholds);
  metrics.ignored_pairs += found.ignored;
  std::vector<candidate_pair_t> linked;
  linked.reserve(found.links.size());
  for (const auto &link : found.links) {
    auto pair = make_pair(records, link.a, link.b);
    if (std::binary_search(exact.begin(), exact.end(), pair)) {
      continue;
    }
    pair.policy = link.policy;
    linked.push_back(pair);
  }
  metrics.policy_links = linked.size();
  if (found.capped) {
    ++metrics.limited_buckets;
    oss(log_stream()) << "[warn] companion-file links capped at the "
                         "comparison limit\n";
  }
  oss(log_stream()) << "[log] companion-file links: " << linked.size() << '\n';

  // build indexes, parallel across buckets, one writer per bucket
  oss(log_stream()) << "[log] build indexes...\n";
  std::vector<bucket_index_t> indexes(part.buckets.size());
  {
    boost::asio::thread_pool pool(workers);
    for (std::size_t b = 0; b < part.buckets.size(); ++b) {
      boost::asio::post(pool,
                        std::bind(index_bucket, b, std::cref(part), records,
                                  std::cref(thresholds), std::ref(indexes),
                                  &intr));
    }
    pool.join();
  }
  metrics.degraded_buckets = static_cast<uint64_t>(
      std::count_if(indexes.begin(), indexes.end(),
                    [](const auto &bi) { return bi.index.degraded(); }));
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";

  // generate candidates against the frozen indexes
  oss(log_stream()) << "[log] generate candidates...\n";
  std::vector<candidate_pair_t> pairs;
  {
    boost::asio::thread_pool pool(workers);
    std::mutex mtx;
    std::span<const bucket_index_t> frozen(indexes);
    for (std::size_t b = 0; b < part.buckets.size(); ++b) {
      boost::asio::post(
          pool, std::bind(candidates_of, b, std::cref(part), frozen, records,
                          std::cref(thresholds), std::ref(pairs),
                          std::ref(metrics), std::ref(mtx), &intr));
    }
    pool.join();
  }
  dedupe_pairs(pairs);
  // exact and linked pairs are resolved without comparison
  std::erase_if(pairs, [&](const candidate_pair_t &pair) {
    return std::binary_search(exact.begin(), exact.end(), pair) ||
           std::binary_search(linked.begin(), linked.end(), pair);
  });
  metrics.candidate_pairs = pairs.size();
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";
  oss(log_stream()) << "[log] candidate pairs: " << metrics.candidate_pairs
                    << ", distance evaluations: " << metrics.distance_evals
                    << '\n';
  if (metrics.limited_buckets > 0) {
    oss(log_stream()) << "[warn] " << metrics.limited_buckets
                      << " buckets hit comparison limits, groups marked "
                         "incomplete\n";
  }

  std::vector<scored_pair_t> scored;
  scored.reserve(exact.size() + linked.size() + pairs.size());
  for (const auto *resolved : {&exact, &linked}) {
    for (const auto &pair : *resolved) {
      scored.push_back(evaluate_pair(measure_pair(pair, records), thresholds));
    }
  }

  // score in batches
  oss(log_stream()) << "[log] score pairs...\n";
  auto compared = score_parallel(
      std::span<const candidate_pair_t>(pairs), workers,
      [records, &thresholds, &intr](std::span<const candidate_pair_t> batch,
                                    std::vector<scored_pair_t> &out,
                                    std::mutex &mtx) {
        score_batch(batch, records, thresholds, out, mtx, &intr);
      });
  result.cancelled = intr.cancelled();
  metrics.time_budget_hit = intr.expired();
  metrics.comparisons = compared.size();
  if (metrics.naive_comparisons > 0) {
    metrics.reduction_pct =
        100.0 * (1.0 - static_cast<double>(metrics.comparisons) /
                           static_cast<double>(metrics.naive_comparisons));
  }
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";
  if (result.cancelled) {
    oss(log_stream()) << "[warn] scan cancelled, " << compared.size() << " of "
                      << pairs.size() << " pairs scored\n";
  }
  if (metrics.time_budget_hit) {
    oss(log_stream()) << "[warn] time budget of "
                      << options.time_budget->count() << "ms exhausted, "
                      << compared.size() << " of " << pairs.size()
                      << " pairs scored\n";
  }
  std::move(compared.begin(), compared.end(), std::back_inserter(scored));
  std::sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.measure.pair < rhs.measure.pair;
  });

  // cluster
  oss(log_stream()) << "[log] cluster...\n";
  reduce(records, std::move(scored), thresholds, result);
  metrics.elapsed_ms = static_cast<uint64_t>(total.time().count());
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n";
  oss(log_stream()) << "[log] duplicate group count: " << metrics.groups
                    << ", similar pairs: " << metrics.similar_pairs
                    << ", comparisons: " << metrics.comparisons << " of "
                    << metrics.naive_comparisons << '\n';
  return result;
}

scan_result_t MEDIADUP_EXPORT rerank(std::span<const file_record_t> records,
                     const scan_result_t &previous,
                     const thresholds_t &thresholds,
                     const scan_options_t &options) {
  validate(thresholds);
  if (records.size() != previous.record_count) {
    throw std::invalid_argument("rerank: record count " +
                                std::to_string(records.size()) +
                                " does not match scanned " +
                                std::to_string(previous.record_count));
  }

  timer_t total;
  scan_result_t result;
  auto &metrics = result.metrics;
  result.record_count = previous.record_count;
  result.photo_radius = previous.photo_radius;
  result.video_radius = previous.video_radius;
  metrics = previous.metrics;
  metrics.workers = adaptive_concurrency(
      options.max_thread, options.hint, score_batch_sz * sizeof(scored_pair_t));

  if (thresholds.query_radius(media_t::photo) > previous.photo_radius ||
      thresholds.query_radius(media_t::video) > previous.video_radius) {
    oss(log_stream()) << "[warn] re-rank radius exceeds the scanned radius, "
                         "pairs beyond it need a rescan\n";
  }

  std::vector<pair_measure_t> measures;
  measures.reserve(previous.measures.size());
  for (const auto &measure : previous.measures) {
    if (thresholds.is_ignored(records[measure.pair.a].id,
                              records[measure.pair.b].id)) {
      ++metrics.ignored_pairs;
      continue;
    }
    measures.push_back(measure);
  }
  oss(log_stream()) << "[log] re-rank " << measures.size() << " pairs...\n";

  interrupt_t intr(options.cancel, options.time_budget);
  auto scored = score_parallel(
      std::span<const pair_measure_t>(measures), metrics.workers,
      [&thresholds, &intr](std::span<const pair_measure_t> batch,
                           std::vector<scored_pair_t> &out, std::mutex &mtx) {
        rescore_batch(batch, thresholds, out, mtx, &intr);
      });
  result.cancelled = previous.cancelled || intr.cancelled();
  metrics.time_budget_hit = previous.metrics.time_budget_hit || intr.expired();
  reduce(records, std::move(scored), thresholds, result);
  metrics.elapsed_ms = static_cast<uint64_t>(total.time().count());
  oss(log_stream()) << "[log] duplicate group count: " << metrics.groups
                    << ", similar pairs: " << metrics.similar_pairs << '\n';
  return result;
}

}  // namespace detail_v1

}  // namespace mediadup
