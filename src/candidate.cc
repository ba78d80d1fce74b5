#include "mediadup/candidate.hh"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "mediadup/scorer.hh"

namespace mediadup {

inline namespace detail_v1 {

candidate_pair_t make_pair(std::span<const file_record_t> records, uint32_t i,
                           uint32_t j) noexcept {
  candidate_pair_t pair{std::min(i, j), std::max(i, j), 0, false, {}};
  const auto &lhs = records[pair.a];
  const auto &rhs = records[pair.b];
  if (lhs.media == media_t::video && rhs.media == media_t::video &&
      lhs.has_codes() && rhs.has_codes()) {
    auto na = lhs.perceptual_hash->codes.size();
    auto nb = rhs.perceptual_hash->codes.size();
    pair.frames = static_cast<uint32_t>(std::min(na, nb));
    pair.truncated = na != nb;
  }
  return pair;
}

bucket_index_t build_index(const bucket_t &bucket,
                           std::span<const file_record_t> records,
                           const thresholds_t &thresholds) {
  bucket_index_t bi{neighbor_index_t(thresholds.index_bucket_ceiling,
                                     thresholds.index_depth_ceiling),
                    {}};
  // photos are queried and measured on their first code only
  auto indexed_frames = [&](const std::vector<uint64_t> &codes) {
    return bucket.key.media == media_t::video ? codes.size() : std::size_t{1};
  };
  for (auto rec_idx : bucket.hashed) {
    const auto &codes = records[rec_idx].perceptual_hash->codes;
    auto frames = indexed_frames(codes);
    for (uint32_t frame = 0; frame < frames; ++frame) {
      auto ref = static_cast<uint32_t>(bi.entries.size());
      bi.entries.push_back({rec_idx, frame});
      bi.index.insert(codes[frame], ref);
    }
  }
  bi.index.freeze();
  return bi;
}

namespace {

// photo: any hit within radius is a candidate
void query_photo(uint32_t rec_idx, const bucket_index_t &bi,
                 std::span<const file_record_t> records, uint32_t radius,
                 std::vector<candidate_pair_t> &out, uint64_t &evals) {
  auto code = records[rec_idx].perceptual_hash->codes.front();
  evals += bi.index.query(code, radius, [&](uint32_t ref, uint32_t) {
    auto other = bi.entries[ref].record;
    if (other != rec_idx) {
      out.push_back(make_pair(records, rec_idx, other));
    }
  });
}

// video: every aligned frame must hit, i.e. max aligned distance <= radius
void query_video(uint32_t rec_idx, const bucket_index_t &bi,
                 std::span<const file_record_t> records, uint32_t radius,
                 std::vector<candidate_pair_t> &out, uint64_t &evals) {
  const auto &codes = records[rec_idx].perceptual_hash->codes;
  std::unordered_map<uint32_t, uint32_t> aligned_hits;
  for (uint32_t frame = 0; frame < codes.size(); ++frame) {
    evals += bi.index.query(codes[frame], radius, [&](uint32_t ref, uint32_t) {
      const auto &entry = bi.entries[ref];
      if (entry.record != rec_idx && entry.frame == frame) {
        ++aligned_hits[entry.record];
      }
    });
  }
  for (const auto &[other, hits] : aligned_hits) {
    auto pair = make_pair(records, rec_idx, other);
    if (hits >= pair.frames) {
      out.push_back(pair);
    }
  }
}

void pair_all(uint32_t rec_idx, std::span<const uint32_t> pool,
              std::span<const file_record_t> records,
              std::vector<candidate_pair_t> &out) {
  for (auto other : pool) {
    if (other != rec_idx) {
      out.push_back(make_pair(records, rec_idx, other));
    }
  }
}

// oversized pool: a hashless record only meets records sharing its stem
void pair_by_stem(std::span<const uint32_t> hashless,
                  std::span<const uint32_t> pool,
                  std::span<const file_record_t> records,
                  std::vector<candidate_pair_t> &out, std::size_t ceiling,
                  bool &capped) {
  std::unordered_map<std::string, std::vector<uint32_t>> by_stem;
  for (auto idx : pool) {
    auto stem = normalize_stem(records[idx].file_name);
    if (!stem.empty()) {
      by_stem[std::move(stem)].push_back(idx);
    }
  }
  for (auto rec_idx : hashless) {
    auto it = by_stem.find(normalize_stem(records[rec_idx].file_name));
    if (it == by_stem.end()) {
      continue;
    }
    pair_all(rec_idx, it->second, records, out);
    if (ceiling > 0 && out.size() >= ceiling) {
      capped = true;
      return;
    }
  }
}

}  // namespace

std::vector<candidate_pair_t> generate_candidates(
    std::size_t bucket_idx, const partition_t &part,
    std::span<const bucket_index_t> indexes,
    std::span<const file_record_t> records, const thresholds_t &thresholds,
    candidate_stats_t &stats) {
  std::vector<candidate_pair_t> pairs;
  const auto &bucket = part.buckets[bucket_idx];
  const auto &limits = thresholds.limits;
  auto radius = thresholds.query_radius(bucket.key.media);
  auto lower = part.lower_neighbor(bucket_idx);
  auto upper = part.upper_neighbor(bucket_idx);

  for (auto rec_idx : bucket.hashed) {
    for (auto target : {std::optional<std::size_t>(bucket_idx), lower}) {
      if (!target.has_value()) {
        continue;
      }
      if (bucket.key.media == media_t::video) {
        query_video(rec_idx, indexes[*target], records, radius, pairs,
                    stats.distance_evals);
      } else {
        query_photo(rec_idx, indexes[*target], records, radius, pairs,
                    stats.distance_evals);
      }
    }
  }

  if (!bucket.hashless.empty()) {
    std::vector<uint32_t> pool;
    for (auto target : {lower, std::optional<std::size_t>(bucket_idx), upper}) {
      if (!target.has_value()) {
        continue;
      }
      const auto &b = part.buckets[*target];
      pool.insert(pool.end(), b.hashed.begin(), b.hashed.end());
      pool.insert(pool.end(), b.hashless.begin(), b.hashless.end());
    }
    // keep the working set bounded before de-duplication
    auto ceiling = limits.max_comparisons_per_bucket > 0
                       ? pairs.size() + 2 * limits.max_comparisons_per_bucket
                       : std::size_t{0};
    if (pool.size() <= limits.max_bucket_size) {
      for (auto rec_idx : bucket.hashless) {
        pair_all(rec_idx, pool, records, pairs);
      }
    } else {
      stats.name_blocked = true;
      pair_by_stem(bucket.hashless, pool, records, pairs, ceiling,
                   stats.capped);
    }
  }

  dedupe_pairs(pairs);
  if (!thresholds.ignored_pairs.empty()) {
    auto before = pairs.size();
    std::erase_if(pairs, [&](const candidate_pair_t &pair) {
      return thresholds.is_ignored(records[pair.a].id, records[pair.b].id);
    });
    stats.ignored += before - pairs.size();
  }
  if (limits.max_comparisons_per_bucket > 0 &&
      pairs.size() > limits.max_comparisons_per_bucket) {
    pairs.resize(limits.max_comparisons_per_bucket);
    stats.capped = true;
  }
  return pairs;
}

void dedupe_pairs(std::vector<candidate_pair_t> &pairs) {
  std::sort(pairs.begin(), pairs.end());
  pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
}

}  // namespace detail_v1

}  // namespace mediadup
