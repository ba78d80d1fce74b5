#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "file_record.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

struct bucket_key_t {
  media_t media = media_t::photo;
  int64_t size_class = 0;

  auto operator<=>(const bucket_key_t &) const = default;
};

/**
 * @brief one coarse partition, holds indices into the record sequence
 */
struct bucket_t {
  bucket_key_t key;
  // records carrying perceptual codes, go through the neighbor index
  std::vector<uint32_t> hashed;
  // records without codes, compared linearly on checksum/name/metadata
  std::vector<uint32_t> hashless;

  inline std::size_t size() const noexcept {
    return hashed.size() + hashless.size();
  }
};

struct partition_t {
  // sorted by key, never mixes media types
  std::vector<bucket_t> buckets;
  // confirmed exact duplicates (first < second), resolved without scoring
  std::vector<std::pair<uint32_t, uint32_t>> checksum_pairs;
  // records folded into a checksum representative, skipped by bucketing
  std::size_t folded = 0;

  // adjacent size classes of the same media type, if populated
  std::optional<std::size_t> lower_neighbor(std::size_t idx) const noexcept;
  std::optional<std::size_t> upper_neighbor(std::size_t idx) const noexcept;
};

/**
 * @brief logarithmic size class, sizes within the tolerance band share a
 * class or sit in adjacent ones
 *
 * @param size file size in bytes
 * @param tolerance_pct band width, e.g. 0.05
 */
int64_t size_class(uint64_t size, double tolerance_pct) noexcept;

/**
 * @brief partitions records by (media type, size class) after folding exact
 * checksum matches into one representative each. Pure.
 *
 * @param records immutable scan input
 * @param thresholds run configuration
 */
partition_t bucketize(std::span<const file_record_t> records,
                      const thresholds_t &thresholds);

}  // namespace detail_v1

}  // namespace mediadup
