#include "mediadup/bucketer.hh"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace mediadup {

inline namespace detail_v1 {

int64_t size_class(uint64_t size, double tolerance_pct) noexcept {
  if (size == 0) {
    return 0;
  }
  auto cls = std::floor(std::log(static_cast<double>(size)) /
                        std::log1p(tolerance_pct));
  return static_cast<int64_t>(cls) + 1;
}

std::optional<std::size_t> partition_t::lower_neighbor(
    std::size_t idx) const noexcept {
  if (idx == 0 || idx >= buckets.size()) {
    return std::nullopt;
  }
  const auto &cur = buckets[idx].key;
  const auto &prev = buckets[idx - 1].key;
  if (prev.media == cur.media && prev.size_class + 1 == cur.size_class) {
    return idx - 1;
  }
  return std::nullopt;
}

std::optional<std::size_t> partition_t::upper_neighbor(
    std::size_t idx) const noexcept {
  if (idx + 1 >= buckets.size()) {
    return std::nullopt;
  }
  const auto &cur = buckets[idx].key;
  const auto &next = buckets[idx + 1].key;
  if (next.media == cur.media && cur.size_class + 1 == next.size_class) {
    return idx + 1;
  }
  return std::nullopt;
}

partition_t bucketize(std::span<const file_record_t> records,
                      const thresholds_t &thresholds) {
  partition_t part;
  if (records.empty()) {
    return part;
  }

  std::vector<uint32_t> order(records.size());
  std::iota(order.begin(), order.end(), 0U);
  std::vector<bool> folded(records.size(), false);

  // finding runs of identical checksum and size
  std::sort(order.begin(), order.end(), [&](auto lhs, auto rhs) {
    const auto &l = records[lhs];
    const auto &r = records[rhs];
    if (l.checksum != r.checksum) {
      return l.checksum < r.checksum;
    }
    if (l.size != r.size) {
      return l.size < r.size;
    }
    return l.id < r.id;
  });
  {
    auto union_st = order.begin();
    auto union_ed = union_st + 1;
    while (true) {
      if (union_ed == order.end() ||
          records[*union_ed].checksum != records[*union_st].checksum ||
          records[*union_ed].size != records[*union_st].size) {
        // end of run, the smallest id stays as representative
        if (std::distance(union_st, union_ed) > 1 &&
            !records[*union_st].checksum.empty()) {
          auto rep = *union_st;
          for (auto it = union_st + 1; it != union_ed; ++it) {
            part.checksum_pairs.emplace_back(std::min(rep, *it),
                                             std::max(rep, *it));
            folded[*it] = true;
            ++part.folded;
          }
        }
        if (union_ed == order.end()) {
          break;
        }
        union_st = union_ed;
      }
      ++union_ed;
    }
  }
  std::sort(part.checksum_pairs.begin(), part.checksum_pairs.end());

  // sort the rest by bucket key
  std::vector<std::pair<bucket_key_t, uint32_t>> keyed;
  keyed.reserve(records.size() - part.folded);
  for (uint32_t i = 0; i < records.size(); ++i) {
    if (folded[i]) {
      continue;
    }
    keyed.emplace_back(
        bucket_key_t{records[i].media,
                     size_class(records[i].size,
                                thresholds.size_class_tolerance_pct)},
        i);
  }
  if (keyed.empty()) {
    return part;
  }
  std::sort(keyed.begin(), keyed.end(), [&](const auto &lhs, const auto &rhs) {
    if (lhs.first != rhs.first) {
      return lhs.first < rhs.first;
    }
    return records[lhs.second].id < records[rhs.second].id;
  });

  auto union_st = keyed.begin();
  auto union_ed = union_st + 1;
  while (true) {
    if (union_ed == keyed.end() || union_ed->first != union_st->first) {
      auto &bucket = part.buckets.emplace_back();
      bucket.key = union_st->first;
      for (; union_st != union_ed; ++union_st) {
        const auto &rec = records[union_st->second];
        if (is_visual(rec.media) && rec.has_codes()) {
          bucket.hashed.push_back(union_st->second);
        } else {
          bucket.hashless.push_back(union_st->second);
        }
      }
      if (union_ed == keyed.end()) {
        break;
      }
    }
    ++union_ed;
  }
  return part;
}

}  // namespace detail_v1

}  // namespace mediadup
