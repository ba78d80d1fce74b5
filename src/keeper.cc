#include "mediadup/keeper.hh"

#include <algorithm>

#include "mediadup/scorer.hh"

namespace mediadup {

inline namespace detail_v1 {

std::size_t format_rank(std::string_view file_name,
                        const std::vector<std::string> &preference) {
  auto ext = file_extension(file_name);
  if (ext.empty()) {
    return preference.size();
  }
  auto it = std::find(preference.begin(), preference.end(), ext);
  return static_cast<std::size_t>(std::distance(preference.begin(), it));
}

uint32_t metadata_richness(const file_record_t &record) noexcept {
  return (record.capture_time.has_value() ? 1U : 0U) +
         (record.has_gps ? 1U : 0U);
}

bool keeper_before(const file_record_t &lhs, const file_record_t &rhs,
                   const thresholds_t &thresholds) {
  auto pixels_l = static_cast<uint64_t>(lhs.width) * lhs.height;
  auto pixels_r = static_cast<uint64_t>(rhs.width) * rhs.height;
  if (pixels_l != pixels_r) {
    return pixels_l > pixels_r;
  }
  if (lhs.bitrate != rhs.bitrate) {
    return lhs.bitrate > rhs.bitrate;
  }
  auto rank_l = format_rank(lhs.file_name, thresholds.format_preference);
  auto rank_r = format_rank(rhs.file_name, thresholds.format_preference);
  if (rank_l != rank_r) {
    return rank_l < rank_r;
  }
  auto rich_l = metadata_richness(lhs);
  auto rich_r = metadata_richness(rhs);
  if (rich_l != rich_r) {
    return rich_l > rich_r;
  }
  if (lhs.capture_time != rhs.capture_time) {
    if (!rhs.capture_time.has_value()) {
      return true;
    }
    if (!lhs.capture_time.has_value()) {
      return false;
    }
    return *lhs.capture_time < *rhs.capture_time;
  }
  return lhs.id < rhs.id;
}

std::vector<uint32_t> rank_members(std::span<const uint32_t> members,
                                   std::span<const file_record_t> records,
                                   const thresholds_t &thresholds) {
  std::vector<uint32_t> ranked(members.begin(), members.end());
  std::sort(ranked.begin(), ranked.end(), [&](auto lhs, auto rhs) {
    return keeper_before(records[lhs], records[rhs], thresholds);
  });
  return ranked;
}

std::optional<file_id_t> suggest_keeper(std::span<const uint32_t> members,
                                        std::span<const file_record_t> records,
                                        const thresholds_t &thresholds) {
  if (members.empty()) {
    return std::nullopt;
  }
  auto best = *std::min_element(
      members.begin(), members.end(), [&](auto lhs, auto rhs) {
        return keeper_before(records[lhs], records[rhs], thresholds);
      });
  return records[best].id;
}

}  // namespace detail_v1

}  // namespace mediadup
