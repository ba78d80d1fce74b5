#include "mediadup/policy.hh"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <utility>

#include "mediadup/scorer.hh"

namespace mediadup {

inline namespace detail_v1 {

namespace {

using stem_entry_t = std::pair<std::string, uint32_t>;
using stem_iter_t = std::vector<stem_entry_t>::const_iterator;

bool is_jpeg(std::string_view ext) noexcept {
  return ext == "jpg" || ext == "jpeg";
}

bool is_live_still(std::string_view ext) noexcept {
  return ext == "heic" || ext == "heif";
}

bool is_live_clip(std::string_view ext) noexcept {
  return ext == "mov" || ext == "mp4";
}

bool is_sidecar(std::string_view ext) noexcept { return ext == "xmp"; }

template <typename Lhs, typename Rhs>
bool either_way(std::string_view lhs, std::string_view rhs, Lhs &&is_l,
                Rhs &&is_r) {
  return (is_l(lhs) && is_r(rhs)) || (is_l(rhs) && is_r(lhs));
}

std::optional<policy_t> link_of(std::string_view lhs, std::string_view rhs,
                                const policies_t &policies) {
  if (policies.raw_jpeg && either_way(lhs, rhs, is_raw_extension, is_jpeg)) {
    return policy_t::raw_jpeg;
  }
  if (policies.live_photo &&
      either_way(lhs, rhs, is_live_still, is_live_clip)) {
    return policy_t::live_photo;
  }
  if (policies.sidecar && is_sidecar(lhs) != is_sidecar(rhs)) {
    return policy_t::sidecar;
  }
  return std::nullopt;
}

// every pair of one stem run
void link_run(stem_iter_t union_st, stem_iter_t union_ed,
              std::span<const file_record_t> records,
              const thresholds_t &thresholds, policy_links_t &out) {
  const auto budget = thresholds.limits.max_comparisons_per_bucket;
  std::vector<std::string> exts;
  exts.reserve(static_cast<std::size_t>(std::distance(union_st, union_ed)));
  for (auto it = union_st; it != union_ed; ++it) {
    exts.push_back(file_extension(records[it->second].file_name));
  }
  uint64_t checks = 0;
  for (std::size_t i = 0; i < exts.size(); ++i) {
    for (std::size_t j = i + 1; j < exts.size(); ++j) {
      if (budget > 0 && checks >= budget) {
        out.capped = true;
        return;
      }
      ++checks;
      auto policy = link_of(exts[i], exts[j], thresholds.policies);
      if (!policy.has_value()) {
        continue;
      }
      auto a = (union_st + static_cast<std::ptrdiff_t>(i))->second;
      auto b = (union_st + static_cast<std::ptrdiff_t>(j))->second;
      if (thresholds.is_ignored(records[a].id, records[b].id)) {
        ++out.ignored;
        continue;
      }
      out.links.push_back({std::min(a, b), std::max(a, b), *policy});
    }
  }
}

}  // namespace

std::string_view to_string(policy_t policy) noexcept {
  switch (policy) {
    case policy_t::raw_jpeg:
      return "policy.raw-jpeg";
    case policy_t::live_photo:
      return "policy.live-photo";
    case policy_t::sidecar:
      return "policy.sidecar";
  }
  return "policy.unknown";
}

double policy_bonus(policy_t policy) noexcept {
  switch (policy) {
    case policy_t::raw_jpeg:
      return 0.05;
    case policy_t::live_photo:
      return 0.03;
    case policy_t::sidecar:
      return 0.02;
  }
  return 0.0;
}

bool policy_enabled(policy_t policy, const policies_t &policies) noexcept {
  switch (policy) {
    case policy_t::raw_jpeg:
      return policies.raw_jpeg;
    case policy_t::live_photo:
      return policies.live_photo;
    case policy_t::sidecar:
      return policies.sidecar;
  }
  return false;
}

bool is_raw_extension(std::string_view ext) noexcept {
  static constexpr std::array<std::string_view, 13> raws{
      "raw", "cr2", "cr3", "nef", "nrw", "arw", "dng",
      "orf", "pef", "rw2", "raf", "sr2", "srw"};
  return std::find(raws.begin(), raws.end(), ext) != raws.end();
}

policy_links_t find_policy_links(std::span<const file_record_t> records,
                                 const thresholds_t &thresholds) {
  policy_links_t out;
  const auto &policies = thresholds.policies;
  if (!policies.raw_jpeg && !policies.live_photo && !policies.sidecar) {
    return out;
  }

  std::vector<stem_entry_t> stems;
  stems.reserve(records.size());
  for (uint32_t i = 0; i < records.size(); ++i) {
    auto stem = normalize_stem(records[i].file_name);
    if (!stem.empty()) {
      stems.emplace_back(std::move(stem), i);
    }
  }
  std::sort(stems.begin(), stems.end());

  auto union_st = stems.cbegin();
  while (union_st != stems.cend()) {
    auto union_ed = std::find_if(union_st, stems.cend(), [&](const auto &e) {
      return e.first != union_st->first;
    });
    if (std::distance(union_st, union_ed) > 1) {
      link_run(union_st, union_ed, records, thresholds, out);
    }
    union_st = union_ed;
  }

  std::sort(out.links.begin(), out.links.end(),
            [](const auto &lhs, const auto &rhs) {
              return std::pair(lhs.a, lhs.b) < std::pair(rhs.a, rhs.b);
            });
  out.links.erase(std::unique(out.links.begin(), out.links.end(),
                              [](const auto &lhs, const auto &rhs) {
                                return lhs.a == rhs.a && lhs.b == rhs.b;
                              }),
                  out.links.end());
  return out;
}

}  // namespace detail_v1

}  // namespace mediadup
