#include "mediadup/evidence.hh"

#include <algorithm>
#include <cmath>

#include "mediadup/text.hh"

namespace mediadup {

inline namespace detail_v1 {

namespace {

constexpr auto pass_above = 0.3;
constexpr auto warn_above = 0.1;

std::string_view label_of(signal_key_t key) noexcept {
  switch (key) {
    case signal_key_t::checksum:
      return "Checksum";
    case signal_key_t::hash:
      return "Hash Distance";
    case signal_key_t::name:
      return "Name";
    case signal_key_t::capture_time:
      return "Capture Date";
    case signal_key_t::duration:
      return "Duration";
    case signal_key_t::metadata:
      return "Metadata";
    case signal_key_t::policy:
      return "Policy";
  }
  return "Unknown";
}

std::string_view label_of(penalty_key_t key) noexcept {
  switch (key) {
    case penalty_key_t::checksum_missing:
      return "Checksum Missing";
    case penalty_key_t::hash_missing:
      return "Hash Missing";
    case penalty_key_t::name_missing:
      return "Name Missing";
    case penalty_key_t::capture_time_missing:
      return "Capture Date Missing";
    case penalty_key_t::duration_missing:
      return "Duration Missing";
  }
  return "Unknown Missing";
}

std::string percent(double ratio) { return to_compact(ratio * 100.0, 1) + "%"; }

std::string distance_text(const signal_t &signal) {
  switch (signal.key) {
    case signal_key_t::checksum:
      return signal.raw_score >= 1.0 ? "0" : "1";
    case signal_key_t::hash:
      if (auto d = number_after(signal.rationale, "distance="); d.has_value()) {
        return to_compact(*d, 0);
      }
      break;
    case signal_key_t::name:
      return percent(signal.raw_score);
    case signal_key_t::capture_time:
      if (auto d = number_after(signal.rationale, "delta="); d.has_value()) {
        return format_seconds(*d);
      }
      break;
    case signal_key_t::duration:
      if (auto d = number_after(signal.rationale, "delta="); d.has_value()) {
        return to_compact(*d, 2) + "%";
      }
      break;
    case signal_key_t::metadata:
      return percent(signal.raw_score);
    case signal_key_t::policy:
      return signal.rationale;
  }
  // rationale carried no number, fall back to the match strength
  return percent(signal.raw_score);
}

std::string threshold_text(signal_key_t key, media_t media,
                           const thresholds_t &thresholds) {
  switch (key) {
    case signal_key_t::checksum:
      return "0";
    case signal_key_t::hash:
      return std::to_string(thresholds.distance_limit(media));
    case signal_key_t::name:
      return percent(thresholds.name_similarity_threshold);
    case signal_key_t::capture_time:
      return format_seconds(thresholds.capture_window_sec);
    case signal_key_t::duration:
      return percent(thresholds.duration_tolerance_pct);
    case signal_key_t::metadata:
    case signal_key_t::policy:
      return "-";
  }
  return {};
}

std::vector<evidence_item_t> to_items(const std::vector<signal_t> &signals,
                                      const std::vector<penalty_t> &penalties,
                                      media_t media,
                                      const thresholds_t &thresholds) {
  std::vector<evidence_item_t> items;
  items.reserve(signals.size() + penalties.size());
  for (const auto &signal : signals) {
    bool penalized = std::any_of(
        penalties.begin(), penalties.end(),
        [&](const auto &p) { return penalized_signal(p.key) == signal.key; });
    items.push_back({std::string(to_string(signal.key)),
                     std::string(label_of(signal.key)), distance_text(signal),
                     threshold_text(signal.key, media, thresholds),
                     verdict_for(signal.contribution, penalized),
                     signal.contribution});
  }
  for (const auto &penalty : penalties) {
    items.push_back({"penalty_" + std::string(to_string(penalty.key)),
                     std::string(label_of(penalty.key)), "missing", "required",
                     verdict_t::fail, penalty.value});
  }
  std::stable_sort(items.begin(), items.end(),
                   [](const auto &lhs, const auto &rhs) {
                     return lhs.contribution > rhs.contribution;
                   });
  return items;
}

}  // namespace

std::string_view to_string(verdict_t verdict) noexcept {
  switch (verdict) {
    case verdict_t::pass:
      return "pass";
    case verdict_t::warn:
      return "warn";
    case verdict_t::fail:
      return "fail";
  }
  return "unknown";
}

std::string to_line(const evidence_item_t &item) {
  return "[" + std::string(to_string(item.verdict)) + "] " + item.label +
         ": " + item.distance_text + " / " + item.threshold_text;
}

verdict_t verdict_for(double contribution, bool penalized) noexcept {
  if (penalized) {
    return verdict_t::fail;
  }
  if (contribution > pass_above) {
    return verdict_t::pass;
  }
  if (contribution > warn_above) {
    return verdict_t::warn;
  }
  return verdict_t::fail;
}

std::string format_seconds(double seconds) {
  seconds = std::fabs(seconds);
  if (seconds < 60.0) {
    return to_compact(seconds, 1) + "s";
  }
  if (seconds < 3600.0) {
    return to_compact(seconds / 60.0, 1) + "m";
  }
  if (seconds < 86400.0) {
    return to_compact(seconds / 3600.0, 1) + "h";
  }
  return to_compact(seconds / 86400.0, 1) + "d";
}

std::vector<evidence_item_t> format_evidence(const member_t &member,
                                             media_t media,
                                             const thresholds_t &thresholds) {
  return to_items(member.signals, member.penalties, media, thresholds);
}

std::vector<evidence_item_t> format_evidence(const group_result_t &group,
                                             const thresholds_t &thresholds) {
  std::vector<signal_t> signals;
  std::vector<penalty_t> penalties;
  for (const auto &member : group.members) {
    for (const auto &signal : member.signals) {
      auto it = std::find_if(signals.begin(), signals.end(),
                             [&](const auto &s) { return s.key == signal.key; });
      if (it == signals.end()) {
        signals.push_back(signal);
      } else if (signal.contribution > it->contribution) {
        *it = signal;
      }
    }
    for (const auto &penalty : member.penalties) {
      auto it =
          std::find_if(penalties.begin(), penalties.end(),
                       [&](const auto &p) { return p.key == penalty.key; });
      if (it == penalties.end()) {
        penalties.push_back(penalty);
      }
    }
  }
  return to_items(signals, penalties, group.media, thresholds);
}

}  // namespace detail_v1

}  // namespace mediadup
