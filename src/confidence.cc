#include "mediadup/confidence.hh"

#include <algorithm>
#include <utility>

namespace mediadup {

inline namespace detail_v1 {

std::string_view to_string(signal_key_t key) noexcept {
  switch (key) {
    case signal_key_t::checksum:
      return "checksum";
    case signal_key_t::hash:
      return "hash";
    case signal_key_t::name:
      return "name";
    case signal_key_t::capture_time:
      return "captureTime";
    case signal_key_t::duration:
      return "duration";
    case signal_key_t::metadata:
      return "metadata";
    case signal_key_t::policy:
      return "policy";
  }
  return "unknown";
}

std::string_view to_string(penalty_key_t key) noexcept {
  switch (key) {
    case penalty_key_t::checksum_missing:
      return "checksumMissing";
    case penalty_key_t::hash_missing:
      return "hashMissing";
    case penalty_key_t::name_missing:
      return "nameMissing";
    case penalty_key_t::capture_time_missing:
      return "captureTimeMissing";
    case penalty_key_t::duration_missing:
      return "durationMissing";
  }
  return "unknown";
}

signal_key_t penalized_signal(penalty_key_t key) noexcept {
  switch (key) {
    case penalty_key_t::checksum_missing:
      return signal_key_t::checksum;
    case penalty_key_t::hash_missing:
      return signal_key_t::hash;
    case penalty_key_t::name_missing:
      return signal_key_t::name;
    case penalty_key_t::capture_time_missing:
      return signal_key_t::capture_time;
    case penalty_key_t::duration_missing:
      return signal_key_t::duration;
  }
  return signal_key_t::hash;
}

std::optional<penalty_key_t> missing_penalty(signal_key_t key) noexcept {
  switch (key) {
    case signal_key_t::checksum:
      return penalty_key_t::checksum_missing;
    case signal_key_t::hash:
      return penalty_key_t::hash_missing;
    case signal_key_t::name:
      return penalty_key_t::name_missing;
    case signal_key_t::capture_time:
      return penalty_key_t::capture_time_missing;
    case signal_key_t::duration:
      return penalty_key_t::duration_missing;
    case signal_key_t::metadata:
    case signal_key_t::policy:
      break;
  }
  return std::nullopt;
}

signal_t signal_t::make(signal_key_t key, double weight, double raw_score,
                        std::string rationale) {
  raw_score = std::clamp(raw_score, 0.0, 1.0);
  return signal_t{key, weight, raw_score, weight * raw_score,
                  std::move(rationale)};
}

double aggregate(const std::vector<signal_t> &signals,
                 const std::vector<penalty_t> &penalties) noexcept {
  double sum = 0.0;
  for (const auto &signal : signals) {
    sum += signal.contribution;
  }
  for (const auto &penalty : penalties) {
    sum += penalty.value;
  }
  return std::clamp(sum, 0.0, 1.0);
}

}  // namespace detail_v1

}  // namespace mediadup
