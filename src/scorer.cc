#include "mediadup/scorer.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

#include "mediadup/neighbor_index.hh"
#include "mediadup/text.hh"

namespace mediadup {

inline namespace detail_v1 {

namespace {

bool is_counter(std::string_view token, std::size_t max_digits) {
  if (token.empty() || token.size() > max_digits) {
    return false;
  }
  return std::all_of(token.begin(), token.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  });
}

// "(3)" style variant marker
bool is_paren_counter(std::string_view token) {
  return token.size() >= 3 && token.front() == '(' && token.back() == ')' &&
         is_counter(token.substr(1, token.size() - 2), 3);
}

std::string_view strip_extension(std::string_view file_name) {
  auto slash = file_name.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    file_name.remove_prefix(slash + 1);
  }
  auto dot = file_name.rfind('.');
  if (dot != std::string_view::npos && dot != 0) {
    file_name = file_name.substr(0, dot);
  }
  return file_name;
}

}  // namespace

std::string file_extension(std::string_view file_name) {
  auto stem = strip_extension(file_name);
  auto slash = file_name.find_last_of("/\\");
  auto base = slash == std::string_view::npos ? file_name
                                              : file_name.substr(slash + 1);
  if (stem.size() >= base.size()) {
    return {};
  }
  return to_lower(base.substr(stem.size() + 1));
}

std::string normalize_stem(std::string_view file_name) {
  auto stem = to_lower(strip_extension(file_name));
  for (auto &c : stem) {
    if (c == '_' || c == '-' || c == '.') {
      c = ' ';
    }
  }
  // "(1)" glued to the name still counts as a variant marker
  std::string spaced;
  spaced.reserve(stem.size() + 4);
  for (auto c : stem) {
    if (c == '(') {
      spaced += ' ';
    }
    spaced += c;
  }

  std::vector<std::string> tokens;
  std::istringstream is(spaced);
  for (std::string token; is >> token;) {
    if (token == "copy" || is_paren_counter(token)) {
      continue;
    }
    tokens.push_back(std::move(token));
  }
  if (tokens.size() > 1 && is_counter(tokens.back(), 2)) {
    tokens.pop_back();
  }

  std::string out;
  for (const auto &token : tokens) {
    if (!out.empty()) {
      out += ' ';
    }
    out += token;
  }
  return out;
}

double jaro_winkler(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.empty() && rhs.empty()) {
    return 1.0;
  }
  if (lhs.empty() || rhs.empty()) {
    return 0.0;
  }
  const auto len_l = lhs.size();
  const auto len_r = rhs.size();
  const std::size_t half = std::max(len_l, len_r) / 2;
  const std::size_t window = half > 0 ? half - 1 : 0;

  std::vector<bool> match_l(len_l, false);
  std::vector<bool> match_r(len_r, false);
  std::size_t matches = 0;
  for (std::size_t i = 0; i < len_l; ++i) {
    std::size_t start = i > window ? i - window : 0;
    auto end = std::min(i + window + 1, len_r);
    for (auto j = start; j < end; ++j) {
      if (match_r[j] || lhs[i] != rhs[j]) {
        continue;
      }
      match_l[i] = true;
      match_r[j] = true;
      ++matches;
      break;
    }
  }
  if (matches == 0) {
    return 0.0;
  }

  std::size_t transpositions = 0;
  std::size_t k = 0;
  for (std::size_t i = 0; i < len_l; ++i) {
    if (!match_l[i]) {
      continue;
    }
    while (!match_r[k]) {
      ++k;
    }
    if (lhs[i] != rhs[k]) {
      ++transpositions;
    }
    ++k;
  }

  const auto m = static_cast<double>(matches);
  const auto jaro = (m / static_cast<double>(len_l) +
                     m / static_cast<double>(len_r) +
                     (m - static_cast<double>(transpositions) / 2.0) / m) /
                    3.0;

  std::size_t prefix = 0;
  while (prefix < 4 && prefix < len_l && prefix < len_r &&
         lhs[prefix] == rhs[prefix]) {
    ++prefix;
  }
  return jaro + static_cast<double>(prefix) * 0.1 * (1.0 - jaro);
}

std::optional<double> name_similarity(std::string_view lhs_name,
                                      std::string_view rhs_name) {
  auto lhs = normalize_stem(lhs_name);
  auto rhs = normalize_stem(rhs_name);
  if (lhs.empty() || rhs.empty()) {
    return std::nullopt;
  }
  return jaro_winkler(lhs, rhs);
}

double hash_raw_score(uint32_t distance, uint32_t ceiling) noexcept {
  auto raw = 1.0 - static_cast<double>(distance) /
                       static_cast<double>(std::max(ceiling, 1U));
  return std::clamp(raw, 0.0, 1.0);
}

double capture_raw_score(double delta_sec, double window_sec) noexcept {
  if (delta_sec <= window_sec) {
    return 1.0;
  }
  return std::clamp(window_sec / delta_sec, 0.0, 1.0);
}

double duration_raw_score(double delta_pct, double tolerance_pct) noexcept {
  if (delta_pct <= tolerance_pct) {
    return 1.0;
  }
  if (tolerance_pct <= 0.0) {
    return 0.0;
  }
  return std::clamp(1.0 - (delta_pct - tolerance_pct) / tolerance_pct, 0.0,
                    1.0);
}

namespace {

double ratio_similarity(double lhs, double rhs) noexcept {
  return 1.0 - std::fabs(lhs - rhs) / std::max(lhs, rhs);
}

}  // namespace

std::optional<double> metadata_similarity(const file_record_t &lhs,
                                          const file_record_t &rhs) noexcept {
  double sum = 0.0;
  int parts = 0;
  if (lhs.size > 0 && rhs.size > 0) {
    sum += ratio_similarity(static_cast<double>(lhs.size),
                            static_cast<double>(rhs.size));
    ++parts;
  }
  if (lhs.width > 0 && lhs.height > 0 && rhs.width > 0 && rhs.height > 0) {
    sum += ratio_similarity(lhs.width, rhs.width);
    sum += ratio_similarity(lhs.height, rhs.height);
    parts += 2;
  }
  if (parts == 0) {
    return std::nullopt;
  }
  return sum / parts;
}

pair_measure_t measure_pair(const candidate_pair_t &pair,
                            std::span<const file_record_t> records) {
  const auto &lhs = records[pair.a];
  const auto &rhs = records[pair.b];
  pair_measure_t m;
  m.pair = pair;
  m.media = lhs.media;
  m.partial = lhs.partial || rhs.partial;

  m.checksum_known = !lhs.checksum.empty() && !rhs.checksum.empty();
  m.checksum_equal =
      m.checksum_known && lhs.checksum == rhs.checksum && lhs.size == rhs.size;

  auto same_media = lhs.media == rhs.media;
  m.hash_applicable = same_media && is_visual(lhs.media);
  if (m.hash_applicable && lhs.has_codes() && rhs.has_codes()) {
    const auto &codes_l = lhs.perceptual_hash->codes;
    const auto &codes_r = rhs.perceptual_hash->codes;
    if (lhs.media == media_t::video) {
      auto frames = std::min(codes_l.size(), codes_r.size());
      uint32_t worst = 0;
      for (std::size_t i = 0; i < frames; ++i) {
        worst = std::max(worst, hamming(codes_l[i], codes_r[i]));
      }
      m.distance = worst;
      m.pair.frames = static_cast<uint32_t>(frames);
      m.pair.truncated = codes_l.size() != codes_r.size();
    } else {
      m.distance = hamming(codes_l.front(), codes_r.front());
    }
  }
  if (lhs.secondary_hash.has_value() && rhs.secondary_hash.has_value()) {
    m.secondary_distance = hamming(*lhs.secondary_hash, *rhs.secondary_hash);
  }

  m.name_similarity = name_similarity(lhs.file_name, rhs.file_name);

  if (lhs.capture_time.has_value() && rhs.capture_time.has_value()) {
    m.capture_delta_sec = std::fabs(static_cast<double>(*lhs.capture_time) -
                                    static_cast<double>(*rhs.capture_time));
  }

  m.duration_applicable =
      same_media && (lhs.media == media_t::video || lhs.media == media_t::audio);
  auto dur_l = lhs.effective_duration();
  auto dur_r = rhs.effective_duration();
  if (m.duration_applicable && dur_l.has_value() && dur_r.has_value()) {
    m.duration_delta_pct =
        std::fabs(*dur_l - *dur_r) / std::max(*dur_l, *dur_r);
  }

  m.metadata_similarity = metadata_similarity(lhs, rhs);
  return m;
}

breakdown_t score_pair(const pair_measure_t &m, const thresholds_t &th) {
  breakdown_t bd;
  const auto &w = th.weights;
  const auto &p = th.penalties;

  if (m.checksum_equal) {
    bd.signals.push_back(
        signal_t::make(signal_key_t::checksum, w.checksum, 1.0, "checksum match"));
    bd.confidence = 1.0;
    return bd;
  }

  if (m.pair.policy.has_value() &&
      policy_enabled(*m.pair.policy, th.policies)) {
    auto policy = *m.pair.policy;
    auto raw = w.policy > 0.0 ? std::min(1.0, policy_bonus(policy) / w.policy)
                              : 0.0;
    bd.signals.push_back(signal_t::make(signal_key_t::policy, w.policy, raw,
                                        std::string(to_string(policy))));
    bd.confidence = aggregate(bd.signals, bd.penalties);
    return bd;
  }

  if (m.checksum_known) {
    bd.signals.push_back(signal_t::make(signal_key_t::checksum, w.checksum, 0.0,
                                        "checksum mismatch"));
  } else {
    bd.penalties.push_back(
        {penalty_key_t::checksum_missing, p.checksum_missing, "checksum missing"});
  }

  if (m.hash_applicable) {
    if (m.distance.has_value()) {
      std::string rationale =
          m.media == media_t::video
              ? "max frame distance=" + std::to_string(*m.distance) + " over " +
                    std::to_string(m.pair.frames) + " frames"
              : "dHash distance=" + std::to_string(*m.distance);
      bd.signals.push_back(signal_t::make(
          signal_key_t::hash, w.hash,
          hash_raw_score(*m.distance, th.hash_score_ceiling),
          std::move(rationale)));
    } else {
      bd.penalties.push_back({penalty_key_t::hash_missing, p.hash_missing,
                              m.media == media_t::video
                                  ? "video signature missing"
                                  : "image hash missing"});
    }
  }

  if (m.name_similarity.has_value()) {
    bd.signals.push_back(signal_t::make(
        signal_key_t::name, w.name, *m.name_similarity,
        "name similarity=" + to_fixed(*m.name_similarity, 2)));
  } else {
    bd.penalties.push_back(
        {penalty_key_t::name_missing, p.name_missing, "file name missing"});
  }

  if (m.capture_delta_sec.has_value()) {
    bd.signals.push_back(signal_t::make(
        signal_key_t::capture_time, w.capture_time,
        capture_raw_score(*m.capture_delta_sec, th.capture_window_sec),
        "capture delta=" + to_fixed(*m.capture_delta_sec, 2) + "s"));
  } else {
    bd.penalties.push_back({penalty_key_t::capture_time_missing,
                            p.capture_time_missing, "capture time missing"});
  }

  if (m.duration_applicable) {
    if (m.duration_delta_pct.has_value()) {
      bd.signals.push_back(signal_t::make(
          signal_key_t::duration, w.duration,
          duration_raw_score(*m.duration_delta_pct, th.duration_tolerance_pct),
          "duration delta=" + to_fixed(*m.duration_delta_pct * 100.0, 2) + "%"));
    } else {
      bd.penalties.push_back({penalty_key_t::duration_missing,
                              p.duration_missing, "duration missing"});
    }
  }

  if (m.metadata_similarity.has_value()) {
    bd.signals.push_back(signal_t::make(
        signal_key_t::metadata, w.metadata, *m.metadata_similarity,
        "metadata similarity=" + to_fixed(*m.metadata_similarity, 2)));
  }

  bd.confidence = aggregate(bd.signals, bd.penalties);
  return bd;
}

}  // namespace detail_v1

}  // namespace mediadup
