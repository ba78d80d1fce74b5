#include "mediadup/cluster.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mediadup/group_id.hh"
#include "mediadup/keeper.hh"
#include "mediadup/text.hh"

namespace mediadup {

inline namespace detail_v1 {

namespace {

// absorbs rounding of summed contributions
constexpr auto score_epsilon = 1e-9;

std::string join(const std::vector<std::string> &lines, std::string_view sep) {
  std::string out;
  for (const auto &line : lines) {
    if (!out.empty()) {
      out += sep;
    }
    out += line;
  }
  return out;
}

std::string edge_label(std::span<const file_record_t> records,
                       const candidate_pair_t &pair) {
  const auto &lhs = records[pair.a].id;
  const auto &rhs = records[pair.b].id;
  return lhs < rhs ? lhs + " ~ " + rhs : rhs + " ~ " + lhs;
}

// folds one edge's evidence into a member, max contribution per key
void fold_edge(member_t &member, const breakdown_t &breakdown) {
  member.confidence = std::max(member.confidence, breakdown.confidence);
  for (const auto &signal : breakdown.signals) {
    auto it = std::find_if(
        member.signals.begin(), member.signals.end(),
        [&](const auto &s) { return s.key == signal.key; });
    if (it == member.signals.end()) {
      member.signals.push_back(signal);
    } else if (signal.contribution > it->contribution) {
      *it = signal;
    }
  }
  for (const auto &penalty : breakdown.penalties) {
    auto it = std::find_if(
        member.penalties.begin(), member.penalties.end(),
        [&](const auto &p) { return p.key == penalty.key; });
    if (it == member.penalties.end()) {
      member.penalties.push_back(penalty);
    }
  }
}

// a key is either a signal or a penalty, never both
void settle_member(member_t &member) {
  std::erase_if(member.penalties, [&](const auto &penalty) {
    auto key = penalized_signal(penalty.key);
    return std::any_of(member.signals.begin(), member.signals.end(),
                       [&](const auto &s) { return s.key == key; });
  });
  std::sort(member.signals.begin(), member.signals.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.key < rhs.key; });
  std::sort(
      member.penalties.begin(), member.penalties.end(),
      [](const auto &lhs, const auto &rhs) { return lhs.key < rhs.key; });
}

double group_confidence(const std::vector<member_t> &members,
                        group_confidence_t policy) noexcept {
  if (members.empty()) {
    return 0.0;
  }
  switch (policy) {
    case group_confidence_t::minimum:
      return std::min_element(members.begin(), members.end(),
                              [](const auto &lhs, const auto &rhs) {
                                return lhs.confidence < rhs.confidence;
                              })
          ->confidence;
    case group_confidence_t::maximum:
      return std::max_element(members.begin(), members.end(),
                              [](const auto &lhs, const auto &rhs) {
                                return lhs.confidence < rhs.confidence;
                              })
          ->confidence;
    case group_confidence_t::mean: {
      double sum = 0.0;
      for (const auto &member : members) {
        sum += member.confidence;
      }
      return sum / static_cast<double>(members.size());
    }
  }
  return 0.0;
}

}  // namespace

std::string_view to_string(pair_verdict_t verdict) noexcept {
  switch (verdict) {
    case pair_verdict_t::duplicate:
      return "duplicate";
    case pair_verdict_t::similar:
      return "similar";
    case pair_verdict_t::distinct:
      return "distinct";
  }
  return "unknown";
}

std::string_view to_string(node_state_t state) noexcept {
  switch (state) {
    case node_state_t::unvisited:
      return "unvisited";
    case node_state_t::scored:
      return "scored";
    case node_state_t::merged:
      return "merged";
    case node_state_t::finalized:
      return "finalized";
  }
  return "unknown";
}

pair_verdict_t classify(const pair_measure_t &measure,
                        const breakdown_t &breakdown,
                        const thresholds_t &thresholds) noexcept {
  if (measure.checksum_equal) {
    return pair_verdict_t::duplicate;
  }
  if (measure.pair.policy.has_value() &&
      policy_enabled(*measure.pair.policy, thresholds.policies)) {
    return pair_verdict_t::duplicate;
  }
  if (measure.distance.has_value()) {
    auto dist = *measure.distance;
    auto limit = thresholds.distance_limit(measure.media);
    if (thresholds.confirmation_band.contains(dist)) {
      if (measure.secondary_distance.has_value()) {
        return *measure.secondary_distance <=
                       thresholds.confirmation_hash_distance
                   ? pair_verdict_t::duplicate
                   : pair_verdict_t::similar;
      }
      return dist <= limit ? pair_verdict_t::duplicate
                           : pair_verdict_t::similar;
    }
    return dist <= limit ? pair_verdict_t::duplicate : pair_verdict_t::distinct;
  }
  return breakdown.confidence + score_epsilon >= dup_threshold(thresholds)
             ? pair_verdict_t::duplicate
             : pair_verdict_t::distinct;
}

scored_pair_t evaluate_pair(const pair_measure_t &measure,
                            const thresholds_t &thresholds) {
  scored_pair_t sp;
  sp.measure = measure;
  sp.breakdown = score_pair(measure, thresholds);
  sp.verdict = classify(measure, sp.breakdown, thresholds);

  for (const auto &signal : sp.breakdown.signals) {
    sp.rationale.push_back(std::string(to_string(signal.key)) + ":" +
                           to_fixed(signal.contribution, 2) + " (" +
                           signal.rationale + ")");
  }
  for (const auto &penalty : sp.breakdown.penalties) {
    sp.rationale.push_back("penalty_" + std::string(to_string(penalty.key)) +
                           ":" + to_fixed(penalty.value, 2) + " (" +
                           penalty.rationale + ")");
  }
  if (!measure.checksum_equal && measure.distance.has_value() &&
      thresholds.confirmation_band.contains(*measure.distance)) {
    if (measure.secondary_distance.has_value()) {
      sp.rationale.push_back(
          (sp.verdict == pair_verdict_t::duplicate ? "confirmed"
                                                   : "unconfirmed") +
          std::string(": secondary distance=") +
          std::to_string(*measure.secondary_distance));
    } else {
      sp.rationale.push_back("boundary: distance=" +
                             std::to_string(*measure.distance) +
                             ", no secondary hash");
    }
  }
  if (measure.pair.truncated) {
    sp.rationale.push_back("truncated: compared " +
                           std::to_string(measure.pair.frames) + " frames");
  }
  if (measure.partial) {
    sp.rationale.push_back("partial extraction");
  }
  return sp;
}

cluster_t::cluster_t(std::size_t record_count)
    : _sets(record_count), _state(record_count, node_state_t::unvisited) {}

void cluster_t::observe(const scored_pair_t &pair, uint32_t pair_idx) {
  if (_finalized) {
    throw std::logic_error("cluster already finalized");
  }
  const auto a = pair.measure.pair.a;
  const auto b = pair.measure.pair.b;
  for (auto rec : {a, b}) {
    if (_state[rec] == node_state_t::unvisited) {
      _state[rec] = node_state_t::scored;
    }
  }
  if (pair.verdict != pair_verdict_t::duplicate) {
    return;
  }
  _sets.unite(a, b);
  _state[a] = node_state_t::merged;
  _state[b] = node_state_t::merged;
  _merged_edges.push_back(pair_idx);
}

std::vector<std::vector<uint32_t>> cluster_t::finalize() {
  _finalized = true;
  std::vector<std::pair<uint32_t, uint32_t>> rooted;
  for (uint32_t i = 0; i < _state.size(); ++i) {
    if (_state[i] == node_state_t::merged) {
      rooted.emplace_back(_sets.find(i), i);
    }
  }
  std::sort(rooted.begin(), rooted.end());

  std::vector<std::vector<uint32_t>> classes;
  if (!rooted.empty()) {
    auto union_st = rooted.begin();
    auto union_ed = union_st + 1;
    while (true) {
      if (union_ed == rooted.end() || union_ed->first != union_st->first) {
        if (std::distance(union_st, union_ed) > 1) {
          auto &cls = classes.emplace_back();
          for (auto it = union_st; it != union_ed; ++it) {
            cls.push_back(it->second);
            _state[it->second] = node_state_t::finalized;
          }
        }
        if (union_ed == rooted.end()) {
          break;
        }
        union_st = union_ed;
      }
      ++union_ed;
    }
  }
  std::sort(classes.begin(), classes.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.front() < rhs.front();
            });
  return classes;
}

std::vector<group_result_t> build_groups(
    std::span<const file_record_t> records,
    const std::vector<std::vector<uint32_t>> &classes,
    std::span<const scored_pair_t> pairs,
    std::span<const uint32_t> merged_edges, const thresholds_t &thresholds,
    const scan_gaps_t &gaps) {
  constexpr auto no_class = static_cast<uint32_t>(-1);
  std::vector<uint32_t> class_of(records.size(), no_class);
  for (uint32_t c = 0; c < classes.size(); ++c) {
    for (auto rec : classes[c]) {
      class_of[rec] = c;
    }
  }
  std::vector<std::vector<uint32_t>> class_edges(classes.size());
  for (auto edge : merged_edges) {
    auto cls = class_of[pairs[edge].measure.pair.a];
    if (cls != no_class) {
      class_edges[cls].push_back(edge);
    }
  }

  std::vector<group_result_t> groups;
  groups.reserve(classes.size());
  for (uint32_t c = 0; c < classes.size(); ++c) {
    auto members = classes[c];
    std::sort(members.begin(), members.end(), [&](auto lhs, auto rhs) {
      return records[lhs].id < records[rhs].id;
    });

    auto &group = groups.emplace_back();
    group.media = records[members.front()].media;
    group.incomplete = gaps.any();

    std::vector<file_id_t> ids;
    ids.reserve(members.size());
    for (auto rec : members) {
      const auto &record = records[rec];
      ids.push_back(record.id);
      auto &member = group.members.emplace_back();
      member.file_id = record.id;
      member.file_size = record.size;
      for (auto edge : class_edges[c]) {
        const auto &sp = pairs[edge];
        const auto &pair = sp.measure.pair;
        if (pair.a != rec && pair.b != rec) {
          continue;
        }
        fold_edge(member, sp.breakdown);
        const auto &other = records[pair.a == rec ? pair.b : pair.a];
        member.rationale.push_back(
            "vs " + other.id +
            ": confidence=" + to_fixed(sp.breakdown.confidence, 2) + "; " +
            join(sp.rationale, "; "));
      }
      settle_member(member);
      if (record.partial) {
        member.rationale.push_back("partial extraction");
        group.incomplete = true;
      }
    }

    group.confidence =
        group_confidence(group.members, thresholds.group_confidence);
    group.group_id = group_id(ids);
    group.keeper = suggest_keeper(members, records, thresholds);

    group.rationale_lines.push_back(
        std::to_string(members.size()) + " members, confidence=" +
        to_fixed(group.confidence, 2));
    for (auto edge : class_edges[c]) {
      const auto &sp = pairs[edge];
      group.rationale_lines.push_back(edge_label(records, sp.measure.pair) +
                                      ": " + join(sp.rationale, "; "));
      if (sp.measure.pair.truncated) {
        group.incomplete = true;
      }
    }
    for (auto rec : members) {
      if (records[rec].partial) {
        group.rationale_lines.push_back("partial extraction: " +
                                        records[rec].id);
      }
    }
    if (gaps.cancelled) {
      group.rationale_lines.push_back("scan cancelled, group may be partial");
    }
    if (gaps.time_budget_hit) {
      group.rationale_lines.push_back(
          "time budget exhausted, group may be partial");
    }
    if (gaps.limited) {
      group.rationale_lines.push_back(
          "comparison limits reached, group may be partial");
    }
  }

  std::sort(groups.begin(), groups.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.confidence != rhs.confidence) {
      return lhs.confidence > rhs.confidence;
    }
    return lhs.members.front().file_id < rhs.members.front().file_id;
  });
  return groups;
}

}  // namespace detail_v1

}  // namespace mediadup
