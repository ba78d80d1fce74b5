#pragma once

#include <bit>
#include <cstdint>
#include <utility>
#include <vector>

namespace mediadup {

inline namespace detail_v1 {

inline constexpr uint32_t hamming(uint64_t lhs, uint64_t rhs) noexcept {
  return static_cast<uint32_t>(std::popcount(lhs ^ rhs));
}

/**
 * @brief BK-tree over 64-bit codes under Hamming distance.
 *
 * Nodes live in one arena and refer to children by index. Every child edge
 * is labeled with the exact distance to its parent, so a radius query may
 * skip a subtree only when the triangle inequality rules it out: results are
 * exact. Identical codes share a node.
 */
class bk_tree_t {
  struct node_t {
    uint64_t code;
    std::vector<uint32_t> refs;
    // (distance label, child node index)
    std::vector<std::pair<uint32_t, uint32_t>> children;
  };

  std::vector<node_t> _nodes;
  std::size_t _size = 0;
  uint32_t _depth = 0;

 public:
  bk_tree_t() = default;

  /**
   * @brief insert one code
   *
   * @param code perceptual code
   * @param ref caller payload returned by queries
   */
  void insert(uint64_t code, uint32_t ref);

  /**
   * @brief visit every payload whose code lies within radius
   *
   * @param fn called as fn(ref, distance)
   * @return number of distance evaluations
   */
  template <typename Fn>
  uint64_t query(uint64_t code, uint32_t radius, Fn &&fn) const {
    if (_nodes.empty()) {
      return 0;
    }
    uint64_t evals = 0;
    std::vector<uint32_t> stack{0U};
    while (!stack.empty()) {
      const auto &node = _nodes[stack.back()];
      stack.pop_back();
      auto dist = hamming(code, node.code);
      ++evals;
      if (dist <= radius) {
        for (auto ref : node.refs) {
          fn(ref, dist);
        }
      }
      auto lo = dist > radius ? dist - radius : 0U;
      auto hi = dist + radius;
      for (const auto &[label, child] : node.children) {
        if (label >= lo && label <= hi) {
          stack.push_back(child);
        }
      }
    }
    return evals;
  }

  // payload count
  inline std::size_t size() const noexcept { return _size; }
  // distinct codes
  inline std::size_t node_count() const noexcept { return _nodes.size(); }
  // longest root to leaf path, in edges
  inline uint32_t depth() const noexcept { return _depth; }
  inline void clear() noexcept {
    _nodes.clear();
    _nodes.shrink_to_fit();
    _size = 0;
    _depth = 0;
  }
};

/**
 * @brief per-bucket index with a build-then-freeze discipline.
 *
 * One writer inserts, then freeze() and any number of concurrent readers
 * query. Past the size or depth ceiling the tree is dropped and queries fall
 * back to an exact linear scan.
 */
class neighbor_index_t {
  bk_tree_t _tree;
  std::vector<std::pair<uint64_t, uint32_t>> _flat;
  uint64_t _size_ceiling;
  uint32_t _depth_ceiling;
  bool _linear = false;
  bool _frozen = false;

  void degrade() noexcept;

 public:
  neighbor_index_t(uint64_t size_ceiling, uint32_t depth_ceiling) noexcept
      : _size_ceiling(size_ceiling), _depth_ceiling(depth_ceiling) {}

  /**
   * @throws std::logic_error once frozen
   */
  void insert(uint64_t code, uint32_t ref);
  inline void freeze() noexcept { _frozen = true; }

  template <typename Fn>
  uint64_t query(uint64_t code, uint32_t radius, Fn &&fn) const {
    if (!_linear) {
      return _tree.query(code, radius, std::forward<Fn>(fn));
    }
    for (const auto &[entry_code, ref] : _flat) {
      auto dist = hamming(code, entry_code);
      if (dist <= radius) {
        fn(ref, dist);
      }
    }
    return _flat.size();
  }

  // collected refs, unordered
  std::vector<uint32_t> query(uint64_t code, uint32_t radius) const;

  inline bool frozen() const noexcept { return _frozen; }
  // true after falling back to linear scan
  inline bool degraded() const noexcept { return _linear; }
  inline std::size_t size() const noexcept { return _flat.size(); }
  inline uint32_t depth() const noexcept { return _tree.depth(); }
};

}  // namespace detail_v1

}  // namespace mediadup
