#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief disjoint sets over [0, n) with path compression and union by rank.
 * Single writer.
 */
class union_find_t {
  std::vector<uint32_t> _parent;
  std::vector<uint8_t> _rank;
  std::size_t _set_count;

 public:
  explicit union_find_t(std::size_t n);

  uint32_t find(uint32_t x) noexcept;

  /**
   * @brief merges the sets of lhs and rhs
   *
   * @return false if they were already one set
   */
  bool unite(uint32_t lhs, uint32_t rhs) noexcept;

  inline bool same(uint32_t lhs, uint32_t rhs) noexcept {
    return find(lhs) == find(rhs);
  }
  inline std::size_t size() const noexcept { return _parent.size(); }
  inline std::size_t set_count() const noexcept { return _set_count; }
};

}  // namespace detail_v1

}  // namespace mediadup
