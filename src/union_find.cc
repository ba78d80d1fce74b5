#include "mediadup/union_find.hh"

#include <numeric>
#include <utility>

namespace mediadup {

inline namespace detail_v1 {

union_find_t::union_find_t(std::size_t n)
    : _parent(n), _rank(n, 0), _set_count(n) {
  std::iota(_parent.begin(), _parent.end(), 0U);
}

uint32_t union_find_t::find(uint32_t x) noexcept {
  auto root = x;
  while (_parent[root] != root) {
    root = _parent[root];
  }
  // compress
  while (_parent[x] != root) {
    auto next = _parent[x];
    _parent[x] = root;
    x = next;
  }
  return root;
}

bool union_find_t::unite(uint32_t lhs, uint32_t rhs) noexcept {
  lhs = find(lhs);
  rhs = find(rhs);
  if (lhs == rhs) {
    return false;
  }
  if (_rank[lhs] < _rank[rhs]) {
    std::swap(lhs, rhs);
  }
  _parent[rhs] = lhs;
  if (_rank[lhs] == _rank[rhs]) {
    ++_rank[lhs];
  }
  --_set_count;
  return true;
}

}  // namespace detail_v1

}  // namespace mediadup
