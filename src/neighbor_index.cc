#include "mediadup/neighbor_index.hh"

#include <algorithm>
#include <stdexcept>

namespace mediadup {

inline namespace detail_v1 {

void bk_tree_t::insert(uint64_t code, uint32_t ref) {
  ++_size;
  if (_nodes.empty()) {
    _nodes.push_back(node_t{code, {ref}, {}});
    return;
  }
  uint32_t cur = 0;
  uint32_t level = 0;
  while (true) {
    auto dist = hamming(code, _nodes[cur].code);
    if (dist == 0) {
      _nodes[cur].refs.push_back(ref);
      return;
    }
    auto &children = _nodes[cur].children;
    auto it = std::find_if(children.begin(), children.end(),
                           [dist](const auto &edge) { return edge.first == dist; });
    ++level;
    if (it == children.end()) {
      auto idx = static_cast<uint32_t>(_nodes.size());
      // children may be invalidated by the push below
      children.emplace_back(dist, idx);
      _nodes.push_back(node_t{code, {ref}, {}});
      _depth = std::max(_depth, level);
      return;
    }
    cur = it->second;
  }
}

void neighbor_index_t::degrade() noexcept {
  _linear = true;
  _tree.clear();
}

void neighbor_index_t::insert(uint64_t code, uint32_t ref) {
  if (_frozen) {
    throw std::logic_error("neighbor_index_t: insert after freeze");
  }
  _flat.emplace_back(code, ref);
  if (_linear) {
    return;
  }
  if (_flat.size() > _size_ceiling) {
    degrade();
    return;
  }
  _tree.insert(code, ref);
  if (_tree.depth() > _depth_ceiling) {
    degrade();
  }
}

std::vector<uint32_t> neighbor_index_t::query(uint64_t code,
                                              uint32_t radius) const {
  std::vector<uint32_t> refs;
  query(code, radius, [&refs](uint32_t ref, uint32_t) { refs.push_back(ref); });
  return refs;
}

}  // namespace detail_v1

}  // namespace mediadup
