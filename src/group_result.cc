#include "mediadup/group_result.hh"

namespace mediadup {

inline namespace detail_v1 {

uint64_t group_result_t::reclaimable_size() const noexcept {
  uint64_t total = 0;
  for (const auto &member : members) {
    if (keeper.has_value() && member.file_id == *keeper) {
      continue;
    }
    total += member.file_size;
  }
  return total;
}

}  // namespace detail_v1

}  // namespace mediadup
