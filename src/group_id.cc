#include "mediadup/group_id.hh"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "mediadup/config.hh"

namespace mediadup {

inline namespace detail_v1 {

hasher_t::hasher_t() {
  _state = XXH3_createState();
  if (_state == nullptr) {
    throw std::runtime_error("XXH3_createState failed");
  }
}

hasher_t::~hasher_t() noexcept {
  if (_state != nullptr) {
    XXH3_freeState(_state);
  }
}

void hasher_t::reset() {
  if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
    throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
  }
}

void hasher_t::update(const void *data, const std::size_t size) {
  if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
    throw std::runtime_error("XXH3_128bits_update failed");
  }
}

std::string group_id(std::span<const file_id_t> ids) {
  hasher_t hasher;
  hasher.reset();
  for (const auto &id : ids) {
    // length prefix keeps {"ab","c"} apart from {"a","bc"}
    uint64_t len = id.size();
    hasher.update(&len, sizeof(len));
    hasher.update(id.data(), id.size());
  }
  auto digest = hasher.digest();
  std::ostringstream os;
  os << std::hex << std::setfill('0') << std::setw(16) << digest.high64
     << std::setw(16) << digest.low64;
  return os.str();
}

}  // namespace detail_v1

}  // namespace mediadup
