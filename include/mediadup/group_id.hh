#pragma once

#include <xxhash.h>

#include <span>
#include <string>

#include "file_record.hh"

namespace mediadup {

inline namespace detail_v1 {

// RAII wrapper for xxhash library.
class hasher_t {
  XXH3_state_t *_state;

 public:
  hasher_t();
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const void *data, const std::size_t size);
  XXH128_hash_t digest() noexcept { return XXH3_128bits_digest(_state); }
};

/**
 * @brief stable id of a member set, independent of member order.
 *
 * @param ids member ids, sorted by the caller
 * @return XXH3-128 of the length-prefixed ids as 32 hex digits
 */
std::string group_id(std::span<const file_id_t> ids);

}  // namespace detail_v1

}  // namespace mediadup
