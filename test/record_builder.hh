#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mediadup/file_record.hh"

namespace mediadup::fixture {

// flips the lowest n bits
inline uint64_t flip_bits(uint64_t code, uint32_t n) {
  auto mask = n >= 64 ? ~0ULL : (1ULL << n) - 1ULL;
  return code ^ mask;
}

inline file_record_t photo(std::string id, std::optional<uint64_t> code,
                           uint64_t size = 2'000'000) {
  file_record_t rec;
  rec.id = std::move(id);
  rec.media = media_t::photo;
  rec.size = size;
  rec.checksum = "sha-" + rec.id;
  if (code.has_value()) {
    rec.perceptual_hash = perceptual_hash_t{{*code}, 0.0};
  }
  rec.file_name = rec.id + ".jpg";
  return rec;
}

inline file_record_t video(std::string id, std::vector<uint64_t> codes,
                           double duration, uint64_t size = 50'000'000) {
  file_record_t rec;
  rec.id = std::move(id);
  rec.media = media_t::video;
  rec.size = size;
  rec.checksum = "sha-" + rec.id;
  rec.perceptual_hash = perceptual_hash_t{std::move(codes), duration};
  rec.file_name = rec.id + ".mov";
  return rec;
}

inline file_record_t document(std::string id, std::string file_name,
                              uint64_t size = 40'000) {
  file_record_t rec;
  rec.id = std::move(id);
  rec.media = media_t::document;
  rec.size = size;
  rec.checksum = "sha-" + rec.id;
  rec.file_name = std::move(file_name);
  return rec;
}

}  // namespace mediadup::fixture
