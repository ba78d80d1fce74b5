#pragma once

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>

#include "file_record.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief malformed manifest row
 */
class manifest_error : public std::runtime_error {
  std::size_t _line;

 public:
  manifest_error(std::size_t line, const std::string &what)
      : std::runtime_error("manifest line " + std::to_string(line) + ": " +
                           what),
        _line(line) {}

  inline std::size_t line() const noexcept { return _line; }
};

/**
 * @brief reads tab-separated file records.
 *
 * Columns: id, media, size, checksum, codes, duration, name, capture, width,
 * height, bitrate, gps, secondary, partial. Only the first four are
 * required; "-" marks an absent value. Codes and the secondary hash are hex,
 * codes comma-separated in keyframe order. Blank lines and lines starting
 * with '#' are skipped.
 *
 * @throws manifest_error naming the offending line
 */
file_record_vec parse_manifest(std::istream &is);

}  // namespace detail_v1

}  // namespace mediadup
