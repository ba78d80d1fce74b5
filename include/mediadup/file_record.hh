#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediadup {

inline namespace detail_v1 {

enum class media_t : uint8_t { photo, video, audio, document };

using file_id_t = std::string;

std::string_view to_string(media_t media) noexcept;

/**
 * @brief parse "photo", "video", "audio" or "document"
 *
 * @return std::nullopt for anything else
 */
std::optional<media_t> parse_media(std::string_view str) noexcept;

// photo and video records are expected to carry perceptual codes
inline constexpr bool is_visual(media_t media) noexcept {
  return media == media_t::photo || media == media_t::video;
}

/**
 * @brief already computed perceptual fingerprint
 *
 * photo: one dHash code; video: one code per keyframe in playback order
 */
struct perceptual_hash_t {
  std::vector<uint64_t> codes;
  double duration = 0.0;
};

/**
 * @brief one scanned file as delivered by the metadata collaborator,
 * read-only to the engine.
 */
struct file_record_t {
  file_id_t id;
  media_t media = media_t::photo;
  uint64_t size = 0;
  // empty when extraction failed
  std::string checksum;
  // absent when extraction failed upstream
  std::optional<perceptual_hash_t> perceptual_hash;
  // alternate algorithm (e.g. pHash) for boundary confirmation
  std::optional<uint64_t> secondary_hash;
  std::string file_name;
  // unix seconds
  std::optional<int64_t> capture_time;
  // audio duration, video duration when no perceptual hash
  std::optional<double> duration;
  uint32_t width = 0;
  uint32_t height = 0;
  uint64_t bitrate = 0;
  bool has_gps = false;
  // extraction timed out or was truncated upstream
  bool partial = false;

  inline bool has_codes() const noexcept {
    return perceptual_hash.has_value() && !perceptual_hash->codes.empty();
  }
  inline std::optional<double> effective_duration() const noexcept {
    if (perceptual_hash.has_value() && perceptual_hash->duration > 0.0) {
      return perceptual_hash->duration;
    }
    if (duration.has_value() && *duration > 0.0) {
      return duration;
    }
    return std::nullopt;
  }
};

using file_record_vec = std::vector<file_record_t>;

}  // namespace detail_v1

}  // namespace mediadup
