#include "mediadup/file_record.hh"

namespace mediadup {

inline namespace detail_v1 {

std::string_view to_string(media_t media) noexcept {
  switch (media) {
    case media_t::photo:
      return "photo";
    case media_t::video:
      return "video";
    case media_t::audio:
      return "audio";
    case media_t::document:
      return "document";
  }
  return "unknown";
}

std::optional<media_t> parse_media(std::string_view str) noexcept {
  if (str == "photo") {
    return media_t::photo;
  } else if (str == "video") {
    return media_t::video;
  } else if (str == "audio") {
    return media_t::audio;
  } else if (str == "document") {
    return media_t::document;
  }
  return std::nullopt;
}

}  // namespace detail_v1

}  // namespace mediadup
