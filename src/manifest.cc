#include "mediadup/manifest.hh"

#include <charconv>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace mediadup {

inline namespace detail_v1 {

namespace {

enum column_t : std::size_t {
  col_id,
  col_media,
  col_size,
  col_checksum,
  col_codes,
  col_duration,
  col_name,
  col_capture,
  col_width,
  col_height,
  col_bitrate,
  col_gps,
  col_secondary,
  col_partial,
  col_count
};

constexpr std::size_t required_columns = col_checksum + 1;

std::vector<std::string_view> split(std::string_view line, char sep) {
  std::vector<std::string_view> fields;
  while (true) {
    auto pos = line.find(sep);
    fields.push_back(line.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    line.remove_prefix(pos + 1);
  }
  return fields;
}

inline bool absent(std::string_view field) noexcept {
  return field.empty() || field == "-";
}

class row_parser_t {
  std::size_t _line;
  const std::vector<std::string_view> &_fields;

 public:
  row_parser_t(std::size_t line, const std::vector<std::string_view> &fields)
      : _line(line), _fields(fields) {}

  std::string_view field(column_t col) const noexcept {
    return col < _fields.size() ? _fields[col] : std::string_view{};
  }

  template <typename Tp>
  std::optional<Tp> number(column_t col, int base = 10) const {
    auto str = field(col);
    if (absent(str)) {
      return std::nullopt;
    }
    Tp value{};
    std::from_chars_result res;
    if constexpr (std::is_floating_point_v<Tp>) {
      res = std::from_chars(str.data(), str.data() + str.size(), value);
    } else {
      res = std::from_chars(str.data(), str.data() + str.size(), value, base);
    }
    if (res.ec != std::errc() || res.ptr != str.data() + str.size()) {
      throw manifest_error(_line, "bad value '" + std::string(str) + "'");
    }
    return value;
  }

  bool flag(column_t col) const {
    auto value = number<uint32_t>(col);
    if (value.has_value() && *value > 1) {
      throw manifest_error(_line, "flag must be 0 or 1");
    }
    return value.value_or(0) == 1;
  }

  std::optional<perceptual_hash_t> codes(std::optional<double> duration) const {
    auto str = field(col_codes);
    if (absent(str)) {
      return std::nullopt;
    }
    perceptual_hash_t hash;
    for (auto code : split(str, ',')) {
      uint64_t value = 0;
      auto res = std::from_chars(code.data(), code.data() + code.size(), value,
                                 16);
      if (code.empty() || res.ec != std::errc() ||
          res.ptr != code.data() + code.size()) {
        throw manifest_error(_line, "bad hash code '" + std::string(code) + "'");
      }
      hash.codes.push_back(value);
    }
    hash.duration = duration.value_or(0.0);
    return hash;
  }
};

}  // namespace

file_record_vec parse_manifest(std::istream &is) {
  file_record_vec records;
  std::unordered_set<std::string> seen;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(is, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto fields = split(line, '\t');
    if (fields.size() < required_columns || fields.size() > col_count) {
      throw manifest_error(line_no, "expected " +
                                        std::to_string(required_columns) +
                                        " to " + std::to_string(col_count) +
                                        " columns, got " +
                                        std::to_string(fields.size()));
    }
    row_parser_t row(line_no, fields);

    file_record_t rec;
    rec.id = std::string(row.field(col_id));
    if (absent(rec.id)) {
      throw manifest_error(line_no, "missing id");
    }
    if (!seen.insert(rec.id).second) {
      throw manifest_error(line_no, "duplicate id '" + rec.id + "'");
    }
    auto media = parse_media(row.field(col_media));
    if (!media.has_value()) {
      throw manifest_error(line_no, "unknown media type '" +
                                        std::string(row.field(col_media)) +
                                        "'");
    }
    rec.media = *media;
    auto size = row.number<uint64_t>(col_size);
    if (!size.has_value()) {
      throw manifest_error(line_no, "missing size");
    }
    rec.size = *size;
    if (!absent(row.field(col_checksum))) {
      rec.checksum = std::string(row.field(col_checksum));
    }
    rec.duration = row.number<double>(col_duration);
    rec.perceptual_hash = row.codes(rec.duration);
    if (!absent(row.field(col_name))) {
      rec.file_name = std::string(row.field(col_name));
    }
    rec.capture_time = row.number<int64_t>(col_capture);
    rec.width = row.number<uint32_t>(col_width).value_or(0);
    rec.height = row.number<uint32_t>(col_height).value_or(0);
    rec.bitrate = row.number<uint64_t>(col_bitrate).value_or(0);
    rec.has_gps = row.flag(col_gps);
    rec.secondary_hash = row.number<uint64_t>(col_secondary, 16);
    rec.partial = row.flag(col_partial);
    records.push_back(std::move(rec));
  }
  return records;
}

}  // namespace detail_v1

}  // namespace mediadup
