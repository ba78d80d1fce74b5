#include "mediadup/text.hh"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace mediadup {

inline namespace detail_v1 {

std::string to_fixed(double value, int precision) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << value;
  return os.str();
}

std::string to_compact(double value, int precision) {
  auto str = to_fixed(value, precision);
  if (str.find('.') == std::string::npos) {
    return str;
  }
  while (str.back() == '0') {
    str.pop_back();
  }
  if (str.back() == '.') {
    str.pop_back();
  }
  return str == "-0" ? "0" : str;
}

std::optional<double> number_after(std::string_view text,
                                   std::string_view tag) {
  auto pos = text.find(tag);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos += tag.size();
  auto end = pos;
  while (end < text.size() &&
         (std::isdigit(static_cast<unsigned char>(text[end])) ||
          text[end] == '.' || (end == pos && text[end] == '-'))) {
    ++end;
  }
  if (end == pos) {
    return std::nullopt;
  }
  std::string num(text.substr(pos, end - pos));
  char *parsed_end = nullptr;
  auto value = std::strtod(num.c_str(), &parsed_end);
  if (parsed_end == num.c_str()) {
    return std::nullopt;
  }
  return value;
}

std::string to_lower(std::string_view str) {
  std::string out(str);
  for (auto &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace detail_v1

}  // namespace mediadup
