#include "mediadup/parse_size.hh"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace mediadup::utils {

namespace {

// fast pow of unsigned long
uint64_t pow_ul(uint64_t base, uint64_t exp) noexcept {
  uint64_t result = 1;
  while (exp != 0) {
    if (exp & 1) {
      result *= base;
    }
    exp = exp >> 1;
    base *= base;
  }
  return result;
}

inline bool is_num(char c) noexcept { return c >= '0' && c <= '9'; }

[[noreturn]] void invalid(std::string_view size_str) {
  throw std::invalid_argument("invalid size string: " + std::string(size_str));
}

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  const std::array<char, 8> unit_dict({'K', 'M', 'G', 'T', 'P', 'E', 'Z', 'Y'});
  const auto size_len = size_str.size();
  if (size_len == 0 || !is_num(size_str[0])) {
    invalid(size_str);
  }

  uint64_t size_num = 0;
  std::size_t i = 0;
  for (; i < size_len && is_num(size_str[i]); ++i) {
    auto digit = static_cast<uint64_t>(size_str[i] - '0');
    if (size_num > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      throw std::invalid_argument("size out of range: " +
                                  std::string(size_str));
    }
    size_num = size_num * 10 + digit;
  }

  uint64_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;
  if (i < size_len) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (size_str[i] == unit_dict[j] || size_str[i] == unit_dict[j] + 32) {
        scale = j + 1;
        ++i;
        break;
      }
    }
    if (scale != 0 && i < size_len && size_str[i] == 'i') {
      as_bibyte = true;
      ++i;
    }
    if (i < size_len) {
      if (size_str[i] == 'b') {
        as_bit = true;
      } else if (size_str[i] != 'B') {
        invalid(size_str);
      }
      ++i;
    }
    if (i != size_len) {
      invalid(size_str);
    }
  }

  auto multiplier = pow_ul(as_bibyte ? 1024 : 1000, scale);
  if (scale > 6 ||
      (multiplier != 0 &&
       size_num > std::numeric_limits<uint64_t>::max() / multiplier)) {
    throw std::invalid_argument("size out of range: " + std::string(size_str));
  }
  return size_num * multiplier / (as_bit ? 8 : 1);
}

}  // namespace mediadup::utils
