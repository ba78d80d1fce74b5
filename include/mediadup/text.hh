#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mediadup {

inline namespace detail_v1 {

// fixed-point rendering, e.g. to_fixed(0.3249, 2) == "0.32"
std::string to_fixed(double value, int precision);

// shortest rendering up to precision digits, e.g. 2.50 -> "2.5", 2.0 -> "2"
std::string to_compact(double value, int precision);

/**
 * @brief number following tag inside text, e.g. ("dHash distance=5", "=")
 *
 * @return std::nullopt if the tag is absent or no digits follow it
 */
std::optional<double> number_after(std::string_view text,
                                   std::string_view tag);

std::string to_lower(std::string_view str);

}  // namespace detail_v1

}  // namespace mediadup
