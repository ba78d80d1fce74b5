#pragma once

#include <cstdint>
#include <string_view>

namespace mediadup::utils {

/**
 * @brief parse a human size like "1024", "4GB", "16MiB" or "8Mb" into bytes.
 * Decimal units scale by 1000, "i" units by 1024, a trailing "b" means bits.
 *
 * @throws std::invalid_argument if not a valid size string.
 */
uint64_t parse_size(std::string_view size_str);

}  // namespace mediadup::utils
