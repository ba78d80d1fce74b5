#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "file_record.hh"
#include "thresholds.hh"

namespace mediadup {

inline namespace detail_v1 {

/**
 * @brief position of the file's extension in the preference list,
 * preference.size() when absent
 */
std::size_t format_rank(std::string_view file_name,
                        const std::vector<std::string> &preference);

// one point each for a capture date and GPS
uint32_t metadata_richness(const file_record_t &record) noexcept;

/**
 * @brief strict weak order, true when lhs is the better keeper.
 *
 * In priority order: more pixels, higher bitrate, preferred format, richer
 * metadata, earlier capture (known before unknown), smaller id.
 */
bool keeper_before(const file_record_t &lhs, const file_record_t &rhs,
                   const thresholds_t &thresholds);

/**
 * @brief members ordered best keeper first
 *
 * @param members indices into records
 */
std::vector<uint32_t> rank_members(std::span<const uint32_t> members,
                                   std::span<const file_record_t> records,
                                   const thresholds_t &thresholds);

/**
 * @brief advisory keeper, std::nullopt for an empty member list
 */
std::optional<file_id_t> suggest_keeper(std::span<const uint32_t> members,
                                        std::span<const file_record_t> records,
                                        const thresholds_t &thresholds);

}  // namespace detail_v1

}  // namespace mediadup
