#pragma once

#include <cstdint>

#define MEDIADUP_EXPORT __attribute__((visibility("default")))

namespace mediadup {

// perceptual hash code length in bits
constexpr auto code_bits = 64U;

// default thresholds
constexpr auto dflt_image_distance = 5U;
constexpr auto dflt_video_frame_distance = 5U;
constexpr auto dflt_duration_tolerance_pct = 0.02;
constexpr auto dflt_name_similarity = 0.5;
constexpr auto dflt_band_lower = 4U;
constexpr auto dflt_band_upper = 6U;
constexpr auto dflt_confirmation_distance = 8U;
constexpr auto dflt_hash_score_ceiling = 25U;
// 5min
constexpr auto dflt_capture_window_sec = 300.0;
constexpr auto dflt_size_class_tolerance_pct = 0.05;

// default weights
constexpr auto dflt_weight_checksum = 1.0;
constexpr auto dflt_weight_hash = 0.4;
constexpr auto dflt_weight_name = 0.3;
constexpr auto dflt_weight_capture_time = 0.2;
constexpr auto dflt_weight_duration = 0.2;
constexpr auto dflt_weight_metadata = 0.1;
constexpr auto dflt_weight_policy = 0.05;

// default penalties
constexpr auto dflt_penalty_checksum = -0.05;
constexpr auto dflt_penalty_hash = -0.1;
constexpr auto dflt_penalty_name = -0.05;
constexpr auto dflt_penalty_capture_time = -0.05;
constexpr auto dflt_penalty_duration = -0.05;

// past these the bucket index degrades to linear scan
constexpr auto dflt_index_bucket_ceiling = 100000UL;
constexpr auto dflt_index_depth_ceiling = 256U;

// linear pairing pool past which hashless records only meet their stem
constexpr auto dflt_max_bucket_size = 256U;
// candidate pairs kept per bucket
constexpr auto dflt_max_comparisons_per_bucket = 10000UL;

// candidate pairs scored per worker job
constexpr auto score_batch_sz = 4096UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

}  // namespace mediadup
