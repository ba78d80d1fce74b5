#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "mediadup/evidence.hh"
#include "mediadup/scorer.hh"
#include "record_builder.hh"

namespace mediadup {
namespace {

using fixture::flip_bits;
using fixture::photo;
using fixture::video;

const signal_t *find_signal(const breakdown_t &bd, signal_key_t key) {
  auto it = std::find_if(bd.signals.begin(), bd.signals.end(),
                         [key](const auto &s) { return s.key == key; });
  return it == bd.signals.end() ? nullptr : &*it;
}

const penalty_t *find_penalty(const breakdown_t &bd, penalty_key_t key) {
  auto it = std::find_if(bd.penalties.begin(), bd.penalties.end(),
                         [key](const auto &p) { return p.key == key; });
  return it == bd.penalties.end() ? nullptr : &*it;
}

breakdown_t score(const std::vector<file_record_t> &records,
                  const thresholds_t &th = {}) {
  return score_pair(measure_pair(make_pair(records, 0, 1), records), th);
}

TEST(NormalizeStemTest, StripsExtensionSeparatorsAndVariants) {
  EXPECT_EQ(normalize_stem("IMG_1234.JPG"), "img 1234");
  EXPECT_EQ(normalize_stem("IMG_1234 copy.jpg"), "img 1234");
  EXPECT_EQ(normalize_stem("holiday(1).jpg"), "holiday");
  EXPECT_EQ(normalize_stem("holiday (2).heic"), "holiday");
  EXPECT_EQ(normalize_stem("beach-2.png"), "beach");
  EXPECT_EQ(normalize_stem("dir/sub/Sunset_Final.tiff"), "sunset final");
  // a lone counter is the whole name
  EXPECT_EQ(normalize_stem("2.png"), "2");
  EXPECT_EQ(normalize_stem(""), "");
}

TEST(FileExtensionTest, LowerCasedWithoutDot) {
  EXPECT_EQ(file_extension("a/b/Photo.JPEG"), "jpeg");
  EXPECT_EQ(file_extension("archive.tar.gz"), "gz");
  EXPECT_EQ(file_extension("noext"), "");
  EXPECT_EQ(file_extension(".hidden"), "");
}

TEST(JaroWinklerTest, KnownValues) {
  EXPECT_DOUBLE_EQ(jaro_winkler("", ""), 1.0);
  EXPECT_DOUBLE_EQ(jaro_winkler("abc", ""), 0.0);
  EXPECT_DOUBLE_EQ(jaro_winkler("same", "same"), 1.0);
  EXPECT_DOUBLE_EQ(jaro_winkler("abc", "xyz"), 0.0);
  EXPECT_NEAR(jaro_winkler("martha", "marhta"), 0.9611, 1e-4);
  EXPECT_NEAR(jaro_winkler("dixon", "dicksonx"), 0.8133, 1e-4);
}

TEST(NameSimilarityTest, MissingStemIsNoSimilarity) {
  EXPECT_FALSE(name_similarity("", "IMG_1.jpg").has_value());
  EXPECT_FALSE(name_similarity("IMG_1.jpg", "").has_value());
  EXPECT_DOUBLE_EQ(*name_similarity("IMG_0042.jpg", "IMG_0042 copy.JPG"), 1.0);
}

TEST(DecayTest, HashScoreIsMonotonic) {
  for (uint32_t d = 0; d < 64; ++d) {
    EXPECT_GE(hash_raw_score(d, 25), hash_raw_score(d + 1, 25)) << d;
  }
  EXPECT_DOUBLE_EQ(hash_raw_score(0, 25), 1.0);
  EXPECT_DOUBLE_EQ(hash_raw_score(5, 25), 0.8);
  EXPECT_DOUBLE_EQ(hash_raw_score(25, 25), 0.0);
  EXPECT_DOUBLE_EQ(hash_raw_score(40, 25), 0.0);
}

TEST(DecayTest, CaptureTimeDecaysPastTheWindow) {
  EXPECT_DOUBLE_EQ(capture_raw_score(0.0, 300.0), 1.0);
  EXPECT_DOUBLE_EQ(capture_raw_score(300.0, 300.0), 1.0);
  EXPECT_DOUBLE_EQ(capture_raw_score(600.0, 300.0), 0.5);
  double prev = 1.0;
  for (double delta = 0.0; delta < 100000.0; delta += 250.0) {
    auto raw = capture_raw_score(delta, 300.0);
    EXPECT_LE(raw, prev);
    prev = raw;
  }
}

TEST(DecayTest, DurationDecaysLinearlyToTwiceTheTolerance) {
  EXPECT_DOUBLE_EQ(duration_raw_score(0.01, 0.02), 1.0);
  EXPECT_DOUBLE_EQ(duration_raw_score(0.02, 0.02), 1.0);
  EXPECT_NEAR(duration_raw_score(0.03, 0.02), 0.5, 1e-12);
  EXPECT_DOUBLE_EQ(duration_raw_score(0.04, 0.02), 0.0);
  EXPECT_DOUBLE_EQ(duration_raw_score(0.5, 0.02), 0.0);
}

TEST(ScorePairTest, EqualChecksumShortCircuits) {
  auto a = photo("a", 0, 1024);
  auto b = photo("b", ~0ULL, 1024);
  b.checksum = a.checksum;
  auto bd = score({a, b});
  EXPECT_DOUBLE_EQ(bd.confidence, 1.0);
  ASSERT_EQ(bd.signals.size(), 1U);
  EXPECT_EQ(bd.signals[0].key, signal_key_t::checksum);
  EXPECT_TRUE(bd.penalties.empty());
}

TEST(ScorePairTest, HashContributionAtThresholdPasses) {
  auto a = photo("IMG_0001", 0);
  auto b = photo("IMG_0001 copy", 0x1F);
  auto bd = score({a, b});
  const auto *hash = find_signal(bd, signal_key_t::hash);
  ASSERT_NE(hash, nullptr);
  EXPECT_EQ(hash->rationale, "dHash distance=5");
  EXPECT_DOUBLE_EQ(hash->weight, 0.4);
  EXPECT_DOUBLE_EQ(hash->raw_score, 0.8);
  EXPECT_NEAR(hash->contribution, 0.32, 1e-12);
  EXPECT_EQ(verdict_for(hash->contribution, false), verdict_t::pass);
}

TEST(ScorePairTest, HashContributionDecreasesWithDistance) {
  double prev = 1.0;
  for (uint32_t d = 0; d <= 30; ++d) {
    auto bd = score({photo("a", 0), photo("b", flip_bits(0, d))});
    const auto *hash = find_signal(bd, signal_key_t::hash);
    ASSERT_NE(hash, nullptr);
    EXPECT_LE(hash->contribution, prev);
    prev = hash->contribution;
  }
}

TEST(ScorePairTest, MissingInputsBecomePenalties) {
  auto a = photo("a", 0x42);
  auto b = photo("b", std::nullopt);
  b.checksum.clear();
  auto bd = score({a, b});

  EXPECT_EQ(find_signal(bd, signal_key_t::hash), nullptr);
  const auto *hash_missing = find_penalty(bd, penalty_key_t::hash_missing);
  ASSERT_NE(hash_missing, nullptr);
  EXPECT_DOUBLE_EQ(hash_missing->value, -0.1);
  EXPECT_NE(find_penalty(bd, penalty_key_t::checksum_missing), nullptr);
  EXPECT_NE(find_penalty(bd, penalty_key_t::capture_time_missing), nullptr);
  // photos carry no duration at all
  EXPECT_EQ(find_penalty(bd, penalty_key_t::duration_missing), nullptr);
  EXPECT_EQ(find_signal(bd, signal_key_t::duration), nullptr);
}

TEST(ScorePairTest, SignalsAndPenaltiesNeverShareAKey) {
  auto a = photo("a", 1);
  auto b = photo("b", std::nullopt);
  a.capture_time = 1000;
  auto bd = score({a, b});
  for (const auto &penalty : bd.penalties) {
    EXPECT_EQ(find_signal(bd, penalized_signal(penalty.key)), nullptr);
  }
}

TEST(ScorePairTest, LowButComputedSignalIsNoPenalty) {
  auto a = photo("sunrise", 0);
  auto b = photo("zebra", ~0ULL);
  a.capture_time = 0;
  b.capture_time = 1'000'000;
  auto bd = score({a, b});
  EXPECT_NE(find_signal(bd, signal_key_t::hash), nullptr);
  EXPECT_NE(find_signal(bd, signal_key_t::capture_time), nullptr);
  EXPECT_EQ(find_penalty(bd, penalty_key_t::hash_missing), nullptr);
  EXPECT_EQ(find_penalty(bd, penalty_key_t::capture_time_missing), nullptr);
}

TEST(ScorePairTest, CaptureTimeRationale) {
  auto a = photo("a", 0);
  auto b = photo("b", 0);
  a.capture_time = 1000;
  b.capture_time = 1002;
  auto bd = score({a, b});
  const auto *capture = find_signal(bd, signal_key_t::capture_time);
  ASSERT_NE(capture, nullptr);
  EXPECT_EQ(capture->rationale, "capture delta=2.00s");
  EXPECT_DOUBLE_EQ(capture->raw_score, 1.0);
}

TEST(ScorePairTest, AudioHasDurationButNoHash) {
  file_record_t a;
  a.id = "a";
  a.media = media_t::audio;
  a.size = 5'000'000;
  a.checksum = "x";
  a.file_name = "song.mp3";
  a.duration = 200.0;
  auto b = a;
  b.id = "b";
  b.checksum = "y";
  b.duration = 201.0;
  auto bd = score({a, b});
  EXPECT_EQ(find_signal(bd, signal_key_t::hash), nullptr);
  EXPECT_EQ(find_penalty(bd, penalty_key_t::hash_missing), nullptr);
  const auto *duration = find_signal(bd, signal_key_t::duration);
  ASSERT_NE(duration, nullptr);
  EXPECT_DOUBLE_EQ(duration->raw_score, 1.0);
}

TEST(MetadataSimilarityTest, AveragesSizeAndDimensions) {
  auto a = photo("a", 0, 1000);
  auto b = photo("b", 0, 800);
  ASSERT_TRUE(metadata_similarity(a, b).has_value());
  EXPECT_DOUBLE_EQ(*metadata_similarity(a, b), 0.8);

  a.width = 4000;
  a.height = 3000;
  b.width = 2000;
  b.height = 3000;
  // (0.8 + 0.5 + 1.0) / 3
  EXPECT_NEAR(*metadata_similarity(a, b), 2.3 / 3.0, 1e-12);

  a.size = 0;
  b.size = 0;
  a.width = 0;
  EXPECT_FALSE(metadata_similarity(a, b).has_value());
}

TEST(ScorePairTest, MetadataIsASignalNeverAPenalty) {
  auto a = photo("a", 0, 1000);
  auto b = photo("b", 0, 500);
  auto bd = score({a, b});
  const auto *metadata = find_signal(bd, signal_key_t::metadata);
  ASSERT_NE(metadata, nullptr);
  EXPECT_EQ(metadata->rationale, "metadata similarity=0.50");
  EXPECT_DOUBLE_EQ(metadata->contribution, 0.05);

  a.size = 0;
  bd = score({a, b});
  EXPECT_EQ(find_signal(bd, signal_key_t::metadata), nullptr);
  for (const auto &penalty : bd.penalties) {
    EXPECT_NE(penalized_signal(penalty.key), signal_key_t::metadata);
  }
}

TEST(ScorePairTest, PolicyLinkShortCircuits) {
  auto raw = photo("IMG_7", std::nullopt);
  raw.file_name = "IMG_7.CR2";
  auto jpg = photo("IMG_7 jpg", std::nullopt);
  jpg.file_name = "IMG_7.jpg";
  std::vector<file_record_t> records{raw, jpg};
  auto pair = make_pair(records, 0, 1);
  pair.policy = policy_t::raw_jpeg;
  auto m = measure_pair(pair, records);

  auto bd = score_pair(m, {});
  ASSERT_EQ(bd.signals.size(), 1U);
  EXPECT_TRUE(bd.penalties.empty());
  EXPECT_EQ(bd.signals[0].key, signal_key_t::policy);
  EXPECT_EQ(bd.signals[0].rationale, "policy.raw-jpeg");
  EXPECT_DOUBLE_EQ(bd.signals[0].raw_score, 1.0);
  EXPECT_DOUBLE_EQ(bd.confidence, 0.05);

  // the sidecar bonus sits below the cap
  m.pair.policy = policy_t::sidecar;
  bd = score_pair(m, {});
  EXPECT_NEAR(bd.signals[0].raw_score, 0.4, 1e-12);

  // a disabled policy scores like any other pair
  thresholds_t th;
  th.policies.sidecar = false;
  bd = score_pair(m, th);
  EXPECT_EQ(find_signal(bd, signal_key_t::policy), nullptr);
  EXPECT_NE(find_penalty(bd, penalty_key_t::hash_missing), nullptr);
}

TEST(MeasurePairTest, MixedMediaHasNoHashOrDuration) {
  auto still = photo("live", 0x1);
  still.file_name = "live.heic";
  auto clip = video("live clip", {0x1}, 3.0);
  clip.file_name = "live.mov";
  std::vector<file_record_t> records{still, clip};
  auto m = measure_pair(make_pair(records, 0, 1), records);
  EXPECT_FALSE(m.hash_applicable);
  EXPECT_FALSE(m.distance.has_value());
  EXPECT_FALSE(m.duration_applicable);
  EXPECT_EQ(m.pair.frames, 0U);

  auto bd = score_pair(m, {});
  EXPECT_EQ(find_penalty(bd, penalty_key_t::hash_missing), nullptr);
  EXPECT_EQ(find_penalty(bd, penalty_key_t::duration_missing), nullptr);
}

TEST(MeasurePairTest, VideoUsesMaxAlignedFrameDistance) {
  std::vector<uint64_t> frames{0, 0xF000, 0xFF'0000};
  auto other = frames;
  other[0] = flip_bits(other[0], 2);
  other[2] = flip_bits(other[2], 4);
  other.push_back(123);
  std::vector<file_record_t> records{video("a", frames, 60.0),
                                     video("b", other, 61.0)};
  auto m = measure_pair(make_pair(records, 0, 1), records);
  ASSERT_TRUE(m.distance.has_value());
  EXPECT_EQ(*m.distance, 4U);
  EXPECT_EQ(m.pair.frames, 3U);
  EXPECT_TRUE(m.pair.truncated);
  ASSERT_TRUE(m.duration_delta_pct.has_value());
  EXPECT_NEAR(*m.duration_delta_pct, 1.0 / 61.0, 1e-12);

  auto bd = score_pair(m, thresholds_t{});
  const auto *hash = find_signal(bd, signal_key_t::hash);
  ASSERT_NE(hash, nullptr);
  EXPECT_EQ(hash->rationale, "max frame distance=4 over 3 frames");
  const auto *duration = find_signal(bd, signal_key_t::duration);
  ASSERT_NE(duration, nullptr);
  EXPECT_EQ(duration->rationale, "duration delta=1.64%");
  EXPECT_DOUBLE_EQ(duration->raw_score, 1.0);
}

TEST(MeasurePairTest, PartialAndSecondaryAreCarried) {
  auto a = photo("a", 0);
  auto b = photo("b", 0x3F);
  a.secondary_hash = 0;
  b.secondary_hash = 0x7;
  b.partial = true;
  std::vector<file_record_t> records{a, b};
  auto m = measure_pair(make_pair(records, 0, 1), records);
  EXPECT_TRUE(m.partial);
  EXPECT_EQ(m.secondary_distance, std::optional<uint32_t>(3));
  EXPECT_TRUE(m.checksum_known);
  EXPECT_FALSE(m.checksum_equal);
}

}  // namespace
}  // namespace mediadup
