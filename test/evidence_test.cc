#include <gtest/gtest.h>

#include <vector>

#include "mediadup/evidence.hh"

namespace mediadup {
namespace {

member_t member_with(std::vector<signal_t> signals,
                     std::vector<penalty_t> penalties = {}) {
  member_t member;
  member.file_id = "f";
  member.signals = std::move(signals);
  member.penalties = std::move(penalties);
  member.confidence = aggregate(member.signals, member.penalties);
  member.file_size = 1024;
  return member;
}

group_result_t group_of(std::vector<member_t> members, media_t media) {
  group_result_t group;
  group.members = std::move(members);
  group.media = media;
  return group;
}

TEST(VerdictTest, Boundaries) {
  EXPECT_EQ(verdict_for(1.0, false), verdict_t::pass);
  EXPECT_EQ(verdict_for(0.31, false), verdict_t::pass);
  EXPECT_EQ(verdict_for(0.3, false), verdict_t::warn);
  EXPECT_EQ(verdict_for(0.11, false), verdict_t::warn);
  EXPECT_EQ(verdict_for(0.1, false), verdict_t::fail);
  EXPECT_EQ(verdict_for(0.0, false), verdict_t::fail);
  EXPECT_EQ(verdict_for(0.9, true), verdict_t::fail);
  EXPECT_EQ(to_string(verdict_t::warn), "warn");
}

TEST(FormatSecondsTest, PicksUnit) {
  EXPECT_EQ(format_seconds(2.0), "2s");
  EXPECT_EQ(format_seconds(45.5), "45.5s");
  EXPECT_EQ(format_seconds(90.0), "1.5m");
  EXPECT_EQ(format_seconds(300.0), "5m");
  EXPECT_EQ(format_seconds(7200.0), "2h");
  EXPECT_EQ(format_seconds(172800.0), "2d");
}

TEST(EvidenceTest, ChecksumMatch) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::checksum, 1.0, 1.0,
                                   "checksum match")})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 1U);
  EXPECT_EQ(items[0].id, "checksum");
  EXPECT_EQ(items[0].label, "Checksum");
  EXPECT_EQ(items[0].distance_text, "0");
  EXPECT_EQ(items[0].threshold_text, "0");
  EXPECT_EQ(items[0].verdict, verdict_t::pass);
}

TEST(EvidenceTest, HashDistance) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::hash, 0.4, 0.8,
                                   "dHash distance=5")})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 1U);
  EXPECT_EQ(items[0].id, "hash");
  EXPECT_EQ(items[0].label, "Hash Distance");
  EXPECT_EQ(items[0].distance_text, "5");
  EXPECT_EQ(items[0].threshold_text, "5");
  // 0.32 > 0.3
  EXPECT_EQ(items[0].verdict, verdict_t::pass);
}

TEST(EvidenceTest, NameAsPercentage) {
  auto group = group_of({member_with({signal_t::make(
                            signal_key_t::name, 0.3, 0.75, "name similarity")})},
                        media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 1U);
  EXPECT_EQ(items[0].id, "name");
  EXPECT_EQ(items[0].label, "Name");
  EXPECT_EQ(items[0].distance_text, "75%");
  EXPECT_EQ(items[0].threshold_text, "50%");
  EXPECT_EQ(items[0].verdict, verdict_t::warn);
}

TEST(EvidenceTest, CaptureTimeDelta) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::capture_time, 0.2, 0.9,
                                   "capture delta=2.00s")})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 1U);
  EXPECT_EQ(items[0].id, "captureTime");
  EXPECT_EQ(items[0].label, "Capture Date");
  EXPECT_EQ(items[0].distance_text, "2s");
  EXPECT_EQ(items[0].threshold_text, "5m");
  EXPECT_EQ(items[0].verdict, verdict_t::warn);
}

TEST(EvidenceTest, MissingHashPenaltyFails) {
  auto group = group_of(
      {member_with({}, {{penalty_key_t::hash_missing, -0.1,
                         "image hash missing"}})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 1U);
  EXPECT_EQ(items[0].id, "penalty_hashMissing");
  EXPECT_EQ(items[0].label, "Hash Missing");
  EXPECT_EQ(items[0].distance_text, "missing");
  EXPECT_EQ(items[0].threshold_text, "required");
  EXPECT_EQ(items[0].verdict, verdict_t::fail);
}

TEST(EvidenceTest, LineSeparatesValueFromLimit) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::hash, 0.4, 0.88,
                                   "dHash distance=3"),
                    signal_t::make(signal_key_t::name, 0.3, 0.2,
                                   "name similarity=0.20")},
                   {{penalty_key_t::capture_time_missing, -0.05,
                     "capture time missing"}})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 3U);
  EXPECT_EQ(to_line(items[0]), "[pass] Hash Distance: 3 / 5");
  // a similarity below its floor reads as value and limit, not as "<="
  EXPECT_EQ(to_line(items[1]), "[fail] Name: 20% / 50%");
  EXPECT_EQ(to_line(items[2]), "[fail] Capture Date Missing: missing / required");
}

TEST(EvidenceTest, SupplementarySignals) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::metadata, 0.1, 0.95,
                                   "metadata similarity=0.95"),
                    signal_t::make(signal_key_t::policy, 0.05, 1.0,
                                   "policy.raw-jpeg")})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 2U);
  EXPECT_EQ(items[0].label, "Metadata");
  EXPECT_EQ(items[0].distance_text, "95%");
  EXPECT_EQ(items[0].threshold_text, "-");
  EXPECT_EQ(items[1].label, "Policy");
  EXPECT_EQ(items[1].distance_text, "policy.raw-jpeg");
  EXPECT_EQ(items[1].threshold_text, "-");
}

TEST(EvidenceTest, SortedByContribution) {
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::name, 0.3, 0.6, "name"),
                    signal_t::make(signal_key_t::checksum, 1.0, 1.0,
                                   "checksum match"),
                    signal_t::make(signal_key_t::hash, 0.4, 0.8,
                                   "dHash distance=3")},
                   {{penalty_key_t::capture_time_missing, -0.05,
                     "capture time missing"}})},
      media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 4U);
  EXPECT_EQ(items[0].id, "checksum");
  EXPECT_EQ(items[1].id, "hash");
  EXPECT_EQ(items[2].id, "name");
  EXPECT_EQ(items[3].id, "penalty_captureTimeMissing");
}

TEST(EvidenceTest, VideoThresholds) {
  thresholds_t th;
  th.video_frame_distance = 7;
  th.image_distance = 3;
  auto group = group_of(
      {member_with({signal_t::make(signal_key_t::hash, 0.4, 0.85,
                                   "max frame distance=4 over 3 frames"),
                    signal_t::make(signal_key_t::duration, 0.2, 0.9,
                                   "duration delta=0.50%")})},
      media_t::video);
  auto items = format_evidence(group, th);
  ASSERT_EQ(items.size(), 2U);
  EXPECT_EQ(items[0].id, "hash");
  EXPECT_EQ(items[0].distance_text, "4");
  EXPECT_EQ(items[0].threshold_text, "7");
  EXPECT_EQ(items[1].id, "duration");
  EXPECT_EQ(items[1].distance_text, "0.5%");
  EXPECT_EQ(items[1].threshold_text, "2%");
}

TEST(EvidenceTest, GroupFoldsByMaximumContribution) {
  auto weak = member_with(
      {signal_t::make(signal_key_t::hash, 0.4, 0.5, "dHash distance=12")});
  auto strong = member_with(
      {signal_t::make(signal_key_t::hash, 0.4, 0.9, "dHash distance=2"),
       signal_t::make(signal_key_t::name, 0.3, 1.0, "name similarity=1.00")});
  auto group = group_of({weak, strong}, media_t::photo);
  auto items = format_evidence(group, thresholds_t{});
  ASSERT_EQ(items.size(), 2U);
  EXPECT_EQ(items[0].id, "hash");
  EXPECT_EQ(items[0].distance_text, "2");
  EXPECT_NEAR(items[0].contribution, 0.36, 1e-12);
  EXPECT_EQ(items[1].id, "name");
}

TEST(EvidenceTest, PenaltyOnKeyForcesSignalToFail) {
  auto with_hash = member_with(
      {signal_t::make(signal_key_t::hash, 0.4, 1.0, "dHash distance=0")});
  auto without = member_with({}, {{penalty_key_t::hash_missing, -0.1,
                                   "image hash missing"}});
  auto items =
      format_evidence(group_of({with_hash, without}, media_t::photo), {});
  ASSERT_EQ(items.size(), 2U);
  EXPECT_EQ(items[0].id, "hash");
  EXPECT_EQ(items[0].verdict, verdict_t::fail);
  EXPECT_EQ(items[1].id, "penalty_hashMissing");
}

TEST(EvidenceTest, EmptyGroup) {
  EXPECT_TRUE(format_evidence(group_result_t{}, thresholds_t{}).empty());
}

TEST(EvidenceTest, MemberLevelMatchesSingleMemberGroup) {
  auto member = member_with(
      {signal_t::make(signal_key_t::hash, 0.4, 0.8, "dHash distance=5"),
       signal_t::make(signal_key_t::name, 0.3, 0.75, "name similarity=0.75")});
  EXPECT_EQ(format_evidence(member, media_t::photo, thresholds_t{}),
            format_evidence(group_of({member}, media_t::photo), thresholds_t{}));
}

}  // namespace
}  // namespace mediadup
