#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

#include "mediadup/group_id.hh"

namespace mediadup {
namespace {

TEST(GroupIdTest, ThirtyTwoHexDigits) {
  std::vector<file_id_t> ids{"a", "b"};
  auto id = group_id(ids);
  ASSERT_EQ(id.size(), 32U);
  for (auto c : id) {
    EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
  }
}

TEST(GroupIdTest, StableForSameMembers) {
  std::vector<file_id_t> ids{"IMG_0001", "IMG_0002", "IMG_0003"};
  EXPECT_EQ(group_id(ids), group_id(ids));
  std::vector<file_id_t> fewer{"IMG_0001", "IMG_0002"};
  EXPECT_NE(group_id(ids), group_id(fewer));
}

TEST(GroupIdTest, LengthPrefixSeparatesSplits) {
  std::vector<file_id_t> lhs{"ab", "c"};
  std::vector<file_id_t> rhs{"a", "bc"};
  EXPECT_NE(group_id(lhs), group_id(rhs));
}

}  // namespace
}  // namespace mediadup
