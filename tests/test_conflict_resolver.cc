#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "redaction/tacet_conflict_resolver.h"

using Tacet::BuiltinCategory;
using Tacet::Category;
using Tacet::ConflictResolver;
using Tacet::ProtectionFilter;
using Tacet::Span;

namespace {

Span Builtin(size_t start, size_t end, BuiltinCategory category) {
  Span span;
  span.start = start;
  span.end = end;
  span.category = Category::Builtin(category);
  return span;
}

Span Custom(size_t start, size_t end, const std::string& name, int index) {
  Span span;
  span.start = start;
  span.end = end;
  span.category = Category::Custom(name);
  span.pattern_index = index;
  return span;
}

class ConflictResolverTest : public ::testing::Test {
 protected:
  const std::string text_ = std::string(64, 'x');
  const ProtectionFilter no_protection_{text_, nullptr, {}};
};

TEST_F(ConflictResolverTest, DisjointSpansAreAllKeptInOrder) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Builtin(20, 25, BuiltinCategory::PHONES), Builtin(0, 5, BuiltinCategory::NAMES),
     Builtin(10, 15, BuiltinCategory::EMAILS)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 3u);
  EXPECT_EQ(resolved[0].start, 0u);
  EXPECT_EQ(resolved[1].start, 10u);
  EXPECT_EQ(resolved[2].start, 20u);
}

TEST_F(ConflictResolverTest, LongerSpanWinsAtTheSameStart) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Builtin(5, 10, BuiltinCategory::NAMES), Builtin(5, 30, BuiltinCategory::ADDRESSES)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].category.builtin, BuiltinCategory::ADDRESSES);
}

TEST_F(ConflictResolverTest, EarlierSpanWinsOverLaterOverlap) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Builtin(8, 40, BuiltinCategory::ADDRESSES), Builtin(4, 12, BuiltinCategory::NAMES),
     Builtin(45, 50, BuiltinCategory::PHONES)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 2u);
  EXPECT_EQ(resolved[0].category.builtin, BuiltinCategory::NAMES);
  EXPECT_EQ(resolved[1].category.builtin, BuiltinCategory::PHONES);
}

TEST_F(ConflictResolverTest, IdenticalRangeBuiltinBeatsCustom) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Custom(10, 22, "phone_like", 0), Builtin(10, 22, BuiltinCategory::PHONES)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_FALSE(resolved[0].category.is_custom);
}

TEST_F(ConflictResolverTest, IdenticalRangeFollowsCategoryOrder) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Builtin(0, 9, BuiltinCategory::FINANCIAL), Builtin(0, 9, BuiltinCategory::PHONES)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].category.builtin, BuiltinCategory::PHONES);
}

TEST_F(ConflictResolverTest, IdenticalRangeCustomFollowsDeclarationOrder) {
  std::vector<Span> resolved = ConflictResolver::Resolve(
    {Custom(3, 9, "second", 1), Custom(3, 9, "first", 0)},
    no_protection_);
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].category.custom_name, "first");
}

TEST_F(ConflictResolverTest, ProtectedCandidatesAreDropped) {
  std::string text = "Call John Smith about the Neve 1073 today";
  ProtectionFilter filter(text, nullptr, {"neve 1073"});

  Span name = Builtin(text.find("John"), text.find(" about"), BuiltinCategory::NAMES);
  name.matched_text = "John Smith";
  Span number = Builtin(text.find("1073"), text.find(" today"), BuiltinCategory::FINANCIAL);
  number.matched_text = "1073";

  std::vector<Span> resolved = ConflictResolver::Resolve({number, name}, filter);
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].matched_text, "John Smith");
}

TEST_F(ConflictResolverTest, EmptyInput) {
  EXPECT_TRUE(ConflictResolver::Resolve({}, no_protection_).empty());
}

TEST(ConflictResolverPrecedenceTest, IsAStrictOrdering) {
  Span phone = Builtin(0, 10, BuiltinCategory::PHONES);
  Span custom = Custom(0, 10, "x", 0);
  EXPECT_TRUE(ConflictResolver::Precedes(phone, custom));
  EXPECT_FALSE(ConflictResolver::Precedes(custom, phone));
  EXPECT_FALSE(ConflictResolver::Precedes(phone, phone));
}

}  // namespace
