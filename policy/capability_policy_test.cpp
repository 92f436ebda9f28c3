#include "policy/capability_policy.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using policy::CapabilityPolicy;
using policy::Tier;

std::vector<std::string> NamesOf(const policy::Names& names) {
  std::vector<std::string> out;
  for (const auto& entry : names) out.push_back(entry.first);
  return out;
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, ParseTier) {
  Tier tier = Tier::ANALYSIS;
  EXPECT_TRUE(policy::ParseTier("minimal", &tier));
  EXPECT_EQ(tier, Tier::MINIMAL);
  EXPECT_TRUE(policy::ParseTier("analysis", &tier));
  EXPECT_EQ(tier, Tier::ANALYSIS);
  EXPECT_FALSE(policy::ParseTier("full", &tier));
  EXPECT_EQ(tier, Tier::ANALYSIS);
  EXPECT_EQ(policy::TierName(Tier::MINIMAL), "minimal");
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, MinimalTierHasOnlyPrimitives) {
  const auto& names = CapabilityPolicy::Get().Resolve(Tier::MINIMAL);
  EXPECT_THAT(NamesOf(names),
              ::testing::IsSupersetOf({"print", "len", "range", "sorted", "set",
                                       "type", "isinstance"}));
  EXPECT_EQ(names.count("math"), 0u);
  EXPECT_EQ(names.count("open"), 0u);
  EXPECT_EQ(names.count("eval"), 0u);
  EXPECT_EQ(names.count("__import__"), 0u);
  for (const auto& entry : names) {
    EXPECT_TRUE(entry.second.IsCallable()) << entry.first;
  }
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, AnalysisTierExtendsMinimal) {
  const auto& minimal = CapabilityPolicy::Get().Resolve(Tier::MINIMAL);
  const auto& analysis = CapabilityPolicy::Get().Resolve(Tier::ANALYSIS);
  for (const auto& entry : minimal) {
    EXPECT_EQ(analysis.count(entry.first), 1u) << entry.first;
  }
  ASSERT_EQ(analysis.count("math"), 1u);
  EXPECT_TRUE(analysis.at("math").IsModule());
  EXPECT_TRUE(analysis.at("stats").IsModule());
  EXPECT_TRUE(analysis.at("ta").IsModule());
  ASSERT_EQ(analysis.count("statistics"), 1u);
  EXPECT_EQ(&analysis.at("statistics").AsModule(),
            &analysis.at("stats").AsModule());
  EXPECT_EQ(analysis.size(), minimal.size() + 4);
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, UnknownRawTierFailsClosed) {
  const CapabilityPolicy& capabilities = CapabilityPolicy::Get();
  EXPECT_EQ(&capabilities.Resolve(1), &capabilities.Resolve(Tier::ANALYSIS));
  EXPECT_EQ(&capabilities.Resolve(7), &capabilities.Resolve(Tier::MINIMAL));
  EXPECT_EQ(&capabilities.Resolve(-1), &capabilities.Resolve(Tier::MINIMAL));
  EXPECT_EQ(policy::TierFromRaw(42), Tier::MINIMAL);
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, ResolveIsStable) {
  const auto& first = CapabilityPolicy::Get().Resolve(Tier::ANALYSIS);
  const auto& second = CapabilityPolicy::Get().Resolve(Tier::ANALYSIS);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(&CapabilityPolicy::Get(), &CapabilityPolicy::Get());
}

// NOLINTNEXTLINE
TEST(CapabilityPolicy, ReservedNames) {
  const CapabilityPolicy& capabilities = CapabilityPolicy::Get();
  EXPECT_TRUE(capabilities.IsReserved("print"));
  EXPECT_TRUE(capabilities.IsReserved("math"));
  EXPECT_TRUE(capabilities.IsReserved("result"));
  EXPECT_TRUE(capabilities.IsReserved("import"));
  EXPECT_FALSE(capabilities.IsReserved("prices"));
}

}  // namespace
