#include <gtest/gtest.h>

#include "frame_types.hpp"

using namespace spex;

TEST(Facts, OrderByTierIsStable) {
    auto ordered = order_facts({
        {"cup", PriorityTier::LOW},
        {"stranger", PriorityTier::HIGH},
        {"Asha", PriorityTier::NORMAL},
        {"chair", PriorityTier::MEDIUM},
        {"car", PriorityTier::HIGH},
    });
    ASSERT_EQ(ordered.size(), 5u);
    EXPECT_EQ(ordered[0].text, "stranger");
    EXPECT_EQ(ordered[1].text, "car");
    EXPECT_EQ(ordered[2].text, "chair");
    EXPECT_EQ(ordered[3].text, "cup");
    EXPECT_EQ(ordered[4].text, "Asha");
}

TEST(Facts, MergeIntoOneUtterance) {
    EXPECT_EQ(merge_facts({{"a cup", PriorityTier::LOW}, {"a car ahead.", PriorityTier::HIGH}, {"", PriorityTier::HIGH}}),
              "a car ahead. a cup.");
    EXPECT_EQ(merge_facts({}), "");
}

TEST(Facts, TierNames) {
    EXPECT_EQ(tier_to_string(PriorityTier::HIGH), "high");
    EXPECT_EQ(tier_to_string(PriorityTier::NORMAL), "normal");
    EXPECT_LT(tier_rank(PriorityTier::LOW), tier_rank(PriorityTier::NORMAL));
    EXPECT_EQ(modality_to_string(Modality::HAND), "hand");
}
