#include <gtest/gtest.h>

#include "clock.hpp"
#include "identity_gallery.hpp"
#include "identity_resolver.hpp"

using namespace spex;

namespace {
DetectionRecord face(std::vector<float> embedding) {
    DetectionRecord d;
    d.modality = Modality::FACE;
    d.label = "face";
    d.confidence = 0.9f;
    d.region = cv::Rect(10, 10, 50, 50);
    d.features = std::move(embedding);
    return d;
}

IdentityGallery family_gallery() {
    IdentityGallery g;
    g.add(KnownIdentity{"Asha", "sister", {1.0f, 0.0f, 0.0f}});
    g.add(KnownIdentity{"Ravi", "friend", {0.0f, 1.0f, 0.0f}});
    return g;
}
}  // namespace

TEST(IdentityResolver, AnnouncesKnownFaceOncePerCooldown) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock(0.0);
    IdentityResolver resolver(gallery, clock, 0.6f, 5.0);

    auto first = resolver.resolve({face({1.0f, 0.1f, 0.0f})});
    ASSERT_EQ(first.size(), 1u);
    EXPECT_TRUE(first[0].known);
    EXPECT_EQ(first[0].name, "Asha");
    EXPECT_EQ(first[0].description, "your sister Asha");

    clock.set(2.0);
    EXPECT_TRUE(resolver.resolve({face({1.0f, 0.1f, 0.0f})}).empty());

    clock.set(5.0);
    EXPECT_TRUE(resolver.resolve({face({1.0f, 0.1f, 0.0f})}).empty());

    clock.set(6.0);
    auto again = resolver.resolve({face({1.0f, 0.1f, 0.0f})});
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].name, "Asha");
    ASSERT_TRUE(resolver.last_announced("Asha").has_value());
    EXPECT_DOUBLE_EQ(*resolver.last_announced("Asha"), 6.0);
}

TEST(IdentityResolver, SuppressedRepeatDoesNotExtendCooldown) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock(0.0);
    IdentityResolver resolver(gallery, clock, 0.6f, 5.0);

    resolver.resolve({face({1.0f, 0.0f, 0.0f})});
    clock.set(4.0);
    EXPECT_TRUE(resolver.resolve({face({1.0f, 0.0f, 0.0f})}).empty());
    EXPECT_DOUBLE_EQ(*resolver.last_announced("Asha"), 0.0);
    clock.set(5.5);
    EXPECT_EQ(resolver.resolve({face({1.0f, 0.0f, 0.0f})}).size(), 1u);
}

TEST(IdentityResolver, UnknownFacesAreNeverThrottled) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock(0.0);
    IdentityResolver resolver(gallery, clock);

    for (int i = 0; i < 3; ++i) {
        auto out = resolver.resolve({face({5.0f, 5.0f, 5.0f})});
        ASSERT_EQ(out.size(), 1u);
        EXPECT_FALSE(out[0].known);
        EXPECT_EQ(out[0].name, IdentityResolver::kUnknownName);
        clock.advance(0.1);
    }
}

TEST(IdentityResolver, ThresholdIsStrict) {
    IdentityGallery gallery;
    gallery.add(KnownIdentity{"Asha", "sister", {0.0f, 0.0f}});
    ManualClock clock;
    IdentityResolver resolver(gallery, clock, 0.5f);

    auto at_threshold = resolver.resolve({face({0.5f, 0.0f})});
    ASSERT_EQ(at_threshold.size(), 1u);
    EXPECT_FALSE(at_threshold[0].known);

    auto inside = resolver.resolve({face({0.25f, 0.0f})});
    ASSERT_EQ(inside.size(), 1u);
    EXPECT_TRUE(inside[0].known);
}

TEST(IdentityResolver, EmptyGalleryReportsUnknown) {
    IdentityGallery gallery;
    ManualClock clock;
    IdentityResolver resolver(gallery, clock);

    auto out = resolver.resolve({face({1.0f, 0.0f, 0.0f}), face({0.0f, 1.0f, 0.0f})});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_FALSE(out[0].known);
    EXPECT_FALSE(out[1].known);
    EXPECT_EQ(resolver.describe(out), "I see 2 people I don't recognize");
}

TEST(IdentityResolver, TieResolvesToSingleEarliestCandidate) {
    IdentityGallery gallery;
    gallery.add(KnownIdentity{"Asha", "sister", {1.0f, 0.0f}});
    gallery.add(KnownIdentity{"Meera", "", {-1.0f, 0.0f}});
    ManualClock clock;
    IdentityResolver resolver(gallery, clock, 2.0f);

    auto out = resolver.resolve({face({0.0f, 0.0f})});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Asha");
}

TEST(IdentityResolver, SkipsEmbeddingsOfOtherDimension) {
    IdentityGallery gallery;
    gallery.add(KnownIdentity{"Old", "", {0.0f, 0.0f, 0.0f, 0.0f}});
    gallery.add(KnownIdentity{"Asha", "sister", {0.0f, 0.0f}});
    ManualClock clock;
    IdentityResolver resolver(gallery, clock);

    auto out = resolver.resolve({face({0.1f, 0.0f})});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Asha");
}

TEST(IdentityResolver, PhrasesByRelation) {
    EXPECT_EQ(IdentityResolver::phrase_for("Asha", "sister"), "your sister Asha");
    EXPECT_EQ(IdentityResolver::phrase_for("Lata", "Mom"), "your Mom Lata");
    EXPECT_EQ(IdentityResolver::phrase_for("Ravi", "friend"), "Ravi, who is friend");
    EXPECT_EQ(IdentityResolver::phrase_for("Ravi", ""), "Ravi");
}

TEST(IdentityResolver, DescribesMixedScene) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock;
    IdentityResolver resolver(gallery, clock);

    auto out = resolver.resolve({face({1.0f, 0.0f, 0.0f}), face({0.0f, 1.0f, 0.0f}), face({9.0f, 9.0f, 9.0f})});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(resolver.describe(out), "I see your sister Asha and Ravi, who is friend and someone I don't recognize");
    EXPECT_EQ(resolver.describe({}), "I don't see any faces right now.");
}

TEST(IdentityResolver, FactsRankUnknownFacesFirst) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock;
    IdentityResolver resolver(gallery, clock);

    auto facts = resolver.facts(resolver.resolve({face({1.0f, 0.0f, 0.0f}), face({9.0f, 9.0f, 9.0f})}));
    ASSERT_EQ(facts.size(), 2u);
    EXPECT_EQ(facts[0].tier, PriorityTier::NORMAL);
    EXPECT_EQ(facts[1].tier, PriorityTier::HIGH);
    auto ordered = order_facts(facts);
    EXPECT_EQ(ordered[0].text, "someone I don't recognize");
}

TEST(IdentityResolver, MatchingLeavesCooldownsAlone) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock;
    IdentityResolver resolver(gallery, clock, 0.6f, 5.0);

    for (int i = 0; i < 10; ++i) {
        auto seen = resolver.match({face({1.0f, 0.0f, 0.0f})});
        ASSERT_EQ(seen.size(), 1u);
        EXPECT_TRUE(seen[0].known);
        clock.advance(0.1);
    }
    EXPECT_FALSE(resolver.last_announced("Asha").has_value());

    auto out = resolver.resolve({face({1.0f, 0.0f, 0.0f})});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(resolver.describe(out), "I see your sister Asha");
}

TEST(IdentityResolver, MarkAnnouncedStartsCooldownForKnownFacesOnly) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock(3.0);
    IdentityResolver resolver(gallery, clock, 0.6f, 5.0);

    resolver.mark_announced(resolver.match({face({0.0f, 1.0f, 0.0f}), face({9.0f, 9.0f, 9.0f})}));
    ASSERT_TRUE(resolver.last_announced("Ravi").has_value());
    EXPECT_DOUBLE_EQ(*resolver.last_announced("Ravi"), 3.0);
    EXPECT_FALSE(resolver.last_announced(IdentityResolver::kUnknownName).has_value());

    resolver.reset_cooldowns();
    EXPECT_FALSE(resolver.last_announced("Ravi").has_value());
}

TEST(IdentityResolver, RepeatQuestionDoesNotClaimAnEmptyRoom) {
    IdentityGallery gallery = family_gallery();
    ManualClock clock;
    IdentityResolver resolver(gallery, clock, 0.6f, 5.0);

    resolver.resolve({face({1.0f, 0.0f, 0.0f})});
    clock.set(2.0);
    size_t held = 0;
    auto out = resolver.resolve({face({1.0f, 0.0f, 0.0f})}, &held);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(held, 1u);
    EXPECT_EQ(resolver.describe(out, held), "I still see the same person as a moment ago.");

    held = 0;
    out = resolver.resolve({face({1.0f, 0.0f, 0.0f}), face({0.0f, 1.0f, 0.0f})}, &held);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Ravi");
    EXPECT_EQ(held, 1u);

    out = resolver.resolve({face({1.0f, 0.0f, 0.0f}), face({0.0f, 1.0f, 0.0f})}, &held);
    EXPECT_EQ(resolver.describe(out, held), "I still see the same 2 people as a moment ago.");
}
