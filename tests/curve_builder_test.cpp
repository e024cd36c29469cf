#include <gtest/gtest.h>

#include "keycap-core/cad/CurveBuilder.hpp"
#include "tests/keycap_test_common.hpp"

#include <cmath>

using namespace keycap_test;

TEST(MonotoneCubicTest, PassesThroughSamplesWithoutOvershoot) {
    MonotoneCubic curve({0.0, 1.0, 2.0, 3.0}, {0.0, 0.0, 1.0, 1.0});

    EXPECT_DOUBLE_EQ(curve.evaluate(0.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(1.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(2.0), 1.0);
    EXPECT_DOUBLE_EQ(curve.evaluate(3.0), 1.0);

    double previous = curve.evaluate(0.0);
    for (int i = 1; i <= 300; ++i) {
        double x = 3.0 * i / 300.0;
        double y = curve.evaluate(x);
        EXPECT_GE(y, -1e-12);
        EXPECT_LE(y, 1.0 + 1e-12);
        EXPECT_GE(y, previous - 1e-12);
        previous = y;
    }
}

TEST(MonotoneCubicTest, TwoSamplesAreLinear) {
    MonotoneCubic line({0.0, 10.0}, {0.0, 5.0});

    EXPECT_NEAR(line.evaluate(4.0), 2.0, 1e-12);
    EXPECT_NEAR(line.derivative(4.0), 0.5, 1e-12);
    // Linear continuation past the ends
    EXPECT_NEAR(line.evaluate(-2.0), -1.0, 1e-12);
    EXPECT_NEAR(line.evaluate(12.0), 6.0, 1e-12);
}

TEST(CurveBuilderTest, BaseSectionIsFootprint) {
    auto profile = ProfileTable::defaults().lookup(ProfileFamily::Cherry, ProfileRow::R1);
    ASSERT_TRUE(profile.success);

    auto curve = buildCurve(profile.value, 1.0);
    ASSERT_TRUE(curve.success) << curve.errorMessage;

    EXPECT_NEAR(curve.value.footprintWidth(), 18.15, 1e-9);
    EXPECT_NEAR(curve.value.footprintDepth(), 18.15, 1e-9);
    EXPECT_DOUBLE_EQ(curve.value.height(), 11.5);

    SectionRect base = curve.value.sectionAt(0.0);
    EXPECT_NEAR(base.xMin, -9.075, 1e-9);
    EXPECT_NEAR(base.xMax, 9.075, 1e-9);
    EXPECT_NEAR(base.yMin, -9.075, 1e-9);
    EXPECT_NEAR(base.yMax, 9.075, 1e-9);

    // Top: 2.75 side inset, 3.4 front inset, no back inset
    SectionRect top = curve.value.sectionAt(11.5);
    EXPECT_NEAR(top.width(), 18.15 - 5.5, 1e-9);
    EXPECT_NEAR(top.yMax, 9.075 - 3.4, 1e-9);
    EXPECT_NEAR(top.yMin, -9.075, 1e-9);
}

TEST(CurveBuilderTest, SectionsNarrowMonotonically) {
    for (ProfileFamily family : {ProfileFamily::Cherry, ProfileFamily::OEM, ProfileFamily::SA}) {
        auto profile = ProfileTable::defaults().lookup(family, ProfileRow::R2);
        ASSERT_TRUE(profile.success);

        auto curve = buildCurve(profile.value, 1.5);
        ASSERT_TRUE(curve.success) << curve.errorMessage;

        auto sections = curve.value.sampleSections(40);
        ASSERT_EQ(sections.size(), 40u);
        EXPECT_DOUBLE_EQ(sections.back().z, curve.value.height());

        for (size_t i = 1; i < sections.size(); ++i) {
            EXPECT_GT(sections[i].z, sections[i - 1].z);
            EXPECT_LE(sections[i].width(), sections[i - 1].width() + 1e-12);
            EXPECT_LE(sections[i].depth(), sections[i - 1].depth() + 1e-12);
        }
    }
}

TEST(CurveBuilderTest, DefaultSectionCount) {
    auto profile = ProfileTable::defaults().lookup(ProfileFamily::OEM, ProfileRow::R3);
    auto curve = buildCurve(profile.value, 2.25);
    ASSERT_TRUE(curve.success);

    EXPECT_EQ(curve.value.sectionCount(), 5);
    EXPECT_EQ(curve.value.sampleSections().size(), 5u);
    EXPECT_TRUE(curve.value.sampleSections(1).empty());
}

TEST(CurveBuilderTest, FootprintIsContinuousInWidth) {
    auto profile = ProfileTable::defaults().lookup(ProfileFamily::Cherry, ProfileRow::R3);

    for (double units : {1.0, 1.25, 2.0, 6.25}) {
        auto a = buildCurve(profile.value, units);
        auto b = buildCurve(profile.value, units + 1e-6);
        ASSERT_TRUE(a.success && b.success);

        for (double z : {0.0, 2.0, 4.25, 8.5}) {
            SectionRect sa = a.value.sectionAt(z);
            SectionRect sb = b.value.sectionAt(z);
            EXPECT_NEAR(sa.width(), sb.width(), 1e-4);
            EXPECT_NEAR(sa.depth(), sb.depth(), 1e-9);
        }
    }
}

TEST(CurveBuilderTest, RejectsBadInputs) {
    auto profile = ProfileTable::defaults().lookup(ProfileFamily::Cherry, ProfileRow::R3);

    auto zeroWidth = buildCurve(profile.value, 0.0);
    EXPECT_FALSE(zeroWidth.success);
    EXPECT_EQ(zeroWidth.errorCode, errors::kConfiguration);

    CurveOptions options;
    options.sections = 1;
    auto oneSection = buildCurve(profile.value, 1.0, options);
    EXPECT_FALSE(oneSection.success);
    EXPECT_EQ(oneSection.errorCode, errors::kConfiguration);
}

TEST(CurveBuilderTest, InvalidProfiles) {
    // Single sample
    auto single = buildCurve(ProfileDefinition({{0.0, 0.0, 0.0, 0.0}}), 1.0);
    EXPECT_FALSE(single.success);
    EXPECT_EQ(single.errorCode, errors::kInvalidProfile);

    // Heights not increasing
    auto unordered = buildCurve(ProfileDefinition({
        {0.0, 0.0, 0.0, 0.0}, {5.0, 1.0, 1.0, 0.0}, {4.0, 2.0, 2.0, 0.0}
    }), 1.0);
    EXPECT_EQ(unordered.errorCode, errors::kInvalidProfile);

    // Side insets meet in the middle of a 1U cap
    auto collapsed = buildCurve(linearProfile(10.0, 9.2, 0.0), 1.0);
    EXPECT_EQ(collapsed.errorCode, errors::kInvalidProfile);

    // ...but fit on a 2U cap
    EXPECT_TRUE(buildCurve(linearProfile(10.0, 9.2, 0.0), 2.0).success);

    auto negative = buildCurve(linearProfile(10.0, -1.0, 0.0), 1.0);
    EXPECT_EQ(negative.errorCode, errors::kInvalidProfile);
}
