#include <gtest/gtest.h>

#include "keycap-core/cad/BevelEngine.hpp"
#include "keycap-core/cad/CurveBuilder.hpp"
#include "keycap-core/cad/ShellLofter.hpp"
#include "tests/keycap_test_common.hpp"

#include <cmath>

using namespace keycap_test;

namespace {

CrossSectionCurve curveFor(ProfileFamily family, ProfileRow row, double units) {
    auto profile = ProfileTable::defaults().lookup(family, row);
    EXPECT_TRUE(profile.success);
    auto curve = buildCurve(profile.value, units);
    EXPECT_TRUE(curve.success) << curve.errorMessage;
    return curve.value;
}

CrossSectionCurve customCurve(const ProfileDefinition& profile) {
    auto curve = buildCurve(profile, 1.0);
    EXPECT_TRUE(curve.success) << curve.errorMessage;
    return curve.value;
}

} // namespace

TEST(ShellLofterTest, LoftIsSoundAndMatchesCurve) {
    CrossSectionCurve curve = curveFor(ProfileFamily::Cherry, ProfileRow::R3, 1.0);

    auto shell = loft(curve);
    ASSERT_TRUE(shell.success) << shell.errorMessage;
    ASSERT_TRUE(shell.value.solid);

    SolidCheck check = shell.value.solid->check();
    EXPECT_TRUE(check.isSound());

    BoundingBox box = shell.value.solid->getBoundingBox();
    Vector3 size = box.size();
    EXPECT_NEAR(size.x, 18.15, 0.05);
    EXPECT_NEAR(size.y, 18.15, 0.05);
    EXPECT_NEAR(size.z, 8.5, 0.05);
    EXPECT_NEAR(box.min.z, 0.0, 0.05);

    // Volume lies between the top-section prism and the footprint prism
    SectionRect top = curve.sectionAt(curve.height());
    double inner = top.width() * top.depth() * curve.height();
    double outer = 18.15 * 18.15 * curve.height();
    double volume = shell.value.solid->getVolume();
    EXPECT_GT(volume, inner);
    EXPECT_LT(volume, outer);
}

TEST(ShellLofterTest, OuterShellHasEightSharpEdges) {
    // Four around the top face, four vertical corners; base edges face down
    auto shell = loft(curveFor(ProfileFamily::OEM, ProfileRow::R2, 1.25));
    ASSERT_TRUE(shell.success) << shell.errorMessage;

    auto count = countSharpEdges(shell.value.solid);
    ASSERT_TRUE(count.success);
    EXPECT_EQ(count.value, 8u);
}

TEST(ShellLofterTest, OuterTopologyIsIndependentOfWidth) {
    auto narrow = loft(curveFor(ProfileFamily::Cherry, ProfileRow::R3, 1.0));
    ASSERT_TRUE(narrow.success) << narrow.errorMessage;

    for (double units : {1.25, 2.0, 6.25, 7.0}) {
        auto wide = loft(curveFor(ProfileFamily::Cherry, ProfileRow::R3, units));
        ASSERT_TRUE(wide.success) << units << ": " << wide.errorMessage;

        EXPECT_EQ(wide.value.solid->getFaceCount(), narrow.value.solid->getFaceCount());
        EXPECT_EQ(wide.value.solid->getEdgeCount(), narrow.value.solid->getEdgeCount());
        EXPECT_EQ(countSharpEdges(wide.value.solid).value, 8u);
        EXPECT_GT(wide.value.solid->getVolume(), narrow.value.solid->getVolume());
    }
}

TEST(ShellLofterTest, CavityKeepsNormalWallThickness) {
    CrossSectionCurve curve = curveFor(ProfileFamily::Cherry, ProfileRow::R1, 1.0);
    const double t = 0.91;

    for (double z : {0.0, 3.0, 7.5}) {
        SectionRect outer = curve.sectionAt(z);
        SectionRect cavity = cavitySectionAt(curve, z, t);
        InsetSlopes slopes = curve.slopesAt(z);

        EXPECT_NEAR(cavity.xMin - outer.xMin, t * std::sqrt(1 + slopes.side * slopes.side), 1e-12);
        EXPECT_NEAR(outer.yMax - cavity.yMax, t * std::sqrt(1 + slopes.front * slopes.front), 1e-12);
        EXPECT_GE(cavity.xMin - outer.xMin, t);
    }
}

TEST(ShellLofterTest, HollowDefaultThickness) {
    CrossSectionCurve curve = curveFor(ProfileFamily::Cherry, ProfileRow::R3, 1.0);
    auto shell = loft(curve);
    ASSERT_TRUE(shell.success);

    auto hollowed = hollow(shell.value);
    ASSERT_TRUE(hollowed.success) << hollowed.errorMessage;
    EXPECT_TRUE(hollowed.warnings.empty());

    const HollowShell& h = hollowed.value;
    EXPECT_FALSE(h.thicknessClamped);
    EXPECT_DOUBLE_EQ(h.wallThickness, 0.91);
    EXPECT_EQ(h.outer, shell.value.solid);
    ASSERT_TRUE(h.cavity);
    EXPECT_TRUE(h.cavity->check().isSound());

    EXPECT_NEAR(h.frame.ceilingHeight, 8.5 - 0.91, 1e-9);
    EXPECT_NEAR(h.frame.cavityDepth, 8.5 - 0.91, 1e-9);
    EXPECT_TRUE(h.frame.origin.approxEquals(Vector3(0, 0, 0), 1e-12));
    EXPECT_GT(h.frame.clearance.width(), 5.0);
    EXPECT_GT(h.frame.clearance.depth(), 5.0);

    // The cavity reaches below the base plane so the subtraction opens it
    BoundingBox cavityBox = h.cavity->getBoundingBox();
    EXPECT_NEAR(cavityBox.min.z, -0.5, 0.05);
    EXPECT_NEAR(cavityBox.max.z, 8.5 - 0.91, 0.05);
    EXPECT_LT(h.cavity->getVolume(), shell.value.solid->getVolume());
}

TEST(ShellLofterTest, OversizedWallIsClamped) {
    // Steep side walls: 8 mm side inset over 10 mm height
    CrossSectionCurve curve = customCurve(linearProfile(10.0, 8.0, 0.0));
    auto shell = loft(curve);
    ASSERT_TRUE(shell.success) << shell.errorMessage;

    auto hollowed = hollow(shell.value, 6.0);
    ASSERT_TRUE(hollowed.success) << hollowed.errorMessage;

    const HollowShell& h = hollowed.value;
    EXPECT_TRUE(h.thicknessClamped);
    EXPECT_LT(h.wallThickness, 6.0);
    EXPECT_GE(h.wallThickness, 0.3);
    EXPECT_DOUBLE_EQ(h.frame.wallThickness, h.wallThickness);
    ASSERT_EQ(hollowed.warnings.size(), 1u);
    EXPECT_NE(hollowed.warnings[0].find("clamped"), std::string::npos);

    // The clamped thickness is the largest feasible one
    EXPECT_NEAR(maxFeasibleThickness(curve, 6.0), h.wallThickness, 1e-9);
    EXPECT_DOUBLE_EQ(maxFeasibleThickness(curve, h.wallThickness * 0.5), h.wallThickness * 0.5);
}

TEST(ShellLofterTest, NoFeasibleCavity) {
    // 1.2 mm tall: even a 0.3 mm wall leaves less than 1 mm of cavity
    CrossSectionCurve curve = customCurve(linearProfile(1.2, 0.2, 0.2));
    auto shell = loft(curve);
    ASSERT_TRUE(shell.success) << shell.errorMessage;

    auto hollowed = hollow(shell.value, 0.91);
    EXPECT_FALSE(hollowed.success);
    EXPECT_EQ(hollowed.errorCode, errors::kDegenerateGeometry);
}

TEST(ShellLofterTest, HollowRejectsBadInput) {
    LoftedShell empty;
    EXPECT_EQ(hollow(empty).errorCode, errors::kDegenerateGeometry);

    auto shell = loft(curveFor(ProfileFamily::SA, ProfileRow::R3, 1.0));
    ASSERT_TRUE(shell.success);
    EXPECT_EQ(hollow(shell.value, 0.0).errorCode, errors::kConfiguration);
}
