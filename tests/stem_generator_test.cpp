#include <gtest/gtest.h>

#include "keycap-core/cad/BooleanCompositor.hpp"
#include "keycap-core/cad/CurveBuilder.hpp"
#include "keycap-core/cad/ShellLofter.hpp"
#include "keycap-core/cad/StemGenerator.hpp"
#include "tests/keycap_test_common.hpp"

#include <algorithm>

using namespace keycap_test;

namespace {

StemFrame roomyFrame() {
    StemFrame frame;
    frame.cavityDepth = 5.0;
    frame.ceilingHeight = 5.0;
    frame.wallThickness = 1.0;
    frame.clearance.xMin = -6.0;
    frame.clearance.xMax = 6.0;
    frame.clearance.yMin = -6.0;
    frame.clearance.yMax = 6.0;
    return frame;
}

SolidPtr straightShell() {
    auto curve = buildCurve(linearProfile(10.0, 2.0, 2.0), 1.0);
    EXPECT_TRUE(curve.success) << curve.errorMessage;
    auto shell = loft(curve.value);
    EXPECT_TRUE(shell.success) << shell.errorMessage;
    return shell.value.solid;
}

} // namespace

TEST(StemGeneratorTest, CrossOutline) {
    CherryMXCrossStem stem;
    EXPECT_EQ(stem.type(), StemType::CherryMX);

    auto outline = stem.outline();
    ASSERT_EQ(outline.size(), 12u);

    double minX = 0, maxX = 0, minY = 0, maxY = 0, area = 0;
    for (size_t i = 0; i < outline.size(); ++i) {
        const Vector3& p = outline[i];
        const Vector3& q = outline[(i + 1) % outline.size()];
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
        area += p.x * q.y - q.x * p.y;
        EXPECT_DOUBLE_EQ(p.z, 0.0);
    }
    area /= 2.0;

    EXPECT_NEAR(maxX - minX, 4.15, 1e-12);
    EXPECT_NEAR(maxY - minY, 4.15, 1e-12);
    // Counter-clockwise, two blades minus the shared centre
    EXPECT_NEAR(area, 2 * 4.15 * 1.29 - 1.29 * 1.29, 1e-9);
}

TEST(StemGeneratorTest, FactoryAndNone) {
    EXPECT_EQ(makeStemGeometry(StemType::None), nullptr);

    auto geometry = makeStemGeometry(StemType::CherryMX);
    ASSERT_NE(geometry, nullptr);
    EXPECT_EQ(geometry->type(), StemType::CherryMX);

    auto none = buildStem(StemType::None, roomyFrame());
    EXPECT_TRUE(none.success);
    EXPECT_EQ(none.value, nullptr);
}

TEST(StemGeneratorTest, StemReachesIntoCeiling) {
    auto stem = buildStem(StemType::CherryMX, roomyFrame());
    ASSERT_TRUE(stem.success) << stem.errorMessage;
    ASSERT_TRUE(stem.value);

    // Cavity depth plus half the wall
    BoundingBox box = stem.value->getBoundingBox();
    EXPECT_NEAR(box.min.z, 0.0, 1e-6);
    EXPECT_NEAR(box.max.z, 5.5, 1e-6);
    EXPECT_NEAR(box.size().x, 4.15, 1e-6);

    const double crossArea = 2 * 4.15 * 1.29 - 1.29 * 1.29;
    EXPECT_NEAR(stem.value->getVolume(), crossArea * 5.5, 1e-6);
    EXPECT_TRUE(stem.value->check().isSound());

    // Twelve-sided prism: caps plus walls
    const double perimeter = 4 * 1.29 + 8 * (4.15 - 1.29) / 2.0;
    EXPECT_NEAR(stem.value->getSurfaceArea(), 2 * crossArea + perimeter * 5.5, 1e-6);
    EXPECT_EQ(stem.value->getFaceCount(), 14u);
    EXPECT_EQ(stem.value->getEdgeCount(), 36u);
    EXPECT_TRUE(stem.value->getCenterOfMass().approxEquals(Vector3(0, 0, 2.75), 1e-6));
}

TEST(StemGeneratorTest, StemMustFitClearance) {
    StemFrame tight = roomyFrame();
    tight.clearance.xMin = -1.5;
    tight.clearance.xMax = 1.5;

    auto stem = buildStem(StemType::CherryMX, tight);
    EXPECT_FALSE(stem.success);
    EXPECT_EQ(stem.errorCode, errors::kDegenerateGeometry);

    StemFrame shallow = roomyFrame();
    shallow.cavityDepth = 0.0;
    EXPECT_EQ(buildStem(StemType::CherryMX, shallow).errorCode, errors::kDegenerateGeometry);
}

TEST(BooleanCompositorTest, RequiresOuterAndCavity) {
    auto stem = buildStem(StemType::CherryMX, roomyFrame());
    ASSERT_TRUE(stem.success);

    auto result = composite(nullptr, nullptr, stem.value);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errors::kBooleanFailure);
}

TEST(BooleanCompositorTest, CavityContainingOuterLeavesNothing) {
    auto stem = buildStem(StemType::CherryMX, roomyFrame());
    ASSERT_TRUE(stem.success);
    SolidPtr shell = straightShell();
    ASSERT_TRUE(shell);

    // The cross lies entirely inside the shell, so the cut is empty
    auto result = composite(stem.value, shell, nullptr);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errors::kBooleanFailure);
}

TEST(BooleanCompositorTest, CavityIdenticalToOuter) {
    SolidPtr shell = straightShell();
    ASSERT_TRUE(shell);

    auto result = composite(shell, shell, nullptr);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errors::kBooleanFailure);
}

TEST(BooleanCompositorTest, DetachedStemIsRejected) {
    SolidPtr shell = straightShell();
    ASSERT_TRUE(shell);

    auto curve = buildCurve(linearProfile(10.0, 2.0, 2.0), 1.0);
    ASSERT_TRUE(curve.success);
    auto hollowed = hollow(LoftedShell{shell, curve.value});
    ASSERT_TRUE(hollowed.success) << hollowed.errorMessage;

    StemFrame lifted = hollowed.value.frame;
    lifted.origin = lifted.origin + Vector3(0, 0, 50.0);
    auto stem = buildStem(StemType::CherryMX, lifted);
    ASSERT_TRUE(stem.success) << stem.errorMessage;

    auto attached = composite(hollowed.value.outer, hollowed.value.cavity, nullptr);
    ASSERT_TRUE(attached.success) << attached.errorMessage;

    // Union of two disjoint solids is not a single solid
    auto result = composite(hollowed.value.outer, hollowed.value.cavity, stem.value);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, errors::kBooleanFailure);
}
