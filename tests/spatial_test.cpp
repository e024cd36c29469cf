#include <gtest/gtest.h>

#include "keycap-core/Spatial.hpp"
#include "tests/keycap_test_common.hpp"

using namespace keycap_test;

TEST(SpatialTest, RayTriangleHitAndMiss) {
    Vector3 v0(0, 0, 0), v1(1, 0, 0), v2(0, 1, 0);
    double t = 0;

    EXPECT_TRUE(intersectRayTriangle(Ray(Vector3(0.2, 0.2, -1), Vector3(0, 0, 1)), v0, v1, v2, t));
    EXPECT_NEAR(t, 1.0, 1e-12);

    EXPECT_FALSE(intersectRayTriangle(Ray(Vector3(0.8, 0.8, -1), Vector3(0, 0, 1)), v0, v1, v2, t));
    EXPECT_FALSE(intersectRayTriangle(Ray(Vector3(0.2, 0.2, 1), Vector3(0, 0, 1)), v0, v1, v2, t));
}

TEST(SpatialTest, TriangleNormalAndArea) {
    Vector3 v0(0, 0, 0), v1(2, 0, 0), v2(0, 2, 0);

    EXPECT_TRUE(calculateTriangleNormal(v0, v1, v2).approxEquals(Vector3(0, 0, 1), 1e-12));
    EXPECT_NEAR(calculateTriangleArea(v0, v1, v2), 2.0, 1e-12);
}

TEST(SpatialTest, TreeFindsNearestFace) {
    Mesh cube = makeBox(Vector3(-1, -1, 0), Vector3(1, 1, 3));
    AABBTree tree;
    EXPECT_FALSE(tree.isBuilt());

    tree.build(cube);
    ASSERT_TRUE(tree.isBuilt());

    RayHit up = tree.rayCast(Ray(Vector3(0.3, -0.4, -2), Vector3(0, 0, 1)));
    ASSERT_TRUE(up.hit);
    EXPECT_NEAR(up.distance, 2.0, 1e-9);
    EXPECT_NEAR(up.point.z, 0.0, 1e-9);

    RayHit down = tree.rayCast(Ray(Vector3(0.3, -0.4, 5), Vector3(0, 0, -1)));
    ASSERT_TRUE(down.hit);
    EXPECT_NEAR(down.point.z, 3.0, 1e-9);

    // From inside, the first surface crossed is the far wall
    RayHit inside = tree.rayCast(Ray(Vector3(0.3, -0.4, 1), Vector3(1, 0, 0)));
    ASSERT_TRUE(inside.hit);
    EXPECT_NEAR(inside.point.x, 1.0, 1e-9);
}

TEST(SpatialTest, TreeRespectsDistanceLimits) {
    Mesh cube = makeBox(Vector3(-1, -1, 0), Vector3(1, 1, 3));
    AABBTree tree;
    tree.build(cube);

    Ray ray(Vector3(0.3, -0.4, -2), Vector3(0, 0, 1));
    EXPECT_FALSE(tree.rayCast(ray, 1.5).hit);

    // Skipping the base leaves the top as nearest hit
    RayHit skip = tree.rayCast(ray, 100.0, 2.5);
    ASSERT_TRUE(skip.hit);
    EXPECT_NEAR(skip.point.z, 3.0, 1e-9);

    EXPECT_FALSE(tree.rayCast(Ray(Vector3(5, 5, -2), Vector3(0, 0, 1))).hit);
}

TEST(SpatialTest, AABBSlabIntersection) {
    AABB box;
    box.expand(Vector3(0, 0, 0));
    box.expand(Vector3(1, 2, 3));

    double tMin = 0, tMax = 0;
    EXPECT_TRUE(box.intersect(Ray(Vector3(0.5, 1, -1), Vector3(0, 0, 1)), tMin, tMax));
    EXPECT_NEAR(tMin, 1.0, 1e-12);
    EXPECT_NEAR(tMax, 4.0, 1e-12);

    EXPECT_FALSE(box.intersect(Ray(Vector3(2, 1, -1), Vector3(0, 0, 1)), tMin, tMax));
}
