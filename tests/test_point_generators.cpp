#include <gtest/gtest.h>
#include <generators/point_generators.hpp>
#include <cmath>

using namespace diffgrowth;

TEST(PointGeneratorsTest, FourPointsOnCircle) {
    std::vector<Vec2> points = generate_points_on_circle(0.0, 0.0, 10.0, 4);
    ASSERT_EQ(points.size(), 4u);

    EXPECT_NEAR(points[0].x, 10.0, 1e-12);
    EXPECT_NEAR(points[0].y, 0.0, 1e-12);
    EXPECT_NEAR(points[1].x, 0.0, 1e-12);
    EXPECT_NEAR(points[1].y, 10.0, 1e-12);
    EXPECT_NEAR(points[2].x, -10.0, 1e-12);
    EXPECT_NEAR(points[2].y, 0.0, 1e-12);
    EXPECT_NEAR(points[3].x, 0.0, 1e-12);
    EXPECT_NEAR(points[3].y, -10.0, 1e-12);
}

TEST(PointGeneratorsTest, ProducesExactlyCountPoints) {
    // An accumulated angle can overshoot or fall short of 2*pi;
    // the count must not depend on rounding
    for (size_t count = 1; count <= 200; ++count) {
        EXPECT_EQ(generate_points_on_circle(1.0, 2.0, 3.0, count).size(), count)
            << "count " << count;
    }
}

TEST(PointGeneratorsTest, ZeroCountIsEmpty) {
    EXPECT_TRUE(generate_points_on_circle(0.0, 0.0, 10.0, 0).empty());
}

TEST(PointGeneratorsTest, PointsAreEvenlySpacedAroundCenter) {
    const Vec2 center(100.0, -50.0);
    const double radius = 7.5;
    std::vector<Vec2> points = generate_points_on_circle(center.x, center.y, radius, 10);

    EXPECT_NEAR(points[0].x, center.x + radius, 1e-12);
    EXPECT_NEAR(points[0].y, center.y, 1e-12);

    const double side = points[0].distance_to(points[1]);
    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_NEAR(points[i].distance_to(center), radius, 1e-9);
        EXPECT_NEAR(points[i].distance_to(points[(i + 1) % points.size()]), side, 1e-9);
    }
}

TEST(PointGeneratorsTest, SeedOverloadMatches) {
    CircleSeed seed;
    seed.center = Vec2(3.0, 4.0);
    seed.radius = 2.0;
    seed.count = 7;

    EXPECT_EQ(generate_points_on_circle(seed), generate_points_on_circle(3.0, 4.0, 2.0, 7));
}
