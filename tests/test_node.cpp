#include <gtest/gtest.h>
#include <growth/node.hpp>
#include <cmath>
#include <vector>

using namespace diffgrowth;

TEST(NodeTest, StartsAtRest) {
    Node node(Vec2(3.0, -2.0), 1.0, 1.5);
    EXPECT_EQ(node.position, Vec2(3.0, -2.0));
    EXPECT_EQ(node.velocity, vec2::zero());
    EXPECT_EQ(node.acceleration, vec2::zero());
    EXPECT_DOUBLE_EQ(node.max_speed, 1.0);
    EXPECT_DOUBLE_EQ(node.max_force, 1.5);
}

TEST(NodeTest, ApplyForceAccumulates) {
    Node node(vec2::zero(), 1.0, 1.5);
    node.apply_force(Vec2(1.0, 0.0));
    node.apply_force(Vec2(0.0, 2.0));

    // No limit is applied when accumulating
    node.apply_force(Vec2(100.0, 0.0));
    EXPECT_DOUBLE_EQ(node.acceleration.x, 101.0);
    EXPECT_DOUBLE_EQ(node.acceleration.y, 2.0);
}

TEST(NodeTest, UpdateIntegratesAndClearsAcceleration) {
    Node node(Vec2(1.0, 1.0), 10.0, 1.5);
    node.apply_force(Vec2(1.0, 2.0));
    node.update();

    EXPECT_DOUBLE_EQ(node.velocity.x, 1.0);
    EXPECT_DOUBLE_EQ(node.velocity.y, 2.0);
    EXPECT_DOUBLE_EQ(node.position.x, 2.0);
    EXPECT_DOUBLE_EQ(node.position.y, 3.0);
    EXPECT_EQ(node.acceleration, vec2::zero());

    // Velocity carries over into the next step
    node.update();
    EXPECT_DOUBLE_EQ(node.position.x, 3.0);
    EXPECT_DOUBLE_EQ(node.position.y, 5.0);
}

TEST(NodeTest, UpdateCapsVelocity) {
    Node node(vec2::zero(), 1.0, 1.5);
    node.apply_force(Vec2(30.0, 40.0));
    node.update();

    EXPECT_NEAR(node.velocity.length(), 1.0, 1e-12);
    EXPECT_NEAR(node.velocity.x, 0.6, 1e-12);
    EXPECT_NEAR(node.velocity.y, 0.8, 1e-12);
    EXPECT_NEAR(node.position.x, 0.6, 1e-12);
    EXPECT_NEAR(node.position.y, 0.8, 1e-12);
}

TEST(NodeTest, VelocityCapHoldsForAnyAcceleration) {
    const double max_speed = 2.5;
    std::vector<Vec2> accelerations = {
        Vec2(0.0, 0.0), Vec2(1e-9, 0.0), Vec2(2.5, 0.0), Vec2(-1e6, 3e5),
        Vec2(1e150, -1e150), Vec2(-0.1, -0.1), Vec2(1.7, 1.9)
    };

    Node node(vec2::zero(), max_speed, 1.0);
    for (const auto& a : accelerations) {
        node.apply_force(a);
        node.update();
        EXPECT_LE(node.velocity.length(), max_speed * (1.0 + 1e-12));
        EXPECT_TRUE(node.position.is_finite());
    }
}

TEST(NodeTest, SeekAtRestSteersAtMaxSpeed) {
    Node node(vec2::zero(), 1.0, 1.5);
    Vec2 steer = node.seek(Vec2(10.0, 0.0));
    EXPECT_NEAR(steer.x, 1.0, 1e-12);
    EXPECT_NEAR(steer.y, 0.0, 1e-12);
}

TEST(NodeTest, SeekSubtractsVelocityAndCapsForce) {
    Node node(vec2::zero(), 1.0, 1.5);
    node.velocity = Vec2(-1.0, 0.0);

    // Desired (1, 0) minus velocity (-1, 0) is (2, 0), capped to 1.5
    Vec2 steer = node.seek(Vec2(10.0, 0.0));
    EXPECT_NEAR(steer.x, 1.5, 1e-12);
    EXPECT_NEAR(steer.y, 0.0, 1e-12);
}

TEST(NodeTest, SeekOwnPositionOnlyBrakes) {
    Node node(Vec2(4.0, 4.0), 1.0, 1.5);
    node.velocity = Vec2(0.5, 0.0);

    Vec2 steer = node.seek(Vec2(4.0, 4.0));
    EXPECT_TRUE(steer.is_finite());
    EXPECT_DOUBLE_EQ(steer.x, -0.5);
    EXPECT_DOUBLE_EQ(steer.y, 0.0);

    Node still(Vec2(4.0, 4.0), 1.0, 1.5);
    EXPECT_EQ(still.seek(Vec2(4.0, 4.0)), vec2::zero());
}

TEST(NodeTest, ToStringShowsState) {
    Node node(Vec2(1.0, 2.0), 1.0, 1.5);
    std::string s = node.to_string();
    EXPECT_NE(s.find("pos=(1, 2)"), std::string::npos);
    EXPECT_NE(s.find("vel=(0, 0)"), std::string::npos);
}
