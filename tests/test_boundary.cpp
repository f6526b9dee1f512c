#include <gtest/gtest.h>
#include "BoundaryCollision.h"
#include "Color.h"
#include <random>

namespace {
geom::CenteredBox unit_box(float half) {
  return geom::CenteredBox{Eigen::Vector3f(half, half, half)};
}
}

TEST(Boundary, InsideIsUntouched) {
  Eigen::Vector3f pos(1.0f, -2.0f, 3.0f);
  Eigen::Vector3f vel(0.1f, 0.2f, -0.3f);
  const uint8_t mask = BoundaryCollision::resolve(pos, vel, unit_box(10.0f), 1.0f);

  EXPECT_EQ(mask, BoundaryCollision::Axis_None);
  EXPECT_TRUE(pos.isApprox(Eigen::Vector3f(1.0f, -2.0f, 3.0f)));
  EXPECT_TRUE(vel.isApprox(Eigen::Vector3f(0.1f, 0.2f, -0.3f)));
}

TEST(Boundary, PositiveWallClampsAndFlipsThatAxisOnly) {
  Eigen::Vector3f pos(9.5f, 0.0f, 0.0f);
  Eigen::Vector3f vel(0.4f, 0.1f, -0.2f);
  const uint8_t mask = BoundaryCollision::resolve(pos, vel, unit_box(10.0f), 1.0f);

  EXPECT_EQ(mask, BoundaryCollision::Axis_X);
  EXPECT_FLOAT_EQ(pos.x(), 9.0f);
  EXPECT_FLOAT_EQ(vel.x(), -0.4f);
  EXPECT_FLOAT_EQ(vel.y(), 0.1f);
  EXPECT_FLOAT_EQ(vel.z(), -0.2f);
}

TEST(Boundary, NegativeWallMirrors) {
  Eigen::Vector3f pos(0.0f, -12.0f, 0.0f);
  Eigen::Vector3f vel(0.0f, -0.5f, 0.0f);
  const uint8_t mask = BoundaryCollision::resolve(pos, vel, unit_box(10.0f), 2.0f);

  EXPECT_EQ(mask, BoundaryCollision::Axis_Y);
  EXPECT_FLOAT_EQ(pos.y(), -8.0f);
  EXPECT_FLOAT_EQ(vel.y(), 0.5f);
}

TEST(Boundary, CornerHitResolvesEveryAxisIndependently) {
  Eigen::Vector3f pos(20.0f, -20.0f, 20.0f);
  Eigen::Vector3f vel(1.0f, -1.0f, 1.0f);
  const uint8_t mask = BoundaryCollision::resolve(pos, vel, unit_box(10.0f), 0.5f);

  EXPECT_EQ(mask, BoundaryCollision::Axis_X | BoundaryCollision::Axis_Y | BoundaryCollision::Axis_Z);
  EXPECT_TRUE(pos.isApprox(Eigen::Vector3f(9.5f, -9.5f, 9.5f)));
  EXPECT_TRUE(vel.isApprox(Eigen::Vector3f(-1.0f, 1.0f, -1.0f)));
  EXPECT_TRUE(unit_box(10.0f).contains(pos, 0.5f));
}

TEST(Boundary, NonCubicBoxUsesPerAxisExtent) {
  const geom::CenteredBox box{Eigen::Vector3f(50.0f, 10.0f, 5.0f)};
  Eigen::Vector3f pos(30.0f, 30.0f, 30.0f);
  Eigen::Vector3f vel(1.0f, 1.0f, 1.0f);
  const uint8_t mask = BoundaryCollision::resolve(pos, vel, box, 1.0f);

  EXPECT_EQ(mask, BoundaryCollision::Axis_Y | BoundaryCollision::Axis_Z);
  EXPECT_FLOAT_EQ(pos.x(), 30.0f);
  EXPECT_FLOAT_EQ(pos.y(), 9.0f);
  EXPECT_FLOAT_EQ(pos.z(), 4.0f);
}

TEST(Boundary, RecolorOncePerStepAndNeverWhenSelected) {
  const uint8_t two_axes = BoundaryCollision::Axis_X | BoundaryCollision::Axis_Z;
  EXPECT_TRUE(BoundaryCollision::should_recolor(two_axes, false, true));
  EXPECT_FALSE(BoundaryCollision::should_recolor(two_axes, true, true));
  EXPECT_FALSE(BoundaryCollision::should_recolor(two_axes, false, false));
  EXPECT_FALSE(BoundaryCollision::should_recolor(BoundaryCollision::Axis_None, false, true));
}

TEST(Boundary, BouncePaletteStaysInValidRgb) {
  std::mt19937 rng(9);
  for (int i = 0; i < 500; ++i) {
    const Color c = BouncePalette::random_color(rng);
    ASSERT_GE(c.r, 0.0f); ASSERT_LE(c.r, 1.0f);
    ASSERT_GE(c.g, 0.0f); ASSERT_LE(c.g, 1.0f);
    ASSERT_GE(c.b, 0.0f); ASSERT_LE(c.b, 1.0f);
  }
}

TEST(Boundary, HslPrimaries) {
  const Color red = Color::from_hsl(0.0f, 100.0f, 50.0f);
  EXPECT_NEAR(red.r, 1.0f, 1e-5f);
  EXPECT_NEAR(red.g, 0.0f, 1e-5f);
  EXPECT_NEAR(red.b, 0.0f, 1e-5f);

  const Color blue = Color::from_hsl(240.0f, 100.0f, 50.0f);
  EXPECT_NEAR(blue.b, 1.0f, 1e-5f);
  EXPECT_NEAR(blue.r, 0.0f, 1e-5f);

  // Negative and wrapped hues land on the same color
  const Color wrapped = Color::from_hsl(-120.0f, 100.0f, 50.0f);
  EXPECT_NEAR(wrapped.b, 1.0f, 1e-5f);

  const Color grey = Color::from_hsl(123.0f, 0.0f, 40.0f);
  EXPECT_NEAR(grey.r, 0.4f, 1e-5f);
  EXPECT_NEAR(grey.g, 0.4f, 1e-5f);
  EXPECT_NEAR(grey.b, 0.4f, 1e-5f);
}
