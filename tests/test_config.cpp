#include <gtest/gtest.h>
#include "SimulationConfig.h"
#include <cstdlib>

TEST(Config, DefaultsAndSimpleVariantAreValid) {
  const SimulationConfig rich;
  const ConfigResult a = rich.validate();
  EXPECT_TRUE(a.ok) << a.message;
  EXPECT_EQ(rich.picks, 6u);
  EXPECT_TRUE(rich.enable_countdown);
  EXPECT_EQ(rich.selection_policy, SelectionPolicy::UniformWithoutReplacement);

  const SimulationConfig simple = SimulationConfig::simple_variant();
  const ConfigResult b = simple.validate();
  EXPECT_TRUE(b.ok) << b.message;
  EXPECT_EQ(simple.picks, 1u);
  EXPECT_EQ(simple.selection_policy, SelectionPolicy::MaxSpeed);
  EXPECT_FALSE(simple.enable_countdown);
  EXPECT_FALSE(simple.enable_line_up);
  EXPECT_FLOAT_EQ(simple.pull_gain, 0.0f);
  EXPECT_FLOAT_EQ(simple.orbital_gain, 0.0f);
  EXPECT_TRUE(simple.drift.isZero());
}

TEST(Config, ValidateRejectsOutOfRangeFields) {
  SimulationConfig cfg;
  cfg.damping = 1.2f;
  ConfigResult r = cfg.validate();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, LotteryError::InvalidConfig);
  EXPECT_NE(r.message.find("damping"), std::string::npos);

  cfg = SimulationConfig();
  cfg.damping = 1.0f;               // open interval
  EXPECT_FALSE(cfg.validate().ok);

  cfg = SimulationConfig();
  cfg.particle_count = 0;
  EXPECT_FALSE(cfg.validate().ok);

  cfg = SimulationConfig();
  cfg.particle_radius = 150.0f;      // bigger than the box
  EXPECT_FALSE(cfg.validate().ok);

  cfg = SimulationConfig();
  cfg.camera_min_zoom = 600.0f;      // above the max
  EXPECT_FALSE(cfg.validate().ok);

  cfg = SimulationConfig();
  cfg.max_steps_per_tick = 0;
  EXPECT_FALSE(cfg.validate().ok);
}

TEST(Config, SnapshotCoversEveryParameter) {
  const SimulationConfig cfg;
  const auto fields = cfg.to_fields();

  for (const char* name : {"particle_count", "picks", "damping", "min_speed", "pull_gain", "orbital_gain",
                           "jitter_gain", "drift_x", "expansion_gain", "hue", "saturation", "lightness",
                           "selection_policy"}) {
    EXPECT_NE(fields.find(name), fields.end()) << name;
  }
  EXPECT_EQ(fields.at("particle_count"), "1000");
  EXPECT_EQ(fields.at("selection_policy"), "uniform");
  EXPECT_DOUBLE_EQ(std::strtod(fields.at("damping").c_str(), nullptr), 0.995);
}

TEST(Config, FromFieldsOverlaysOnlyNamedParameters) {
  const SimulationConfig base;
  SimulationConfig out;
  out.particle_count = 1;

  const ConfigResult r = SimulationConfig::from_fields(
      base, {{"damping", "0.99"}, {"hue", "15"}, {"selection_policy", "max_speed"}}, out);
  ASSERT_TRUE(r.ok) << r.message;

  EXPECT_FLOAT_EQ(out.damping, 0.99f);
  EXPECT_FLOAT_EQ(out.hue, 15.0f);
  EXPECT_EQ(out.selection_policy, SelectionPolicy::MaxSpeed);
  EXPECT_EQ(out.particle_count, base.particle_count);
  EXPECT_FLOAT_EQ(out.lightness, base.lightness);
}

TEST(Config, FromFieldsIsAllOrNothing) {
  const SimulationConfig base;
  SimulationConfig out;
  out.hue = 1.0f;
  out.damping = 0.5f;

  // One bad field rejects the whole suggestion, good fields included
  const ConfigResult r = SimulationConfig::from_fields(base, {{"hue", "100"}, {"damping", "1.2"}}, out);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, LotteryError::InvalidConfig);
  EXPECT_FLOAT_EQ(out.hue, 1.0f);
  EXPECT_FLOAT_EQ(out.damping, 0.5f);
}

TEST(Config, FromFieldsRejectsMalformedInput) {
  const SimulationConfig base;
  SimulationConfig out;

  EXPECT_FALSE(SimulationConfig::from_fields(base, {}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"gravity", "1"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"hue", "purple"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"hue", "12abc"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"hue", ""}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"hue", "nan"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"particle_count", "12.5"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"particle_count", "20000"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"selection_policy", "loudest"}}, out).ok);
  // Cross-field: radius must stay below the (new) half extent
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"box_half_extent_y", "10"}, {"particle_radius", "12"}}, out).ok);
}

TEST(Config, BoundaryValuesAreInclusiveWhereDocumented) {
  const SimulationConfig base;
  SimulationConfig out;
  EXPECT_TRUE(SimulationConfig::from_fields(base, {{"hue", "0"}}, out).ok);
  EXPECT_TRUE(SimulationConfig::from_fields(base, {{"hue", "360"}}, out).ok);
  EXPECT_TRUE(SimulationConfig::from_fields(base, {{"particle_count", "10000"}}, out).ok);
  EXPECT_FALSE(SimulationConfig::from_fields(base, {{"damping", "0"}}, out).ok);
}

TEST(Config, StepDtFollowsRate) {
  SimulationConfig cfg;
  cfg.step_rate_hz = 120.0f;
  EXPECT_FLOAT_EQ(cfg.step_dt(), 1.0f / 120.0f);
}
