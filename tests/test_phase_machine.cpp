#include <gtest/gtest.h>
#include "PhaseStateMachine.h"
#include "NumerologyEngine.h"
#include "EventSystem.h"
#include <set>

namespace {

SimulationConfig machine_config(size_t n = 50, size_t k = 6) {
  SimulationConfig cfg;
  cfg.particle_count = n;
  cfg.picks = k;
  cfg.rng_seed = 2024;
  return cfg;
}

// Field, selection and machine wired to one bus, like the session does
struct Rig {
  EventBus bus;
  ParticleField field;
  SelectionEngine selection;
  PhaseStateMachine machine;
  SimulationConfig cfg;

  explicit Rig(const SimulationConfig& c)
      : field(bus), selection(c.rng_seed), machine(field, selection, bus), cfg(c) {
    field.reset(cfg, cfg.rng_seed);
  }
};

} // namespace

TEST(PhaseMachine, StartsInIdleAndStartIsOnlyValidThere) {
  Rig rig(machine_config());
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Idle);
  EXPECT_FALSE(rig.machine.simulation_started());

  ASSERT_TRUE(rig.machine.start(0.0, rig.cfg));
  EXPECT_TRUE(rig.machine.simulation_started());
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Countdown);
  EXPECT_EQ(rig.machine.countdown_value(), 10);

  EXPECT_FALSE(rig.machine.start(0.1, rig.cfg));
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Countdown);
}

TEST(PhaseMachine, CountdownTicksOncePerSecondThenGoThenExplodes) {
  Rig rig(machine_config());
  std::vector<int> ticks;
  int go = 0;
  rig.bus.subscribe<CountdownTickEvent>(Events::COUNTDOWN_TICK, [&](const CountdownTickEvent& e) { ticks.push_back(e.value); });
  rig.bus.subscribe<CountdownGoEvent>(Events::COUNTDOWN_GO, [&](const CountdownGoEvent&) { ++go; });

  rig.machine.start(0.0, rig.cfg);
  rig.machine.update(0.5, rig.cfg);
  EXPECT_EQ(rig.machine.countdown_value(), 10);
  rig.machine.update(1.0, rig.cfg);
  EXPECT_EQ(rig.machine.countdown_value(), 9);
  rig.machine.update(3.2, rig.cfg);
  EXPECT_EQ(rig.machine.countdown_value(), 7);

  rig.machine.update(10.0, rig.cfg);
  EXPECT_EQ(rig.machine.countdown_value(), 0);
  EXPECT_TRUE(rig.machine.go_signalled());
  EXPECT_EQ(go, 1);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Countdown);

  rig.machine.update(10.49, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Countdown);
  EXPECT_EQ(go, 1);

  rig.machine.update(10.5, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Exploding);
  EXPECT_DOUBLE_EQ(rig.machine.phase_entered_at(), 10.5);

  const std::vector<int> expected = {10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 0};
  EXPECT_EQ(ticks, expected);
}

TEST(PhaseMachine, LateUpdateChainsThroughEveryDeadline) {
  Rig rig(machine_config());
  std::vector<PhaseChangedEvent> changes;
  rig.bus.subscribe<PhaseChangedEvent>(Events::PHASE_CHANGED, [&](const PhaseChangedEvent& e) { changes.push_back(e); });

  rig.machine.start(0.0, rig.cfg);
  rig.machine.update(100.0, rig.cfg);

  ASSERT_EQ(rig.machine.phase(), SessionPhase::Complete);
  ASSERT_EQ(changes.size(), 5u);
  EXPECT_EQ(changes[0].to, SessionPhase::Swirling);
  EXPECT_EQ(changes[1].to, SessionPhase::Countdown);
  EXPECT_EQ(changes[2].to, SessionPhase::Exploding);
  EXPECT_DOUBLE_EQ(changes[2].entered_at, 10.5);
  EXPECT_EQ(changes[3].to, SessionPhase::LiningUp);
  EXPECT_DOUBLE_EQ(changes[3].entered_at, 13.5);
  EXPECT_EQ(changes[4].to, SessionPhase::Complete);
  EXPECT_DOUBLE_EQ(changes[4].entered_at, 15.5);
}

TEST(PhaseMachine, DrawOnExplodingResultOnComplete) {
  Rig rig(machine_config());
  int draws = 0;
  const DrawResult* published = nullptr;
  rig.bus.subscribe<DrawCompletedEvent>(Events::DRAW_COMPLETED, [&](const DrawCompletedEvent&) { ++draws; });
  rig.bus.subscribe<ResultReadyEvent>(Events::RESULT_READY, [&](const ResultReadyEvent& e) { published = e.result; });

  rig.machine.select_now(0.0, rig.cfg);
  ASSERT_EQ(rig.machine.phase(), SessionPhase::Exploding);
  EXPECT_EQ(draws, 1);
  EXPECT_EQ(rig.machine.drawn_ids().size(), 6u);
  EXPECT_FALSE(rig.machine.result().has_value());
  EXPECT_EQ(rig.field.get_selected_ids().size(), 6u);

  rig.machine.update(3.0, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::LiningUp);
  EXPECT_FALSE(rig.machine.result().has_value());

  rig.machine.update(5.0, rig.cfg);
  ASSERT_EQ(rig.machine.phase(), SessionPhase::Complete);
  ASSERT_TRUE(rig.machine.result().has_value());
  EXPECT_EQ(draws, 1);

  const DrawResult& r = *rig.machine.result();
  EXPECT_EQ(published, &r);
  EXPECT_EQ(r.selected_ids, rig.machine.drawn_ids());
  EXPECT_EQ(r.sum, NumerologyEngine::sum_of(r.selected_ids));
  EXPECT_EQ(r.numerology_digit, NumerologyEngine::reduce_to_single_digit(r.sum));
  EXPECT_EQ(r.meaning, NumerologyEngine::meaning_of(r.numerology_digit));
  EXPECT_EQ(r.requested, 6u);
  EXPECT_FALSE(r.degraded);

  // Only the chosen particles remain visible
  for (size_t i = 0; i < rig.field.get_particle_count(); ++i) {
    EXPECT_EQ(rig.field.is_visible(i), rig.field.is_selected(i));
  }

  // Complete is terminal until a reset
  EXPECT_FALSE(rig.machine.select_now(50.0, rig.cfg));
  rig.machine.update(500.0, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Complete);
  EXPECT_EQ(draws, 1);
}

TEST(PhaseMachine, WithoutCountdownSwirlWaitsForManualSelect) {
  SimulationConfig cfg = machine_config();
  cfg.enable_countdown = false;
  Rig rig(cfg);

  rig.machine.start(0.0, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Swirling);
  rig.machine.update(1000.0, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Swirling);

  EXPECT_TRUE(rig.machine.select_now(1000.0, rig.cfg));
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Exploding);
  EXPECT_FALSE(rig.machine.select_now(1000.1, rig.cfg));
}

TEST(PhaseMachine, SelectNowCutsTheCountdownShort) {
  Rig rig(machine_config());
  rig.machine.start(0.0, rig.cfg);
  rig.machine.update(4.0, rig.cfg);

  EXPECT_TRUE(rig.machine.select_now(4.2, rig.cfg));
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Exploding);
  EXPECT_DOUBLE_EQ(rig.machine.phase_entered_at(), 4.2);
}

TEST(PhaseMachine, WithoutLineUpExplodingGoesStraightToComplete) {
  SimulationConfig cfg = machine_config();
  cfg.enable_line_up = false;
  Rig rig(cfg);

  rig.machine.select_now(0.0, rig.cfg);
  rig.machine.update(cfg.explosion_duration_s, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Complete);
  EXPECT_FALSE(rig.field.is_line_up_active());
  EXPECT_TRUE(rig.machine.result().has_value());
}

TEST(PhaseMachine, TooFewParticlesDegradesInsteadOfFailing) {
  Rig rig(machine_config(3, 6));
  std::vector<SelectionDegradedEvent> degraded;
  rig.bus.subscribe<SelectionDegradedEvent>(Events::SELECTION_DEGRADED,
                                            [&](const SelectionDegradedEvent& e) { degraded.push_back(e); });

  rig.machine.select_now(0.0, rig.cfg);
  rig.machine.update(100.0, rig.cfg);

  ASSERT_EQ(rig.machine.phase(), SessionPhase::Complete);
  ASSERT_EQ(degraded.size(), 1u);
  EXPECT_EQ(degraded[0].error, LotteryError::InsufficientParticles);
  EXPECT_EQ(degraded[0].requested, 6u);
  EXPECT_EQ(degraded[0].available, 3u);

  const DrawResult& r = *rig.machine.result();
  EXPECT_TRUE(r.degraded);
  std::set<int> ids(r.selected_ids.begin(), r.selected_ids.end());
  EXPECT_EQ(ids, std::set<int>({1, 2, 3}));
  EXPECT_EQ(r.sum, 6u);
}

TEST(PhaseMachine, ResetToIdleCancelsPendingDeadlines) {
  Rig rig(machine_config());
  rig.machine.start(0.0, rig.cfg);
  rig.machine.update(11.0, rig.cfg);
  ASSERT_EQ(rig.machine.phase(), SessionPhase::Exploding);

  rig.machine.reset_to_idle(11.5);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Idle);
  EXPECT_FALSE(rig.machine.simulation_started());
  EXPECT_TRUE(rig.machine.drawn_ids().empty());

  rig.machine.update(1000.0, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Idle);
  EXPECT_FALSE(rig.machine.result().has_value());
}

TEST(PhaseMachine, ZeroCountdownGoesAtOnce) {
  SimulationConfig cfg = machine_config();
  cfg.countdown_start = 0;
  Rig rig(cfg);

  rig.machine.start(0.0, rig.cfg);
  rig.machine.update(0.0, rig.cfg);
  EXPECT_TRUE(rig.machine.go_signalled());
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Countdown);

  rig.machine.update(0.5, rig.cfg);
  EXPECT_EQ(rig.machine.phase(), SessionPhase::Exploding);
}

TEST(PhaseMachine, StepContextTracksLineUpAndFade) {
  Rig rig(machine_config());
  rig.machine.select_now(0.0, rig.cfg);

  const StepContext exploding = rig.machine.step_context(1.0, rig.cfg);
  EXPECT_EQ(exploding.phase, SessionPhase::Exploding);
  EXPECT_FLOAT_EQ(exploding.phase_elapsed_s, 1.0f);
  EXPECT_FLOAT_EQ(exploding.fade_per_step, rig.cfg.step_dt() / rig.cfg.fade_duration_s);

  rig.machine.update(3.0, rig.cfg);
  const StepContext lining = rig.machine.step_context(4.0, rig.cfg);
  EXPECT_FLOAT_EQ(lining.line_up_t, 0.5f);
  const StepContext overdue = rig.machine.step_context(4.9, rig.cfg);
  EXPECT_LE(overdue.line_up_t, 1.0f);
}

TEST(PhaseMachine, LineUpSlotsAreCentredAndFitTheBox) {
  const geom::CenteredBox box{Eigen::Vector3f(100.0f, 100.0f, 100.0f)};

  const auto one = PhaseStateMachine::line_up_slots(1, 20.0f, box, 2.0f);
  ASSERT_EQ(one.size(), 1u);
  EXPECT_TRUE(one[0].isZero());

  const auto six = PhaseStateMachine::line_up_slots(6, 20.0f, box, 2.0f);
  ASSERT_EQ(six.size(), 6u);
  EXPECT_FLOAT_EQ(six.front().x(), -50.0f);
  EXPECT_FLOAT_EQ(six.back().x(), 50.0f);
  EXPECT_FLOAT_EQ(six[1].x() - six[0].x(), 20.0f);

  const auto many = PhaseStateMachine::line_up_slots(64, 20.0f, box, 2.0f);
  for (const auto& s : many) {
    EXPECT_TRUE(box.contains(s, 2.0f - 1e-3f));
  }
  EXPECT_NEAR(many.front().x(), -98.0f, 1e-3f);

  EXPECT_TRUE(PhaseStateMachine::line_up_slots(0, 20.0f, box, 2.0f).empty());
}
