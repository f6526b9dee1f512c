#pragma once
#include "Bounds.hpp"
#include "EventSystem.h"
#include "ParticleField.h"
#include "SelectionEngine.h"
#include "SessionPhase.h"
#include "SimulationConfig.h"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Final, immutable outcome of one draw
struct DrawResult {
    std::vector<int> selected_ids;   // draw order, not sorted
    uint64_t sum;
    int numerology_digit;
    std::string meaning;
    size_t requested;                // K asked for
    bool degraded;                   // fewer than K particles existed
};

/*
    Idle -> Swirling -> [Countdown] -> Exploding -> [LiningUp] -> Complete

    Timed transitions compare wall-clock time against the phase entry time and
    are evaluated by update(). A late update catches up through every deadline
    it has passed, and each new phase is stamped with the deadline it was due
    at, not with the time the update happened to run.
*/
class PhaseStateMachine {
public:
    PhaseStateMachine(ParticleField& field, SelectionEngine& selection, EventBus& event_bus);

    // Triggers. Return false when the trigger does not apply in the current phase.
    bool start(double now, const SimulationConfig& config);
    bool select_now(double now, const SimulationConfig& config);

    // Drops the draw and result and cancels every pending deadline.
    // Resetting the particles themselves is the caller's job.
    void reset_to_idle(double now);

    void update(double now, const SimulationConfig& config);
    StepContext step_context(double now, const SimulationConfig& config) const;

    SessionPhase phase() const { return phase_; }
    double phase_entered_at() const { return phase_entered_at_; }
    bool simulation_started() const { return simulation_started_; }
    int countdown_value() const { return countdown_value_; }
    bool go_signalled() const { return go_signalled_; }
    const std::vector<int>& drawn_ids() const { return drawn_ids_; }

    // Set only once the machine is Complete
    const std::optional<DrawResult>& result() const { return result_; }

    // K slots evenly spaced along x, centred at the origin, shrunk to fit inside the box
    static std::vector<Eigen::Vector3f> line_up_slots(size_t k, float spacing,
                                                      const geom::CenteredBox& box, float radius);

private:
    void enter(SessionPhase next, double at, const SimulationConfig& config);
    void perform_draw(const SimulationConfig& config);
    void build_result();
    void update_countdown(double elapsed, const SimulationConfig& config);

    ParticleField& field_;
    SelectionEngine& selection_;
    EventBus& event_bus_;

    SessionPhase phase_;
    double phase_entered_at_;
    bool simulation_started_;

    int countdown_value_;
    bool go_signalled_;

    std::vector<int> drawn_ids_;
    size_t requested_;
    bool degraded_;
    std::optional<DrawResult> result_;
};
