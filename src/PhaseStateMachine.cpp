#include "PhaseStateMachine.h"
#include "NumerologyEngine.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {
// Upper bound on transitions a single update may chain (Countdown -> Exploding -> LiningUp -> Complete)
constexpr int kMaxChainedTransitions = 8;

// Saturated, bright variant of the configured highlight hue
constexpr float kHighlightSaturation = 100.0f;
constexpr float kHighlightLightness  = 60.0f;
}

PhaseStateMachine::PhaseStateMachine(ParticleField& field, SelectionEngine& selection, EventBus& event_bus)
    : field_(field), selection_(selection), event_bus_(event_bus),
      phase_(SessionPhase::Idle), phase_entered_at_(0.0), simulation_started_(false),
      countdown_value_(0), go_signalled_(false),
      requested_(0), degraded_(false) {
}

bool PhaseStateMachine::start(double now, const SimulationConfig& config) {
    if (phase_ != SessionPhase::Idle) return false;

    simulation_started_ = true;
    enter(SessionPhase::Swirling, now, config);
    if (config.enable_countdown) {
        enter(SessionPhase::Countdown, now, config);
    }
    return true;
}

bool PhaseStateMachine::select_now(double now, const SimulationConfig& config) {
    switch (phase_) {
        case SessionPhase::Idle:
        case SessionPhase::Swirling:
        case SessionPhase::Countdown:
            simulation_started_ = true;
            enter(SessionPhase::Exploding, now, config);
            return true;
        default:
            // The draw is immutable once it happened
            return false;
    }
}

void PhaseStateMachine::reset_to_idle(double now) {
    const SessionPhase from = phase_;
    phase_ = SessionPhase::Idle;
    phase_entered_at_ = std::max(now, phase_entered_at_);
    simulation_started_ = false;
    countdown_value_ = 0;
    go_signalled_ = false;
    drawn_ids_.clear();
    requested_ = 0;
    degraded_ = false;
    result_.reset();

    PhaseChangedEvent event{from, SessionPhase::Idle, phase_entered_at_};
    event_bus_.emit(Events::PHASE_CHANGED, event);
}

void PhaseStateMachine::update(double now, const SimulationConfig& config) {
    for (int guard = 0; guard < kMaxChainedTransitions; ++guard) {
        const double elapsed = now - phase_entered_at_;

        switch (phase_) {
            case SessionPhase::Countdown: {
                update_countdown(elapsed, config);
                const double deadline = config.countdown_start * static_cast<double>(config.countdown_tick_s)
                                      + config.go_delay_s;
                if (elapsed < deadline) return;
                enter(SessionPhase::Exploding, phase_entered_at_ + deadline, config);
                break;
            }
            case SessionPhase::Exploding: {
                const double deadline = config.explosion_duration_s;
                if (elapsed < deadline) return;
                const SessionPhase next = config.enable_line_up ? SessionPhase::LiningUp : SessionPhase::Complete;
                enter(next, phase_entered_at_ + deadline, config);
                break;
            }
            case SessionPhase::LiningUp: {
                const double deadline = config.line_up_duration_s;
                if (elapsed < deadline) return;
                enter(SessionPhase::Complete, phase_entered_at_ + deadline, config);
                break;
            }
            default:
                // Idle, Swirling and Complete only move on external triggers
                return;
        }
    }
}

StepContext PhaseStateMachine::step_context(double now, const SimulationConfig& config) const {
    const float elapsed = static_cast<float>(std::max(0.0, now - phase_entered_at_));

    float line_up_t = 0.0f;
    if (phase_ == SessionPhase::LiningUp) {
        line_up_t = config.line_up_duration_s > 0.0f
                  ? std::min(1.0f, elapsed / config.line_up_duration_s) : 1.0f;
    } else if (phase_ == SessionPhase::Complete) {
        line_up_t = 1.0f;
    }

    // Time based: the fade takes fade_duration_s whatever the step rate
    const float fade_per_step = config.fade_duration_s > 0.0f
                              ? config.step_dt() / config.fade_duration_s : 1.0f;

    return StepContext{phase_, elapsed, line_up_t, fade_per_step};
}

void PhaseStateMachine::enter(SessionPhase next, double at, const SimulationConfig& config) {
    const SessionPhase from = phase_;
    phase_ = next;
    phase_entered_at_ = std::max(at, phase_entered_at_);

    std::cout << "Phase " << to_string(from) << " -> " << to_string(next)
              << " at t=" << phase_entered_at_ << "s\n";

    PhaseChangedEvent event{from, next, phase_entered_at_};
    event_bus_.emit(Events::PHASE_CHANGED, event);

    switch (next) {
        case SessionPhase::Countdown: {
            countdown_value_ = std::max(0, config.countdown_start);
            go_signalled_ = false;
            CountdownTickEvent tick{countdown_value_};
            event_bus_.emit(Events::COUNTDOWN_TICK, tick);
            break;
        }
        case SessionPhase::Exploding:
            perform_draw(config);
            break;
        case SessionPhase::LiningUp: {
            const auto slots = line_up_slots(drawn_ids_.size(), config.line_up_spacing,
                                             field_.get_box(), field_.get_radius());
            field_.hide_unselected();
            field_.begin_line_up(drawn_ids_, slots);
            break;
        }
        case SessionPhase::Complete:
            field_.finish_line_up();
            field_.hide_unselected();
            build_result();
            break;
        default:
            break;
    }
}

void PhaseStateMachine::update_countdown(double elapsed, const SimulationConfig& config) {
    const int ticks_elapsed = static_cast<int>(std::floor(elapsed / config.countdown_tick_s));
    const int value = std::max(0, config.countdown_start - ticks_elapsed);

    while (countdown_value_ > value) {
        --countdown_value_;
        CountdownTickEvent tick{countdown_value_};
        event_bus_.emit(Events::COUNTDOWN_TICK, tick);
    }

    if (countdown_value_ == 0 && !go_signalled_) {
        go_signalled_ = true;
        std::cout << "GO!\n";
        CountdownGoEvent go{phase_entered_at_ + config.countdown_start * static_cast<double>(config.countdown_tick_s)};
        event_bus_.emit(Events::COUNTDOWN_GO, go);
    }
}

void PhaseStateMachine::perform_draw(const SimulationConfig& config) {
    const size_t available = field_.get_particle_count();

    drawn_ids_ = selection_.draw(field_, config.picks, config.selection_policy);
    requested_ = config.picks;
    degraded_ = drawn_ids_.size() < config.picks;

    if (degraded_) {
        std::cerr << "⚠️  Draw degraded: requested " << config.picks << " particles, only "
                  << available << " available\n";
        SelectionDegradedEvent degraded{LotteryError::InsufficientParticles, config.picks, available};
        event_bus_.emit(Events::SELECTION_DEGRADED, degraded);
    }

    field_.mark_selected(drawn_ids_, Color::from_hsl(config.highlight_hue, kHighlightSaturation, kHighlightLightness));

    std::cout << "Draw (" << to_string(config.selection_policy) << "):";
    for (int id : drawn_ids_) std::cout << " " << id;
    std::cout << "\n";

    DrawCompletedEvent event{drawn_ids_, requested_};
    event_bus_.emit(Events::DRAW_COMPLETED, event);
}

void PhaseStateMachine::build_result() {
    DrawResult result;
    result.selected_ids = drawn_ids_;
    result.sum = NumerologyEngine::sum_of(drawn_ids_);
    result.numerology_digit = NumerologyEngine::reduce_to_single_digit(result.sum);
    result.meaning = NumerologyEngine::meaning_of(result.numerology_digit);
    result.requested = requested_;
    result.degraded = degraded_;
    result_ = std::move(result);

    std::cout << "✅ Result: sum " << result_->sum << " -> " << result_->numerology_digit
              << " (" << result_->meaning << ")\n";

    ResultReadyEvent event{&*result_};
    event_bus_.emit(Events::RESULT_READY, event);
}

std::vector<Eigen::Vector3f> PhaseStateMachine::line_up_slots(size_t k, float spacing,
                                                              const geom::CenteredBox& box, float radius) {
    std::vector<Eigen::Vector3f> slots;
    if (k == 0) return slots;

    float step = spacing;
    if (k > 1) {
        const float usable = 2.0f * (box.half_extent.x() - radius);
        step = std::min(spacing, std::max(0.0f, usable) / static_cast<float>(k - 1));
    }

    slots.reserve(k);
    const float centre = (static_cast<float>(k) - 1.0f) / 2.0f;
    for (size_t i = 0; i < k; ++i) {
        slots.emplace_back((static_cast<float>(i) - centre) * step, 0.0f, 0.0f);
    }
    return slots;
}
