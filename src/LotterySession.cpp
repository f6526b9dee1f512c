#include "LotterySession.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {
// Selection gets its own stream so the draw does not depend on how many steps ran
constexpr uint32_t kSelectionSeedSalt = 0x9E3779B9u;
constexpr float kTwoPi = 6.28318530718f;

// 0 asks for random_device seeding, so a derived seed that wraps to 0 is moved off it
uint32_t fixed_seed(uint32_t derived) {
    return derived != 0 ? derived : 1u;
}

// Absorbs float noise when a frame lands exactly on a step boundary
constexpr double kStepEpsilon = 1e-9;
}

LotterySession::LotterySession(const SimulationConfig& config, Clock& clock, EventBus& event_bus,
                               TextOracle* oracle)
    : clock_(clock), event_bus_(event_bus),
      config_(std::make_shared<const SimulationConfig>(config)),
      field_(event_bus), selection_(), machine_(field_, selection_, event_bus),
      camera_{config.camera_zoom, 0.0f},
      frame_{{}, camera_, SessionPhase::Idle, 0, false, {}},
      last_tick_(clock.now_seconds()), accumulator_(0.0),
      last_error_(LotteryError::None) {

    const ConfigResult check = config.validate();
    if (!check.ok) {
        std::cerr << "⚠️  Initial config rejected (" << check.message << "), using defaults\n";
        last_error_ = LotteryError::InvalidConfig;
        config_ = std::make_shared<const SimulationConfig>();
        camera_.zoom_distance = config_->camera_zoom;
    }

    if (oracle) {
        oracle_bridge_ = std::make_unique<OracleBridge>(*oracle);
    }

    reset_field();
    publish_frame();
}

//===========================================================================================
//==                                   TRIGGERS                                            ==
//===========================================================================================

void LotterySession::start() {
    // Start while anything is running means "begin again": back to Idle, not straight into Swirling
    if (machine_.phase() != SessionPhase::Idle) {
        restart();
        return;
    }
    machine_.start(clock_.now_seconds(), *config_);
}

void LotterySession::restart() {
    const double now = clock_.now_seconds();
    std::cout << "Restart from " << to_string(machine_.phase()) << "\n";

    machine_.reset_to_idle(now);
    reset_field();
    accumulator_ = 0.0;
    last_tick_ = now;
    last_error_ = LotteryError::None;
    publish_frame();
}

bool LotterySession::select_now() {
    const bool accepted = machine_.select_now(clock_.now_seconds(), *config_);
    if (!accepted) {
        std::cout << "Select ignored in " << to_string(machine_.phase()) << "\n";
    }
    return accepted;
}

void LotterySession::reset_field() {
    const SimulationConfig& config = *config_;
    // A fixed seed still varies between resets, but reproducibly
    const uint32_t base = config.rng_seed;
    const uint32_t field_seed = base != 0 ? fixed_seed(base + static_cast<uint32_t>(field_.get_generation())) : 0u;
    const uint32_t selection_seed = base != 0 ? fixed_seed(field_seed ^ kSelectionSeedSalt) : 0u;

    field_.reset(config, field_seed);
    selection_.reseed(selection_seed);
}

//===========================================================================================
//==                                   CONFIG                                              ==
//===========================================================================================

ConfigResult LotterySession::apply_config(const SimulationConfig& config) {
    ConfigResult result = config.validate();
    if (!result.ok) {
        reject_config(result);
        return result;
    }

    // Whole-object swap; the old config is never mutated in place
    config_ = std::make_shared<const SimulationConfig>(config);

    const double now = clock_.now_seconds();
    machine_.reset_to_idle(now);
    reset_field();
    accumulator_ = 0.0;
    last_tick_ = now;
    last_error_ = LotteryError::None;
    camera_.zoom_distance = std::clamp(camera_.zoom_distance, config.camera_min_zoom, config.camera_max_zoom);

    std::cout << "✅ Config applied: " << config.particle_count << " particles, K=" << config.picks
              << ", policy " << to_string(config.selection_policy) << "\n";

    ConfigAppliedEvent event{config.particle_count, field_.get_generation()};
    event_bus_.emit(Events::CONFIG_APPLIED, event);

    publish_frame();
    return result;
}

void LotterySession::reject_config(const ConfigResult& result) {
    last_error_ = result.error;
    std::cerr << "⚠️  Config rejected: " << result.message << "\n";
    ConfigRejectedEvent event{result.error, result.message};
    event_bus_.emit(Events::CONFIG_REJECTED, event);
}

//===========================================================================================
//==                                   ORACLE                                              ==
//===========================================================================================

bool LotterySession::request_narrative(const std::string& mood) {
    if (!oracle_bridge_) {
        last_error_ = LotteryError::OracleUnavailable;
        OracleFailedEvent event{LotteryError::OracleUnavailable, "no oracle configured"};
        event_bus_.emit(Events::ORACLE_FAILED, event);
        return false;
    }
    submit_oracle(OracleRequestKind::Narrative, mood);
    return true;
}

bool LotterySession::request_suggestion(const std::string& mood) {
    if (!oracle_bridge_) {
        last_error_ = LotteryError::OracleUnavailable;
        OracleFailedEvent event{LotteryError::OracleUnavailable, "no oracle configured"};
        event_bus_.emit(Events::ORACLE_FAILED, event);
        return false;
    }
    submit_oracle(OracleRequestKind::ParameterSuggestion, mood);
    return true;
}

void LotterySession::submit_oracle(OracleRequestKind kind, const std::string& mood) {
    OracleRequest request{kind, config_->to_fields(), mood};
    oracle_bridge_->submit(request, field_.get_generation());
}

size_t LotterySession::pending_oracle_requests() const {
    return oracle_bridge_ ? oracle_bridge_->pending() : 0;
}

void LotterySession::wait_for_oracle() {
    if (oracle_bridge_) oracle_bridge_->wait_all();
}

void LotterySession::handle_oracle_reply(const TaggedReply& tagged) {
    // Last reset wins: anything requested before it is stale
    if (tagged.generation != field_.get_generation()) {
        std::cout << "Oracle reply for generation " << tagged.generation << " dropped (now "
                  << field_.get_generation() << ")\n";
        return;
    }

    if (tagged.error != LotteryError::None) {
        last_error_ = tagged.error;
        OracleFailedEvent event{tagged.error, tagged.reply.error};
        event_bus_.emit(Events::ORACLE_FAILED, event);
        return;
    }

    if (!tagged.reply.text.empty()) {
        last_oracle_text_ = tagged.reply.text;
        OracleTextEvent event{tagged.reply.text};
        event_bus_.emit(Events::ORACLE_TEXT, event);
    }

    if (tagged.kind != OracleRequestKind::ParameterSuggestion) return;

    if (!tagged.reply.has_suggestion) {
        reject_config(ConfigResult::invalid("oracle reply carried no parameters"));
        return;
    }

    SimulationConfig candidate;
    const ConfigResult parsed = SimulationConfig::from_fields(*config_, tagged.reply.suggestion, candidate);
    if (!parsed.ok) {
        reject_config(parsed);
        return;
    }
    apply_config(candidate);
}

//===========================================================================================
//==                                   TICK                                                ==
//===========================================================================================

void LotterySession::tick() {
    if (oracle_bridge_) {
        for (const auto& tagged : oracle_bridge_->collect_ready()) {
            handle_oracle_reply(tagged);
        }
    }

    // Oracle replies may have swapped the config; hold the current one for the whole tick
    const std::shared_ptr<const SimulationConfig> config = config_;

    const double now = clock_.now_seconds();
    const double elapsed = std::max(0.0, now - last_tick_);
    last_tick_ = now;

    // Particles float in Idle too; only the gains differ per phase
    const double dt = 1.0 / static_cast<double>(config->step_rate_hz);
    accumulator_ += elapsed;

    int steps = 0;
    const StepContext ctx = machine_.step_context(now, *config);
    while (accumulator_ + kStepEpsilon >= dt && steps < config->max_steps_per_tick) {
        field_.step(*config, ctx);
        accumulator_ -= dt;
        ++steps;
    }
    // A stall does not turn into a burst: drop whatever backlog is left
    if (accumulator_ >= dt) {
        accumulator_ = std::fmod(accumulator_, dt);
    }

    if (machine_.simulation_started()) {
        camera_.rotation_angle = std::fmod(
            camera_.rotation_angle + config->camera_auto_rotate * static_cast<float>(elapsed), kTwoPi);
    }

    machine_.update(now, *config);
    publish_frame();
}

//===========================================================================================
//==                                   CAMERA                                              ==
//===========================================================================================

void LotterySession::zoom_camera(float delta) {
    camera_.zoom_distance = std::clamp(camera_.zoom_distance + delta,
                                       config_->camera_min_zoom, config_->camera_max_zoom);
}

void LotterySession::rotate_camera(float delta) {
    camera_.rotation_angle = std::fmod(camera_.rotation_angle + delta, kTwoPi);
}

void LotterySession::publish_frame() {
    field_.prepare_render_data(frame_.particles);
    frame_.camera = camera_;
    frame_.phase = machine_.phase();
    frame_.countdown_value = machine_.countdown_value();
    frame_.show_go = machine_.phase() == SessionPhase::Countdown && machine_.go_signalled();
    frame_.label_ids.clear();
    if (machine_.result()) {
        frame_.label_ids = machine_.result()->selected_ids;
    }

    RenderUpdateEvent event{&frame_};
    event_bus_.emit(Events::RENDER_UPDATE, event);
}
