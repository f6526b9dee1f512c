#pragma once
#include "Clock.h"
#include "EventSystem.h"
#include "LotteryError.h"
#include "OracleBridge.h"
#include "ParticleField.h"
#include "PhaseStateMachine.h"
#include "RenderFrame.h"
#include "SelectionEngine.h"
#include "SimulationConfig.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// One lottery session on a single cooperative timeline: call tick() once per frame.
// The oracle (if any) must outlive the session.
class LotterySession {
public:
    LotterySession(const SimulationConfig& config, Clock& clock, EventBus& event_bus,
                   TextOracle* oracle = nullptr);

    LotterySession(const LotterySession&) = delete;
    LotterySession& operator=(const LotterySession&) = delete;

    // Control panel triggers
    void start();          // Idle -> Swirling; in any other phase it restarts
    void restart();        // any phase -> Idle with a freshly reset field
    bool select_now();     // manual draw, skips whatever is left of the swirl

    // Validate, swap and reset. On failure the previous config stays active.
    ConfigResult apply_config(const SimulationConfig& config);

    // Fire-and-forget oracle calls; replies are applied on a later tick
    bool request_narrative(const std::string& mood);
    bool request_suggestion(const std::string& mood);
    size_t pending_oracle_requests() const;
    void wait_for_oracle();

    // Advance physics (fixed steps), then phase deadlines, then publish a frame
    void tick();

    // Camera (never affects the simulation)
    void zoom_camera(float delta);
    void rotate_camera(float delta);

    SessionPhase phase() const { return machine_.phase(); }
    const PhaseStateMachine& machine() const { return machine_; }
    const ParticleField& field() const { return field_; }
    const SimulationConfig& config() const { return *config_; }
    const std::optional<DrawResult>& result() const { return machine_.result(); }
    const CameraState& camera() const { return camera_; }
    const RenderFrame& frame() const { return frame_; }
    uint64_t generation() const { return field_.get_generation(); }
    LotteryError last_error() const { return last_error_; }
    const std::string& last_oracle_text() const { return last_oracle_text_; }

private:
    void reset_field();
    void submit_oracle(OracleRequestKind kind, const std::string& mood);
    void handle_oracle_reply(const TaggedReply& tagged);
    void reject_config(const ConfigResult& result);
    void publish_frame();

    Clock& clock_;
    EventBus& event_bus_;
    std::shared_ptr<const SimulationConfig> config_;

    ParticleField field_;
    SelectionEngine selection_;
    PhaseStateMachine machine_;
    std::unique_ptr<OracleBridge> oracle_bridge_;

    CameraState camera_;
    RenderFrame frame_;

    double last_tick_;
    double accumulator_;
    LotteryError last_error_;
    std::string last_oracle_text_;
};
