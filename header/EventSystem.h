#pragma once
#include "SessionPhase.h"
#include "LotteryError.h"
#include <vector>
#include <unordered_map>
#include <functional>
#include <string>
#include <cstdint>

// Event system for decoupled communication
class EventBus {
public:
    using EventHandler = std::function<void(const void* data)>;

    template<typename T>
    void subscribe(const std::string& event_type, std::function<void(const T&)> handler) {
        handlers_[event_type].push_back([handler](const void* data) {
            handler(*static_cast<const T*>(data));
        });
    }

    template<typename T>
    void emit(const std::string& event_type, const T& data) {
        auto it = handlers_.find(event_type);
        if (it != handlers_.end()) {
            for (auto& handler : it->second) {
                handler(&data);
            }
        }
    }

private:
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

struct RenderFrame;
struct DrawResult;

// Field events
struct FieldResetEvent {
    size_t particle_count;
    uint64_t generation;
};

// Session events
struct PhaseChangedEvent {
    SessionPhase from;
    SessionPhase to;
    double entered_at;
};

struct CountdownTickEvent {
    int value;
};

struct CountdownGoEvent {
    double at;
};

struct DrawCompletedEvent {
    std::vector<int> selected_ids;  // draw order
    size_t requested;
};

struct SelectionDegradedEvent {
    LotteryError error;
    size_t requested;
    size_t available;
};

struct ResultReadyEvent {
    const DrawResult* result;
};

struct ConfigAppliedEvent {
    size_t particle_count;
    uint64_t generation;
};

struct ConfigRejectedEvent {
    LotteryError error;
    std::string message;
};

// Oracle events
struct OracleTextEvent {
    std::string text;
};

struct OracleFailedEvent {
    LotteryError error;
    std::string message;
};

struct RenderUpdateEvent {
    const RenderFrame* frame;
};

// Event type constants to avoid string typos
namespace Events {
    constexpr const char* FIELD_RESET = "field_reset";
    constexpr const char* PHASE_CHANGED = "phase_changed";
    constexpr const char* COUNTDOWN_TICK = "countdown_tick";
    constexpr const char* COUNTDOWN_GO = "countdown_go";
    constexpr const char* DRAW_COMPLETED = "draw_completed";
    constexpr const char* SELECTION_DEGRADED = "selection_degraded";
    constexpr const char* RESULT_READY = "result_ready";
    constexpr const char* CONFIG_APPLIED = "config_applied";
    constexpr const char* CONFIG_REJECTED = "config_rejected";
    constexpr const char* ORACLE_TEXT = "oracle_text";
    constexpr const char* ORACLE_FAILED = "oracle_failed";
    constexpr const char* RENDER_UPDATE = "render_update";
}
