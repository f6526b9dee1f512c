#pragma once
#include <cstdint>

enum class SessionPhase : uint8_t {
    Idle = 0,
    Swirling,
    Countdown,
    Exploding,
    LiningUp,
    Complete
};

inline const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle:      return "Idle";
        case SessionPhase::Swirling:  return "Swirling";
        case SessionPhase::Countdown: return "Countdown";
        case SessionPhase::Exploding: return "Exploding";
        case SessionPhase::LiningUp:  return "LiningUp";
        case SessionPhase::Complete:  return "Complete";
    }
    return "Unknown";
}

// Phases in which the ambient swirl (with force ramp) is running
inline bool is_swirl_phase(SessionPhase phase) {
    return phase == SessionPhase::Swirling || phase == SessionPhase::Countdown;
}

// Once a draw has happened the selected particles are choreographed, not simulated
inline bool is_post_draw_phase(SessionPhase phase) {
    return phase == SessionPhase::Exploding || phase == SessionPhase::LiningUp ||
           phase == SessionPhase::Complete;
}
