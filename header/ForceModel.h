#pragma once
#include "SimulationConfig.h"
#include "SessionPhase.h"
#include <Eigen/Dense>
#include <random>

using Vector3f = Eigen::Vector3f;

// Gains in effect for one step, after phase-dependent ramping
struct ForceGains {
    float pull;
    float orbital;
    float jitter;
    Vector3f drift;
    float expansion;
};

// Stateless ambient force terms. The only state touched is the caller's RNG (jitter).
class ForceModel {
public:
    // Base gains everywhere except the swirl phases, where pull and orbital
    // ramp linearly towards the swirl maxima over config.swirl_ramp_s.
    static ForceGains resolve_gains(const SimulationConfig& config, SessionPhase phase, float phase_elapsed_s);

    // Sum of all five terms for a particle at `pos`. `reference_half` is the
    // half size used by the differential-rotation falloff.
    static Vector3f velocity_delta(const Vector3f& pos, const ForceGains& gains,
                                   float reference_half, std::mt19937& rng);

    // Individual terms (exposed for testing)
    static Vector3f inward_pull(const Vector3f& pos, float gain);
    static Vector3f orbital(const Vector3f& pos, float gain, float reference_half);
    static Vector3f jitter(float gain, std::mt19937& rng);
    static Vector3f expansion(const Vector3f& pos, float gain);

    // Unit vector, or zero for a zero-length / non-finite input
    static Vector3f safe_normalized(const Vector3f& v);
};
