#include "ForceModel.h"
#include <algorithm>
#include <cmath>

namespace {
constexpr float kMinLength = 1e-6f;
}

ForceGains ForceModel::resolve_gains(const SimulationConfig& config, SessionPhase phase, float phase_elapsed_s) {
    ForceGains gains{config.pull_gain, config.orbital_gain, config.jitter_gain,
                     config.drift, config.expansion_gain};

    if (is_swirl_phase(phase)) {
        float alpha = 1.0f;
        if (config.swirl_ramp_s > 0.0f) {
            alpha = std::clamp(phase_elapsed_s / config.swirl_ramp_s, 0.0f, 1.0f);
        }
        gains.pull    = config.pull_gain    + (config.swirl_pull_gain    - config.pull_gain)    * alpha;
        gains.orbital = config.orbital_gain + (config.swirl_orbital_gain - config.orbital_gain) * alpha;
    }
    return gains;
}

Vector3f ForceModel::safe_normalized(const Vector3f& v) {
    const float len = v.norm();
    if (!std::isfinite(len) || len < kMinLength) return Vector3f::Zero();
    return v / len;
}

Vector3f ForceModel::inward_pull(const Vector3f& pos, float gain) {
    // |delta| = distance * gain, directed at the centre
    if (gain == 0.0f) return Vector3f::Zero();
    const float dist = pos.norm();
    return -safe_normalized(pos) * (dist * gain);
}

Vector3f ForceModel::orbital(const Vector3f& pos, float gain, float reference_half) {
    if (gain == 0.0f || !(reference_half > 0.0f)) return Vector3f::Zero();

    const float dist = pos.norm();
    const Vector3f dir = safe_normalized(pos);
    if (dir.isZero()) return Vector3f::Zero();

    // Faster near the centre, fading to nothing at the wall
    const float falloff = std::max(0.0f, 1.0f - dist / reference_half);
    const Vector3f tangent = Vector3f::UnitY().cross(dir);
    return tangent * (dist * gain * falloff);
}

Vector3f ForceModel::jitter(float gain, std::mt19937& rng) {
    if (gain == 0.0f) return Vector3f::Zero();
    std::uniform_real_distribution<float> noise(-0.5f, 0.5f);
    const float x = noise(rng);
    const float y = noise(rng);
    const float z = noise(rng);
    return Vector3f(x, y, z) * gain;
}

Vector3f ForceModel::expansion(const Vector3f& pos, float gain) {
    if (gain == 0.0f) return Vector3f::Zero();
    return safe_normalized(pos) * gain;
}

Vector3f ForceModel::velocity_delta(const Vector3f& pos, const ForceGains& gains,
                                    float reference_half, std::mt19937& rng) {
    Vector3f delta = inward_pull(pos, gains.pull);
    delta += orbital(pos, gains.orbital, reference_half);
    delta += jitter(gains.jitter, rng);
    delta += gains.drift;
    delta += expansion(pos, gains.expansion);
    return delta;
}
