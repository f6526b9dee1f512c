#pragma once
#include "LotteryError.h"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>

enum class SelectionPolicy : uint8_t {
    UniformWithoutReplacement = 0,
    MaxSpeed
};

const char* to_string(SelectionPolicy policy);

// Immutable within a run. A new config always goes through a full field reset.
struct SimulationConfig {
    // Field
    size_t particle_count;                 // particles allocated on reset
    size_t picks;                          // K: particles chosen per draw
    Eigen::Vector3f box_half_extent;       // per-axis half size of the box
    float particle_radius;

    // Motion
    float damping;                         // velocity *= damping every step, in (0,1)
    float min_speed;                       // below this speed random energy is injected
    float speed_factor;                    // initial whirlwind speed and floor kick size

    // Ambient forces (zero gain disables a term)
    float pull_gain;                       // inward pull, base ("floating") value
    float orbital_gain;                    // differential rotation, base value
    float swirl_pull_gain;                 // pull reached at the end of the swirl ramp
    float swirl_orbital_gain;              // orbital gain reached at the end of the swirl ramp
    float swirl_ramp_s;                    // seconds from base to swirl gains
    float jitter_gain;                     // per-axis uniform noise
    Eigen::Vector3f drift;                 // constant bulk translation per step
    float expansion_gain;                  // slow outward dilation

    // Color
    float hue;                             // degrees
    float saturation;                      // percent
    float lightness;                       // percent
    float hue_jitter;                      // +- degrees per particle at reset
    float highlight_hue;                   // selected particles
    bool recolor_on_bounce;

    // Selection
    SelectionPolicy selection_policy;

    // Phases
    bool enable_countdown;
    int countdown_start;
    float countdown_tick_s;
    float go_delay_s;
    float explosion_duration_s;
    float fade_duration_s;
    bool enable_line_up;
    float line_up_duration_s;
    float line_up_spacing;

    // Stepping
    float step_rate_hz;
    int max_steps_per_tick;

    // Camera
    float camera_zoom;
    float camera_min_zoom;
    float camera_max_zoom;
    float camera_auto_rotate;              // rad/s while the session runs

    uint32_t rng_seed;                     // 0 = seed from std::random_device

    // Default constructor: the full presentation (K=6, countdown, line-up)
    SimulationConfig()
        : particle_count(1000)
        , picks(6)
        , box_half_extent(100.0f, 100.0f, 100.0f)
        , particle_radius(2.0f)
        , damping(0.995f)
        , min_speed(0.008f)
        , speed_factor(0.015f)
        , pull_gain(0.00002f)
        , orbital_gain(0.0002f)
        , swirl_pull_gain(0.0006f)
        , swirl_orbital_gain(0.003f)
        , swirl_ramp_s(4.0f)
        , jitter_gain(0.002f)
        , drift(0.000005f, 0.0000025f, 0.000005f)
        , expansion_gain(0.00000005f)
        , hue(270.0f)
        , saturation(70.0f)
        , lightness(60.0f)
        , hue_jitter(0.0f)
        , highlight_hue(45.0f)
        , recolor_on_bounce(true)
        , selection_policy(SelectionPolicy::UniformWithoutReplacement)
        , enable_countdown(true)
        , countdown_start(10)
        , countdown_tick_s(1.0f)
        , go_delay_s(0.5f)
        , explosion_duration_s(3.0f)
        , fade_duration_s(1.5f)
        , enable_line_up(true)
        , line_up_duration_s(2.0f)
        , line_up_spacing(20.0f)
        , step_rate_hz(60.0f)
        , max_steps_per_tick(8)
        , camera_zoom(160.0f)
        , camera_min_zoom(50.0f)
        , camera_max_zoom(500.0f)
        , camera_auto_rotate(0.1f)
        , rng_seed(0)
    {}

    // Single lucky particle: whirlwind + damping + floor + bounce only
    static SimulationConfig simple_variant();

    float step_dt() const { return 1.0f / step_rate_hz; }

    ConfigResult validate() const;

    // Outbound snapshot for the oracle (name -> decimal string)
    std::map<std::string, std::string> to_fields() const;

    // Overlay `fields` on `base`. All-or-nothing: `out` is written only when the
    // result is ok (unknown names, non-numeric values and out-of-range values reject).
    static ConfigResult from_fields(const SimulationConfig& base,
                                    const std::map<std::string, std::string>& fields,
                                    SimulationConfig& out);
};
