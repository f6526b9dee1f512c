#include "SimulationConfig.h"
#include <cmath>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <vector>

const char* to_string(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::UniformWithoutReplacement: return "uniform";
        case SelectionPolicy::MaxSpeed:                  return "max_speed";
    }
    return "unknown";
}

SimulationConfig SimulationConfig::simple_variant() {
    SimulationConfig cfg;
    cfg.picks = 1;
    cfg.selection_policy = SelectionPolicy::MaxSpeed;
    cfg.enable_countdown = false;
    cfg.enable_line_up = false;
    cfg.pull_gain = 0.0f;
    cfg.orbital_gain = 0.0f;
    cfg.swirl_pull_gain = 0.0f;
    cfg.swirl_orbital_gain = 0.0f;
    cfg.jitter_gain = 0.0f;
    cfg.drift = Eigen::Vector3f::Zero();
    cfg.expansion_gain = 0.0f;
    cfg.hue = 240.0f;
    cfg.saturation = 80.0f;
    cfg.lightness = 65.0f;
    cfg.fade_duration_s = 0.83f;
    cfg.explosion_duration_s = 1.0f;
    return cfg;
}

//===========================================================================================
//==                                   FIELD TABLE                                         ==
//===========================================================================================

namespace {

// One externally settable parameter with its documented range
struct Parameter {
    const char* name;
    double min;
    double max;
    bool min_exclusive;
    bool max_exclusive;
    std::function<double(const SimulationConfig&)> get;
    std::function<void(SimulationConfig&, double)> set;
};

const std::vector<Parameter>& parameter_table() {
    static const std::vector<Parameter> table = {
        {"particle_count", 1, 10000, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.particle_count); },
            [](SimulationConfig& c, double v) { c.particle_count = static_cast<size_t>(v); }},
        {"picks", 1, 64, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.picks); },
            [](SimulationConfig& c, double v) { c.picks = static_cast<size_t>(v); }},
        {"box_half_extent_x", 10, 1000, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.box_half_extent.x()); },
            [](SimulationConfig& c, double v) { c.box_half_extent.x() = static_cast<float>(v); }},
        {"box_half_extent_y", 10, 1000, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.box_half_extent.y()); },
            [](SimulationConfig& c, double v) { c.box_half_extent.y() = static_cast<float>(v); }},
        {"box_half_extent_z", 10, 1000, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.box_half_extent.z()); },
            [](SimulationConfig& c, double v) { c.box_half_extent.z() = static_cast<float>(v); }},
        {"particle_radius", 0.1, 50, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.particle_radius); },
            [](SimulationConfig& c, double v) { c.particle_radius = static_cast<float>(v); }},
        {"damping", 0, 1, true, true,
            [](const SimulationConfig& c) { return static_cast<double>(c.damping); },
            [](SimulationConfig& c, double v) { c.damping = static_cast<float>(v); }},
        {"min_speed", 0, 1, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.min_speed); },
            [](SimulationConfig& c, double v) { c.min_speed = static_cast<float>(v); }},
        {"speed_factor", 0, 1, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.speed_factor); },
            [](SimulationConfig& c, double v) { c.speed_factor = static_cast<float>(v); }},
        {"pull_gain", 0, 0.01, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.pull_gain); },
            [](SimulationConfig& c, double v) { c.pull_gain = static_cast<float>(v); }},
        {"orbital_gain", 0, 0.05, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.orbital_gain); },
            [](SimulationConfig& c, double v) { c.orbital_gain = static_cast<float>(v); }},
        {"swirl_pull_gain", 0, 0.01, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.swirl_pull_gain); },
            [](SimulationConfig& c, double v) { c.swirl_pull_gain = static_cast<float>(v); }},
        {"swirl_orbital_gain", 0, 0.05, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.swirl_orbital_gain); },
            [](SimulationConfig& c, double v) { c.swirl_orbital_gain = static_cast<float>(v); }},
        {"swirl_ramp_s", 0, 60, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.swirl_ramp_s); },
            [](SimulationConfig& c, double v) { c.swirl_ramp_s = static_cast<float>(v); }},
        {"jitter_gain", 0, 0.1, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.jitter_gain); },
            [](SimulationConfig& c, double v) { c.jitter_gain = static_cast<float>(v); }},
        {"drift_x", -0.01, 0.01, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.drift.x()); },
            [](SimulationConfig& c, double v) { c.drift.x() = static_cast<float>(v); }},
        {"drift_y", -0.01, 0.01, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.drift.y()); },
            [](SimulationConfig& c, double v) { c.drift.y() = static_cast<float>(v); }},
        {"drift_z", -0.01, 0.01, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.drift.z()); },
            [](SimulationConfig& c, double v) { c.drift.z() = static_cast<float>(v); }},
        {"expansion_gain", 0, 0.001, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.expansion_gain); },
            [](SimulationConfig& c, double v) { c.expansion_gain = static_cast<float>(v); }},
        {"hue", 0, 360, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.hue); },
            [](SimulationConfig& c, double v) { c.hue = static_cast<float>(v); }},
        {"saturation", 0, 100, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.saturation); },
            [](SimulationConfig& c, double v) { c.saturation = static_cast<float>(v); }},
        {"lightness", 0, 100, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.lightness); },
            [](SimulationConfig& c, double v) { c.lightness = static_cast<float>(v); }},
        {"hue_jitter", 0, 180, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.hue_jitter); },
            [](SimulationConfig& c, double v) { c.hue_jitter = static_cast<float>(v); }},
        {"countdown_start", 0, 60, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.countdown_start); },
            [](SimulationConfig& c, double v) { c.countdown_start = static_cast<int>(v); }},
        {"explosion_duration_s", 0.1, 30, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.explosion_duration_s); },
            [](SimulationConfig& c, double v) { c.explosion_duration_s = static_cast<float>(v); }},
        {"fade_duration_s", 0.05, 30, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.fade_duration_s); },
            [](SimulationConfig& c, double v) { c.fade_duration_s = static_cast<float>(v); }},
        {"line_up_duration_s", 0.1, 30, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.line_up_duration_s); },
            [](SimulationConfig& c, double v) { c.line_up_duration_s = static_cast<float>(v); }},
        {"camera_zoom", 1, 5000, false, false,
            [](const SimulationConfig& c) { return static_cast<double>(c.camera_zoom); },
            [](SimulationConfig& c, double v) { c.camera_zoom = static_cast<float>(v); }},
    };
    return table;
}

bool in_range(const Parameter& p, double v) {
    if (!std::isfinite(v)) return false;
    const bool above_min = p.min_exclusive ? v > p.min : v >= p.min;
    const bool below_max = p.max_exclusive ? v < p.max : v <= p.max;
    return above_min && below_max;
}

bool is_integral_parameter(const std::string& name) {
    return name == "particle_count" || name == "picks" || name == "countdown_start";
}

std::string range_text(const Parameter& p) {
    std::ostringstream oss;
    oss << (p.min_exclusive ? "(" : "[") << p.min << ", " << p.max << (p.max_exclusive ? ")" : "]");
    return oss.str();
}

} // namespace

ConfigResult SimulationConfig::validate() const {
    for (const auto& p : parameter_table()) {
        const double v = p.get(*this);
        if (!in_range(p, v)) {
            std::ostringstream oss;
            oss << p.name << "=" << v << " outside " << range_text(p);
            return ConfigResult::invalid(oss.str());
        }
    }

    // Cross-field constraints the table cannot express
    if (particle_radius >= box_half_extent.minCoeff()) {
        return ConfigResult::invalid("particle_radius must be smaller than every box half extent");
    }
    if (!(highlight_hue >= 0.0f && highlight_hue <= 360.0f)) {
        return ConfigResult::invalid("highlight_hue outside [0, 360]");
    }
    if (enable_countdown && !(countdown_tick_s > 0.0f && std::isfinite(countdown_tick_s))) {
        return ConfigResult::invalid("countdown_tick_s must be positive");
    }
    if (!(go_delay_s >= 0.0f && std::isfinite(go_delay_s))) {
        return ConfigResult::invalid("go_delay_s must be non-negative");
    }
    if (!(line_up_spacing > 0.0f && std::isfinite(line_up_spacing))) {
        return ConfigResult::invalid("line_up_spacing must be positive");
    }
    if (!(step_rate_hz >= 1.0f && step_rate_hz <= 1000.0f)) {
        return ConfigResult::invalid("step_rate_hz outside [1, 1000]");
    }
    if (max_steps_per_tick < 1) {
        return ConfigResult::invalid("max_steps_per_tick must be at least 1");
    }
    if (!(camera_min_zoom > 0.0f && camera_min_zoom <= camera_max_zoom)) {
        return ConfigResult::invalid("camera zoom limits are inconsistent");
    }
    if (!std::isfinite(camera_auto_rotate)) {
        return ConfigResult::invalid("camera_auto_rotate must be finite");
    }
    return ConfigResult::success();
}

std::map<std::string, std::string> SimulationConfig::to_fields() const {
    std::map<std::string, std::string> fields;
    for (const auto& p : parameter_table()) {
        std::ostringstream oss;
        oss << p.get(*this);
        fields[p.name] = oss.str();
    }
    fields["selection_policy"] = to_string(selection_policy);
    return fields;
}

ConfigResult SimulationConfig::from_fields(const SimulationConfig& base,
                                           const std::map<std::string, std::string>& fields,
                                           SimulationConfig& out) {
    if (fields.empty()) {
        return ConfigResult::invalid("suggestion carries no parameters");
    }

    SimulationConfig candidate = base;
    const auto& table = parameter_table();

    for (const auto& [name, text] : fields) {
        if (name == "selection_policy") {
            if (text == to_string(SelectionPolicy::UniformWithoutReplacement)) {
                candidate.selection_policy = SelectionPolicy::UniformWithoutReplacement;
            } else if (text == to_string(SelectionPolicy::MaxSpeed)) {
                candidate.selection_policy = SelectionPolicy::MaxSpeed;
            } else {
                return ConfigResult::invalid("unknown selection_policy '" + text + "'");
            }
            continue;
        }

        const Parameter* param = nullptr;
        for (const auto& p : table) {
            if (name == p.name) { param = &p; break; }
        }
        if (!param) {
            return ConfigResult::invalid("unknown parameter '" + name + "'");
        }

        const char* begin = text.c_str();
        char* end = nullptr;
        const double value = std::strtod(begin, &end);
        if (text.empty() || end == begin || *end != '\0') {
            return ConfigResult::invalid("parameter '" + name + "' is not a number: '" + text + "'");
        }
        if (!in_range(*param, value)) {
            std::ostringstream oss;
            oss << name << "=" << text << " outside " << range_text(*param);
            return ConfigResult::invalid(oss.str());
        }
        if (is_integral_parameter(name) && std::floor(value) != value) {
            return ConfigResult::invalid("parameter '" + name + "' must be an integer");
        }
        param->set(candidate, value);
    }

    ConfigResult result = candidate.validate();
    if (!result.ok) return result;

    out = candidate;
    return ConfigResult::success();
}
