// Implementation
#include "ParticleField.h"
#include "BoundaryCollision.h"
#include "ForceModel.h"
#include <algorithm>
#include <cmath>
#include <iostream>

ParticleField::ParticleField(EventBus& event_bus)
    : event_bus_(event_bus),
      rng_(std::random_device{}()),
      generation_(0),
      box_{Eigen::Vector3f(100.0f, 100.0f, 100.0f)},
      radius_(2.0f),
      line_up_active_(false) {
}

void ParticleField::reset(const SimulationConfig& config, uint32_t seed) {
    rng_.seed(seed != 0 ? seed : std::random_device{}());

    box_ = geom::CenteredBox{config.box_half_extent};
    radius_ = config.particle_radius;

    const size_t count = config.particle_count;
    ids_.resize(count);
    positions_.resize(count);
    velocities_.resize(count);
    colors_.resize(count);
    opacities_.resize(count);
    visible_.resize(count);
    selected_.resize(count);

    line_up_active_ = false;
    line_up_origin_.assign(count, Eigen::Vector3f::Zero());
    line_up_target_.assign(count, Eigen::Vector3f::Zero());

    // Whirlwind speed scales with the box the same way for every box size
    const float box_scale = 2.0f * box_.min_half() / 100.0f;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    std::uniform_real_distribution<float> speed_dist(0.5f, 1.5f);
    std::uniform_real_distribution<float> hue_dist(-config.hue_jitter, config.hue_jitter);

    for (size_t i = 0; i < count; ++i) {
        ids_[i] = static_cast<int>(i) + 1;

        Eigen::Vector3f p;
        for (int axis = 0; axis < 3; ++axis) {
            const float span = box_.half_extent[axis] - radius_;
            p[axis] = (unit(rng_) * 2.0f - 1.0f) * span;
        }
        positions_[i] = p;

        // Tangential component around the vertical axis gives the initial rotation bias
        const float angle = std::atan2(p.z(), p.x());
        const float speed = speed_dist(rng_) * config.speed_factor * box_scale;
        velocities_[i] = Eigen::Vector3f(-std::sin(angle) * speed,
                                         (unit(rng_) - 0.5f) * speed,
                                         std::cos(angle) * speed);

        const float hue = config.hue_jitter > 0.0f ? config.hue + hue_dist(rng_) : config.hue;
        colors_[i] = Color::from_hsl(hue, config.saturation, config.lightness);
        opacities_[i] = 1.0f;
        visible_[i] = 1;
        selected_[i] = 0;
    }

    ++generation_;

    std::cout << "ParticleField reset: " << count << " particles (generation " << generation_ << ")\n";

    FieldResetEvent event{count, generation_};
    event_bus_.emit(Events::FIELD_RESET, event);
}

void ParticleField::step(const SimulationConfig& config, const StepContext& ctx) {
    if (ids_.empty()) return;

    const ForceGains gains = ForceModel::resolve_gains(config, ctx.phase, ctx.phase_elapsed_s);
    const float reference_half = box_.min_half();
    const bool post_draw = is_post_draw_phase(ctx.phase);
    const float line_up_t = std::clamp(ctx.line_up_t, 0.0f, 1.0f);

    for (size_t i = 0; i < ids_.size(); ++i) {
        const bool selected = selected_[i] != 0;

        if (selected && line_up_active_) {
            apply_line_up(i, ctx.phase == SessionPhase::LiningUp ? line_up_t : 1.0f);
            continue;
        }

        Eigen::Vector3f& pos = positions_[i];
        Eigen::Vector3f& vel = velocities_[i];

        // Selected particles stop reacting to ambient forces after the draw
        const bool ambient = !(selected && post_draw);
        if (ambient) {
            vel += ForceModel::velocity_delta(pos, gains, reference_half, rng_);
        }

        vel *= config.damping;

        if (ambient) {
            apply_speed_floor(vel, config);
        }

        pos += vel;

        const uint8_t hit = BoundaryCollision::resolve(pos, vel, box_, radius_);
        if (BoundaryCollision::should_recolor(hit, selected, config.recolor_on_bounce)) {
            colors_[i] = BouncePalette::random_color(rng_);
        }

        if (!selected && ctx.phase == SessionPhase::Exploding && visible_[i]) {
            opacities_[i] = std::max(0.0f, opacities_[i] - ctx.fade_per_step);
            if (opacities_[i] <= 0.0f) {
                visible_[i] = 0;
            }
        }
    }
}

void ParticleField::apply_speed_floor(Eigen::Vector3f& vel, const SimulationConfig& config) {
    // Keeps the field from ever settling completely
    if (vel.norm() >= config.min_speed) return;
    std::uniform_real_distribution<float> kick(-0.5f, 0.5f);
    const float x = kick(rng_);
    const float y = kick(rng_);
    const float z = kick(rng_);
    vel += Eigen::Vector3f(x, y, z) * config.speed_factor;
}

void ParticleField::apply_line_up(size_t i, float t) {
    const Eigen::Vector3f& origin = line_up_origin_[i];
    positions_[i] = origin + (line_up_target_[i] - origin) * t;
    velocities_[i].setZero();
}

size_t ParticleField::mark_selected(const std::vector<int>& ids, const Color& highlight) {
    size_t marked = 0;
    for (int id : ids) {
        size_t index = 0;
        if (!index_of(id, index) || selected_[index]) continue;
        selected_[index] = 1;
        colors_[index] = highlight;
        opacities_[index] = 1.0f;
        visible_[index] = 1;
        ++marked;
    }
    return marked;
}

void ParticleField::begin_line_up(const std::vector<int>& ids, const std::vector<Eigen::Vector3f>& slots) {
    const size_t n = std::min(ids.size(), slots.size());
    for (size_t k = 0; k < n; ++k) {
        size_t index = 0;
        if (!index_of(ids[k], index) || !selected_[index]) continue;
        line_up_origin_[index] = positions_[index];
        line_up_target_[index] = slots[k];
        velocities_[index].setZero();
    }
    line_up_active_ = true;
}

void ParticleField::finish_line_up() {
    if (!line_up_active_) return;
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (selected_[i]) apply_line_up(i, 1.0f);
    }
}

void ParticleField::hide_unselected() {
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (selected_[i]) continue;
        opacities_[i] = 0.0f;
        visible_[i] = 0;
    }
}

// Accessor methods
ParticleView ParticleField::get_particle(size_t index) const {
    if (index >= ids_.size()) {
        return ParticleView{0, Eigen::Vector3f::Zero(), Eigen::Vector3f::Zero(), Color(), 0.0f, false, false};
    }
    return ParticleView{ids_[index], positions_[index], velocities_[index], colors_[index],
                        opacities_[index], visible_[index] != 0, selected_[index] != 0};
}

Eigen::Vector3f ParticleField::get_position(size_t index) const {
    if (index >= ids_.size()) return Eigen::Vector3f::Zero();
    return positions_[index];
}

Eigen::Vector3f ParticleField::get_velocity(size_t index) const {
    if (index >= ids_.size()) return Eigen::Vector3f::Zero();
    return velocities_[index];
}

Color ParticleField::get_color(size_t index) const {
    if (index >= ids_.size()) return Color();
    return colors_[index];
}

float ParticleField::get_opacity(size_t index) const {
    if (index >= ids_.size()) return 0.0f;
    return opacities_[index];
}

bool ParticleField::is_visible(size_t index) const {
    return index < ids_.size() && visible_[index] != 0;
}

bool ParticleField::is_selected(size_t index) const {
    return index < ids_.size() && selected_[index] != 0;
}

bool ParticleField::index_of(int id, size_t& index) const {
    if (id < 1 || static_cast<size_t>(id) > ids_.size()) return false;
    index = static_cast<size_t>(id - 1);
    return true;
}

std::vector<int> ParticleField::get_selected_ids() const {
    std::vector<int> out;
    for (size_t i = 0; i < ids_.size(); ++i) {
        if (selected_[i]) out.push_back(ids_[i]);
    }
    return out;
}

void ParticleField::prepare_render_data(std::vector<ParticleView>& out) const {
    out.resize(ids_.size());
    for (size_t i = 0; i < ids_.size(); ++i) {
        out[i] = get_particle(i);
    }
}
