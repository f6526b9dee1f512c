#pragma once
#include "Bounds.hpp"
#include "Color.h"
#include "EventSystem.h"
#include "SessionPhase.h"
#include "SimulationConfig.h"
#include <Eigen/Dense>
#include <cstdint>
#include <random>
#include <vector>

// Read-only copy of one particle, handed to renderers and tests
struct ParticleView {
    int id;
    Eigen::Vector3f position;
    Eigen::Vector3f velocity;
    Color color;
    float opacity;
    bool visible;
    bool selected;
};

// Phase information the field needs for one fixed step
struct StepContext {
    SessionPhase phase;
    float phase_elapsed_s;
    float line_up_t;       // [0,1], used while LiningUp
    float fade_per_step;   // opacity removed per step from unselected particles while Exploding
};

class ParticleField {
public:
    explicit ParticleField(EventBus& event_bus);

    // Particle management
    // Drops every particle (and any selection) and allocates config.particle_count
    // fresh ones with ids 1..N. seed == 0 draws a seed from std::random_device.
    void reset(const SimulationConfig& config, uint32_t seed);

    // One fixed step: forces -> damping -> speed floor -> integrate -> boundary
    void step(const SimulationConfig& config, const StepContext& ctx);

    // Selection choreography (driven by the phase machine)
    size_t mark_selected(const std::vector<int>& ids, const Color& highlight);
    void begin_line_up(const std::vector<int>& ids, const std::vector<Eigen::Vector3f>& slots);
    void finish_line_up();
    void hide_unselected();

    // Access for rendering and testing
    size_t get_particle_count() const { return ids_.size(); }
    uint64_t get_generation() const { return generation_; }
    const geom::CenteredBox& get_box() const { return box_; }
    float get_radius() const { return radius_; }
    bool is_line_up_active() const { return line_up_active_; }

    const std::vector<int>& get_ids() const { return ids_; }
    const std::vector<Eigen::Vector3f>& get_positions() const { return positions_; }
    const std::vector<Eigen::Vector3f>& get_velocities() const { return velocities_; }

    // Individual particle data (index = id - 1)
    ParticleView get_particle(size_t index) const;
    Eigen::Vector3f get_position(size_t index) const;
    Eigen::Vector3f get_velocity(size_t index) const;
    Color get_color(size_t index) const;
    float get_opacity(size_t index) const;
    bool is_visible(size_t index) const;
    bool is_selected(size_t index) const;
    bool index_of(int id, size_t& index) const;
    std::vector<int> get_selected_ids() const;

    void prepare_render_data(std::vector<ParticleView>& out) const;

private:
    #ifdef CL_TESTING
        friend struct FieldTestHooks;
    #endif

    void apply_speed_floor(Eigen::Vector3f& vel, const SimulationConfig& config);
    void apply_line_up(size_t i, float t);

    EventBus& event_bus_;
    std::mt19937 rng_;
    uint64_t generation_;

    geom::CenteredBox box_;
    float radius_;

    // SOA storage
    std::vector<int> ids_;
    std::vector<Eigen::Vector3f> positions_;
    std::vector<Eigen::Vector3f> velocities_;
    std::vector<Color> colors_;
    std::vector<float> opacities_;
    std::vector<uint8_t> visible_;
    std::vector<uint8_t> selected_;

    // Line-up choreography, only meaningful for selected particles
    bool line_up_active_;
    std::vector<Eigen::Vector3f> line_up_origin_;
    std::vector<Eigen::Vector3f> line_up_target_;
};
