#pragma once
#include "SimulationConfig.h"
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

class ParticleField;

// Repeated uniform sampling from a shrinking pool: every remaining id has the
// same probability at every step and no id can come out twice.
struct UniformWithoutReplacementPolicy {
    static std::vector<int> draw(std::vector<int> pool, size_t k, std::mt19937& rng);
};

// The k fastest particles, fastest first (ties go to the lower id)
struct MaxSpeedPolicy {
    static std::vector<int> draw(const std::vector<int>& ids,
                                 const std::vector<float>& speeds, size_t k);
};

class SelectionEngine {
public:
    explicit SelectionEngine(uint32_t seed = 0);

    void reseed(uint32_t seed);

    // Ordered sequence of min(k, ids.size()) distinct ids, in draw order
    std::vector<int> draw_without_replacement(const std::vector<int>& ids, size_t k);

    // Dispatch on the configured policy over every particle in the field
    std::vector<int> draw(const ParticleField& field, size_t k, SelectionPolicy policy);

private:
    std::mt19937 rng_;
};
