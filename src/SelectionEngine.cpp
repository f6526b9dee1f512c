#include "SelectionEngine.h"
#include "ParticleField.h"
#include <algorithm>
#include <numeric>

std::vector<int> UniformWithoutReplacementPolicy::draw(std::vector<int> pool, size_t k, std::mt19937& rng) {
    const size_t n = std::min(k, pool.size());
    std::vector<int> chosen;
    chosen.reserve(n);

    for (size_t step = 0; step < n; ++step) {
        std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
        const size_t j = pick(rng);
        chosen.push_back(pool[j]);
        // Swap-remove keeps the pool contiguous; order inside the pool is irrelevant
        pool[j] = pool.back();
        pool.pop_back();
    }
    return chosen;
}

std::vector<int> MaxSpeedPolicy::draw(const std::vector<int>& ids,
                                      const std::vector<float>& speeds, size_t k) {
    const size_t count = std::min(ids.size(), speeds.size());
    const size_t n = std::min(k, count);

    std::vector<size_t> order(count);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (speeds[a] != speeds[b]) return speeds[a] > speeds[b];
        return ids[a] < ids[b];
    });

    std::vector<int> chosen;
    chosen.reserve(n);
    for (size_t i = 0; i < n; ++i) chosen.push_back(ids[order[i]]);
    return chosen;
}

SelectionEngine::SelectionEngine(uint32_t seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {
}

void SelectionEngine::reseed(uint32_t seed) {
    rng_.seed(seed != 0 ? seed : std::random_device{}());
}

std::vector<int> SelectionEngine::draw_without_replacement(const std::vector<int>& ids, size_t k) {
    return UniformWithoutReplacementPolicy::draw(ids, k, rng_);
}

std::vector<int> SelectionEngine::draw(const ParticleField& field, size_t k, SelectionPolicy policy) {
    const std::vector<int>& ids = field.get_ids();

    switch (policy) {
        case SelectionPolicy::MaxSpeed: {
            std::vector<float> speeds(ids.size());
            const auto& velocities = field.get_velocities();
            for (size_t i = 0; i < ids.size(); ++i) speeds[i] = velocities[i].norm();
            return MaxSpeedPolicy::draw(ids, speeds, k);
        }
        case SelectionPolicy::UniformWithoutReplacement:
        default:
            return UniformWithoutReplacementPolicy::draw(ids, k, rng_);
    }
}
