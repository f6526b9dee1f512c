#include "NumerologyEngine.h"

uint64_t NumerologyEngine::digit_sum(uint64_t n) {
    uint64_t sum = 0;
    while (n > 0) {
        sum += n % 10;
        n /= 10;
    }
    return sum;
}

uint64_t NumerologyEngine::sum_of(const std::vector<int>& ids) {
    uint64_t sum = 0;
    for (int id : ids) {
        if (id > 0) sum += static_cast<uint64_t>(id);
    }
    return sum;
}

int NumerologyEngine::reduce_to_single_digit(uint64_t n) {
    while (n > 9) {
        if (is_master_number(n)) break;
        n = digit_sum(n);
    }
    return static_cast<int>(n);
}

std::string NumerologyEngine::meaning_of(int digit) {
    switch (digit) {
        case 1:  return "Beginnings: independence, courage and the spark of a new path.";
        case 2:  return "Harmony: partnership, patience and quiet diplomacy.";
        case 3:  return "Expression: creativity, joy and a voice that carries.";
        case 4:  return "Foundation: order, hard work and steady ground.";
        case 5:  return "Freedom: change, adventure and restless curiosity.";
        case 6:  return "Care: home, responsibility and a generous heart.";
        case 7:  return "Insight: reflection, mystery and the search for truth.";
        case 8:  return "Power: ambition, abundance and earned authority.";
        case 9:  return "Completion: compassion, wisdom and letting go.";
        case 11: return "Master 11, the Illuminator: intuition and inspiration beyond the ordinary.";
        case 22: return "Master 22, the Builder: vast dreams made solid.";
        case 33: return "Master 33, the Teacher: healing through selfless guidance.";
        default: return FALLBACK_MEANING;
    }
}
