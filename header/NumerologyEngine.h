#pragma once
#include <cstdint>
#include <string>
#include <vector>

class NumerologyEngine {
public:
    static constexpr const char* FALLBACK_MEANING = "The stars are silent on this number.";

    // Digit-sum reduction that stops early on a master number (11, 22, 33)
    static int reduce_to_single_digit(uint64_t n);

    // Total over {1..9, 11, 22, 33}; FALLBACK_MEANING for anything else
    static std::string meaning_of(int digit);

    static bool is_master_number(uint64_t n) { return n == 11 || n == 22 || n == 33; }
    static uint64_t digit_sum(uint64_t n);
    static uint64_t sum_of(const std::vector<int>& ids);
};
