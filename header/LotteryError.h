#pragma once
#include <string>
#include <utility>

enum class LotteryError {
    None = 0,
    InsufficientParticles,  // fewer particles than picks; the draw degrades to what exists
    InvalidConfig,          // whole config update rejected, previous config stays active
    OracleUnavailable       // text oracle failed; simulation state untouched
};

inline const char* to_string(LotteryError error) {
    switch (error) {
        case LotteryError::None:                  return "None";
        case LotteryError::InsufficientParticles: return "InsufficientParticles";
        case LotteryError::InvalidConfig:         return "InvalidConfig";
        case LotteryError::OracleUnavailable:     return "OracleUnavailable";
    }
    return "Unknown";
}

struct ConfigResult {
    bool ok;
    LotteryError error;
    std::string message;

    static ConfigResult success() { return ConfigResult{true, LotteryError::None, {}}; }
    static ConfigResult invalid(std::string message) {
        return ConfigResult{false, LotteryError::InvalidConfig, std::move(message)};
    }
};
