#include "Clock.h"
#include "EventSystem.h"
#include "LotterySession.h"
#include "OracleBridge.h"
#include "SimulationConfig.h"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr double kFrameDt = 1.0 / 60.0;
constexpr double kManualSwirlSeconds = 3.0;    // without a countdown, select after this much swirl
constexpr double kMaxSessionSeconds = 120.0;

struct DriverOptions {
    long count = -1;
    long picks = -1;
    unsigned long seed = 0;
    bool simple = false;
    std::string mood;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--count N] [--picks K] [--seed S] [--simple] [--mood WORD]\n";
}

bool parse_number(const char* text, long& out) {
    char* end = nullptr;
    out = std::strtol(text, &end, 10);
    return end != text && *end == '\0';
}

bool parse_args(int argc, char** argv, DriverOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        long value = 0;

        if (arg == "--simple") {
            options.simple = true;
        } else if (arg == "--count" && has_value && parse_number(argv[i + 1], value)) {
            options.count = value;
            ++i;
        } else if (arg == "--picks" && has_value && parse_number(argv[i + 1], value)) {
            options.picks = value;
            ++i;
        } else if (arg == "--seed" && has_value && parse_number(argv[i + 1], value) && value >= 0) {
            options.seed = static_cast<unsigned long>(value);
            ++i;
        } else if (arg == "--mood" && has_value) {
            options.mood = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    DriverOptions options;
    if (!parse_args(argc, argv, options)) {
        print_usage(argv[0]);
        return 2;
    }

    SimulationConfig config = options.simple ? SimulationConfig::simple_variant() : SimulationConfig();
    if (options.count > 0) config.particle_count = static_cast<size_t>(options.count);
    if (options.picks > 0) config.picks = static_cast<size_t>(options.picks);
    config.rng_seed = static_cast<uint32_t>(options.seed);

    const ConfigResult check = config.validate();
    if (!check.ok) {
        std::cerr << "Invalid configuration: " << check.message << "\n";
        return 2;
    }

    EventBus bus;
    bus.subscribe<CountdownTickEvent>(Events::COUNTDOWN_TICK, [](const CountdownTickEvent& e) {
        std::cout << "  " << e.value << "\n";
    });
    bus.subscribe<OracleTextEvent>(Events::ORACLE_TEXT, [](const OracleTextEvent& e) {
        std::cout << "Oracle: " << e.text << "\n";
    });
    bus.subscribe<OracleFailedEvent>(Events::ORACLE_FAILED, [](const OracleFailedEvent& e) {
        std::cerr << "Oracle unavailable: " << e.message << "\n";
    });

    ManualClock clock;
    std::unique_ptr<MoodPresetOracle> oracle;
    if (!options.mood.empty()) {
        oracle = std::make_unique<MoodPresetOracle>();
    }

    LotterySession session(config, clock, bus, oracle.get());

    if (oracle) {
        session.request_suggestion(options.mood);
        session.wait_for_oracle();
        session.tick();
        session.request_narrative(options.mood);
        session.wait_for_oracle();
        session.tick();
    }

    std::cout << "Cosmic Lottery: " << session.config().particle_count << " particles, K="
              << session.config().picks << "\n";

    session.start();

    double elapsed = 0.0;
    bool selected = false;
    while (session.phase() != SessionPhase::Complete && elapsed < kMaxSessionSeconds) {
        clock.advance(kFrameDt);
        session.tick();
        elapsed += kFrameDt;

        if (!selected && !session.config().enable_countdown && elapsed >= kManualSwirlSeconds) {
            selected = session.select_now();
        }
    }

    const auto& result = session.result();
    if (!result) {
        std::cerr << "Session did not complete\n";
        return 1;
    }

    std::cout << "\nChosen:";
    for (int id : result->selected_ids) std::cout << " " << id;
    std::cout << "\nSum: " << result->sum << "\nNumber: " << result->numerology_digit
              << "\nMeaning: " << result->meaning << "\n";
    if (result->degraded) {
        std::cout << "(only " << result->selected_ids.size() << " of " << result->requested
                  << " could be drawn)\n";
    }
    return 0;
}
