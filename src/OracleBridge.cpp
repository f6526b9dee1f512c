#include "OracleBridge.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

//===========================================================================================
//==                                   MOOD PRESETS                                        ==
//===========================================================================================

namespace {

struct MoodPreset {
    const char* keyword;
    const char* line;
    std::map<std::string, std::string> parameters;
};

const std::vector<MoodPreset>& mood_presets() {
    static const std::vector<MoodPreset> presets = {
        {"calm", "A slow tide of light circles the still centre.",
            {{"damping", "0.998"}, {"jitter_gain", "0.0005"}, {"swirl_orbital_gain", "0.001"},
             {"hue", "200"}, {"saturation", "60"}, {"lightness", "65"}}},
        {"chaotic", "Sparks collide and scatter, refusing any order.",
            {{"damping", "0.99"}, {"jitter_gain", "0.01"}, {"swirl_orbital_gain", "0.006"},
             {"hue", "0"}, {"saturation", "85"}}},
        {"cosmic", "A galaxy folds in on itself around a hungry core.",
            {{"orbital_gain", "0.0005"}, {"swirl_orbital_gain", "0.004"}, {"pull_gain", "0.00004"},
             {"hue", "270"}, {"saturation", "70"}, {"lightness", "60"}}},
        {"fiery", "Embers whirl upward, hot and impatient.",
            {{"hue", "15"}, {"saturation", "90"}, {"lightness", "55"}, {"speed_factor", "0.025"}}},
        {"dreamy", "Pale motes drift as if half asleep.",
            {{"hue", "300"}, {"lightness", "75"}, {"damping", "0.997"}, {"jitter_gain", "0.001"}}},
    };
    return presets;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const MoodPreset* find_preset(const std::string& mood) {
    const std::string m = lowercase(mood);
    for (const auto& preset : mood_presets()) {
        if (m.find(preset.keyword) != std::string::npos) return &preset;
    }
    return nullptr;
}

} // namespace

OracleReply MoodPresetOracle::ask(const OracleRequest& request) {
    OracleReply reply{true, {}, {}, false, {}};
    const MoodPreset* preset = find_preset(request.mood);

    if (request.kind == OracleRequestKind::Narrative) {
        auto it = request.config_snapshot.find("particle_count");
        const std::string count = it != request.config_snapshot.end() ? it->second : "countless";
        reply.text = std::string(preset ? preset->line : "The swarm waits, humming quietly.")
                   + " " + count + " particles hold their breath.";
        return reply;
    }

    if (!preset) {
        reply.ok = false;
        reply.error = "no preset matches mood '" + request.mood + "'";
        return reply;
    }
    reply.text = preset->line;
    reply.has_suggestion = true;
    reply.suggestion = preset->parameters;
    return reply;
}

//===========================================================================================
//==                                   BRIDGE                                              ==
//===========================================================================================

OracleBridge::OracleBridge(TextOracle& oracle)
    : oracle_(oracle) {
}

OracleBridge::~OracleBridge() {
    wait_all();
}

void OracleBridge::submit(const OracleRequest& request, uint64_t generation) {
    TextOracle* oracle = &oracle_;
    std::future<OracleReply> future = std::async(std::launch::async, [oracle, request]() {
        return oracle->ask(request);
    });
    pending_.push_back(Pending{generation, request.kind, std::move(future)});
}

TaggedReply OracleBridge::resolve(Pending& pending) {
    TaggedReply tagged{pending.generation, pending.kind, OracleReply{false, {}, {}, false, {}},
                       LotteryError::None};
    try {
        tagged.reply = pending.future.get();
    } catch (const std::exception& e) {
        tagged.reply.ok = false;
        tagged.reply.error = e.what();
    } catch (...) {
        tagged.reply.ok = false;
        tagged.reply.error = "oracle failed with a non-standard exception";
    }

    if (!tagged.reply.ok) {
        tagged.error = LotteryError::OracleUnavailable;
        std::cerr << "⚠️  Oracle call failed: " << tagged.reply.error << "\n";
    }
    return tagged;
}

std::vector<TaggedReply> OracleBridge::collect_ready() {
    std::vector<TaggedReply> ready;
    std::vector<Pending> still_pending;
    still_pending.reserve(pending_.size());

    for (auto& pending : pending_) {
        if (pending.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            ready.push_back(resolve(pending));
        } else {
            still_pending.push_back(std::move(pending));
        }
    }
    pending_ = std::move(still_pending);
    return ready;
}

void OracleBridge::wait_all() {
    for (auto& pending : pending_) {
        if (pending.future.valid()) pending.future.wait();
    }
}
