#pragma once
#include "LotteryError.h"
#include <cstdint>
#include <future>
#include <map>
#include <string>
#include <vector>

enum class OracleRequestKind : uint8_t {
    Narrative = 0,         // free flavour text, display only
    ParameterSuggestion    // structured parameters for a new config
};

struct OracleRequest {
    OracleRequestKind kind;
    std::map<std::string, std::string> config_snapshot;   // SimulationConfig::to_fields()
    std::string mood;
};

struct OracleReply {
    bool ok;
    std::string error;                                     // set when !ok
    std::string text;
    bool has_suggestion;
    std::map<std::string, std::string> suggestion;         // parameter name -> value text
};

// Opaque, fallible, slow. Called from worker threads, never from the simulation timeline.
class TextOracle {
public:
    virtual ~TextOracle() = default;
    virtual OracleReply ask(const OracleRequest& request) = 0;
};

// Offline oracle: maps mood keywords to parameter suggestions and a line of flavour text
class MoodPresetOracle : public TextOracle {
public:
    OracleReply ask(const OracleRequest& request) override;
};

struct TaggedReply {
    uint64_t generation;       // session reset generation the request was made in
    OracleRequestKind kind;
    OracleReply reply;
    LotteryError error;        // OracleUnavailable when the call failed
};

// Runs oracle calls off the simulation timeline and hands replies back when polled
class OracleBridge {
public:
    explicit OracleBridge(TextOracle& oracle);
    ~OracleBridge();

    OracleBridge(const OracleBridge&) = delete;
    OracleBridge& operator=(const OracleBridge&) = delete;

    void submit(const OracleRequest& request, uint64_t generation);

    // Non-blocking: returns every reply that has arrived, in submission order
    std::vector<TaggedReply> collect_ready();

    // Blocks until every outstanding call has finished (shutdown, tests)
    void wait_all();

    size_t pending() const { return pending_.size(); }

private:
    struct Pending {
        uint64_t generation;
        OracleRequestKind kind;
        std::future<OracleReply> future;
    };

    static TaggedReply resolve(Pending& pending);

    TextOracle& oracle_;
    std::vector<Pending> pending_;
};
