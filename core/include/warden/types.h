#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace warden {

// Participant identifier (network slot). Slot 0 is the default burn sink.
using Uid = int64_t;

using Vec3 = std::array<double, 3>;

// Axis-aligned box obstacle.
struct Obstacle {
    Vec3 center{0.0, 0.0, 0.0};
    Vec3 half_extents{0.5, 0.5, 0.5};
};

// One deterministic simulation scenario. Generated fresh every round.
struct Task {
    Vec3 start{0.0, 0.0, 1.0};
    Vec3 goal{5.0, 5.0, 2.0};
    std::vector<Obstacle> obstacles;
    double horizon{30.0};   // seconds of simulated flight
    double sim_dt{1.0 / 50.0};
    uint64_t map_seed{0};
};

// Four rotor speeds in RPM.
using RotorCmd = std::array<double, 4>;

struct TimedCommand {
    double t{0.0};
    RotorCmd rpm{0.0, 0.0, 0.0, 0.0};
};

// Sparse, time-ordered control sequence. Gaps hold the previous command.
struct ActionPlan {
    std::vector<TimedCommand> commands;
};

struct EvaluationResult {
    Uid uid{0};
    bool success{false};
    double time_sec{0.0};
    double energy{0.0};
    double score{0.0};

    static EvaluationResult zero(Uid uid) {
        EvaluationResult r;
        r.uid = uid;
        return r;
    }
};

enum class Verdict {
    LEGITIMATE,
    MISSING_METADATA,
    ADVERSARIAL,
};

const char* verdict_name(Verdict v);

struct VerificationVerdict {
    Verdict verdict{Verdict::LEGITIMATE};
    std::string reason;
    std::string evidence_json{"{}"};  // raw inspection results
};

} // namespace warden
