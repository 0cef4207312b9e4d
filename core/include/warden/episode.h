#pragma once

// episode.h
//
// What the evaluation binary does inside the sandbox: inspect the artifact,
// fly one closed-loop episode recording the commands, then score the
// recorded plan through the replay engine.

#include "warden/documents.h"
#include "warden/inspect.h"
#include "warden/policy.h"
#include "warden/replay.h"
#include "warden/simulator.h"

#include <filesystem>
#include <vector>

namespace warden {

// Policy actions in [-1, 1] scale rotor speeds around hover.
struct ActionMap {
    double gain{0.05};
};

RotorCmd action_to_rpm(const std::vector<double>& action, const ActionMap& m = ActionMap{});

// Run policy against sim for the task horizon. Commands are stamped at
// step boundaries and only recorded when they change.
ActionPlan record_episode(const MlpPolicy& policy, const Task& task, Simulator& sim,
                          const ActionMap& m = ActionMap{});

struct EvalOptions {
    ReplayParams replay;
    RewardParams reward;
    ActionMap action;
    InspectionLimits inspection;
    size_t max_entry_bytes{50u * 1024 * 1024};
};

// EVAL mode. Inspection and load failures come back in the document.
ResultDoc run_evaluation(const Task& task, Uid uid, const std::filesystem::path& artifact,
                         const EvalOptions& opt = EvalOptions{});

// VERIFY_ONLY mode.
VerificationDoc run_verification(Uid uid, const std::filesystem::path& artifact,
                                 const EvalOptions& opt = EvalOptions{});

} // namespace warden
