#pragma once

#include "warden/aggregate.h"
#include "warden/config.h"
#include "warden/fingerprint_set.h"
#include "warden/gate.h"
#include "warden/log.h"
#include "warden/orchestrator.h"
#include "warden/task.h"
#include "warden/transport.h"
#include "warden/types.h"
#include "warden/verifier.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace warden {

// Published-output collaborator.
class WeightSink {
public:
    virtual ~WeightSink() = default;
    // Empty string on success.
    virtual std::string publish(const std::string& round_id, const WeightVector& w) = 0;
};

// {"round_id", "ts", "weights": [{"uid", "weight"}]} written atomically.
class FileWeightSink : public WeightSink {
public:
    explicit FileWeightSink(std::filesystem::path file);
    std::string publish(const std::string& round_id, const WeightVector& w) override;
    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
};

struct RoundSummary {
    std::string round_id;
    uint64_t seed{0};
    Task task;
    std::vector<EvaluationResult> results;   // one per participant, in order
    std::vector<Uid> rejected;
    std::vector<Uid> skipped;
    std::vector<Uid> adversarial;
    WeightVector round_weights;
    WeightVector published;
    std::string log_path;
    std::string error;                       // round-level failure, if any
};

class RoundCoordinator {
public:
    RoundCoordinator(const ValidatorConfig& cfg, Transport& transport, FingerprintSet& blacklist,
                     IntegrityGate& gate, Verifier& verifier, Orchestrator& orch, ScoreBook& book,
                     WeightSink& sink);

    // Gate -> Verifier (first sighting) -> evaluate -> aggregate -> publish.
    // Always publishes; failures degrade to zero results.
    RoundSummary run_round(uint64_t seed, const std::string& round_id);

    // Round loop with the pacing delay between rounds. max_rounds <= 0 runs
    // until *stop is set.
    int serve(int max_rounds, const std::atomic<bool>* stop);

    static std::string new_round_id();

private:
    std::vector<CacheOutcome> acquire(const std::vector<Uid>& uids);
    EvaluationResult score_participant(Uid uid, const CacheOutcome& co, const Task& task, RoundSummary* sum,
                                       JsonlLogger& log, int64_t* seq);

    ValidatorConfig cfg_;
    Transport& transport_;
    FingerprintSet& blacklist_;
    IntegrityGate& gate_;
    Verifier& verifier_;
    Orchestrator& orch_;
    ScoreBook& book_;
    WeightSink& sink_;
};

} // namespace warden
