#pragma once

#include "warden/config.h"
#include "warden/documents.h"
#include "warden/exec_host.h"
#include "warden/types.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace warden {

// Single owner of the shared base image. Evaluations call ensure_ready()
// and block while a missing image is rebuilt.
class EnvironmentService {
public:
    EnvironmentService(ExecHost& host, std::string image);

    // Pre-flight check, rebuilding synchronously when the image is missing.
    // Empty string on success.
    std::string ensure_ready();
    bool ready() const;

    ExecHost& host() { return host_; }
    const std::string& image() const { return image_; }

private:
    ExecHost& host_;
    std::string image_;
    mutable std::mutex mu_;
    bool ready_{false};
};

// Owns one named environment and its scratch directory. teardown() runs
// kill + remove + directory removal and may be called any number of times;
// the destructor calls it.
class EnvironmentLease {
public:
    EnvironmentLease(ExecHost& host, std::string name, std::filesystem::path scratch);
    ~EnvironmentLease();

    EnvironmentLease(const EnvironmentLease&) = delete;
    EnvironmentLease& operator=(const EnvironmentLease&) = delete;

    const std::string& name() const { return name_; }
    const std::filesystem::path& scratch() const { return scratch_; }
    bool torn_down() const { return done_; }

    void teardown();

private:
    ExecHost& host_;
    std::string name_;
    std::filesystem::path scratch_;
    bool done_{false};
};

enum class RunState { PREPARING, RUNNING, COMPLETED, TIMED_OUT, CRASHED, REMOVED };

const char* run_state_name(RunState s);

constexpr const char* kEvalPrefix = "warden_eval_";
constexpr const char* kVerifyPrefix = "warden_verify_";

struct OrchestratorConfig {
    std::filesystem::path work_dir{"warden_state/work"};
    ResourceCaps eval_caps;
    ResourceCaps verify_caps{4096, 1.0, 10, 32, 250LL * 1024 * 1024, 60, 0};
    bool seccomp{false};
    double reward_floor{0.01};
    // Forwarded to every evaluation binary (see evalhost_env()).
    std::vector<std::pair<std::string, std::string>> child_env;
};

struct EvaluationReport {
    FinalizedResult final;
    RunState terminal{RunState::CRASHED};   // state reached before REMOVED
    std::string env_name;
    std::string message;
    bool removed{false};
};

struct VerificationReport {
    std::optional<VerificationVerdict> verdict;   // nullopt: no verdict this time
    RunState terminal{RunState::CRASHED};
    std::string env_name;
    std::string message;
    bool removed{false};
};

class Orchestrator {
public:
    Orchestrator(OrchestratorConfig cfg, EnvironmentService& env);

    // Runs one artifact/task pair. Never throws; any failure is a zero
    // result. When the evaluation binary flags the artifact as fake, the
    // verdict is written to *flagged (if given) and the score is zero.
    EvaluationResult evaluate(const Task& task, Uid uid, const std::filesystem::path& artifact,
                              VerificationVerdict* flagged = nullptr);
    EvaluationReport evaluate_report(const Task& task, Uid uid, const std::filesystem::path& artifact);

    // Inspection-only run with the lighter caps. Timeouts, crashes and
    // missing documents give no verdict.
    std::optional<VerificationVerdict> verify_only(Uid uid, const std::filesystem::path& artifact,
                                                   const std::string& fingerprint);
    VerificationReport verify_report(Uid uid, const std::filesystem::path& artifact, const std::string& fingerprint);

    // Remove orphaned eval/verify environments not owned by a live
    // invocation. Returns the number removed.
    size_t cleanup();

    static std::string eval_env_name(Uid uid);
    static std::string verify_env_name(const std::string& fingerprint);

    const OrchestratorConfig& config() const { return cfg_; }

private:
    EvaluationReport evaluate_impl(const Task& task, Uid uid, const std::filesystem::path& artifact);
    VerificationReport verify_impl(Uid uid, const std::filesystem::path& artifact, const std::string& fingerprint);

    // Stage the scratch dir and create the environment. Empty string on success.
    std::string prepare(const EnvSpec& spec);

    OrchestratorConfig cfg_;
    EnvironmentService& env_;
    std::mutex active_mu_;
    std::set<std::string> active_;
};

} // namespace warden
