#include "warden/orchestrator.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/task.h"

#include <iostream>
#include <vector>

namespace warden {

// ---- EnvironmentService ----

EnvironmentService::EnvironmentService(ExecHost& host, std::string image)
    : host_(host), image_(std::move(image)) {}

std::string EnvironmentService::ensure_ready() {
    std::lock_guard<std::mutex> lk(mu_);
    if (host_.image_present(image_)) {
        ready_ = true;
        return "";
    }
    ready_ = false;
    std::cerr << "[orchestrator] base image " << image_ << " missing, rebuilding\n";
    std::string err = host_.build_image(image_);
    if (!err.empty()) return "image build failed: " + err;
    if (!host_.image_present(image_)) return "image still missing after build: " + image_;
    ready_ = true;
    return "";
}

bool EnvironmentService::ready() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ready_;
}

// ---- EnvironmentLease ----

EnvironmentLease::EnvironmentLease(ExecHost& host, std::string name, std::filesystem::path scratch)
    : host_(host), name_(std::move(name)), scratch_(std::move(scratch)) {}

EnvironmentLease::~EnvironmentLease() {
    teardown();
}

void EnvironmentLease::teardown() {
    if (done_) return;
    std::string err = host_.kill(name_);
    if (!err.empty()) std::cerr << "[warn] kill " << name_ << ": " << err << "\n";
    err = host_.remove(name_);
    if (!err.empty()) std::cerr << "[warn] remove " << name_ << ": " << err << "\n";
    if (!scratch_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
        if (ec) std::cerr << "[warn] scratch " << scratch_.string() << ": " << ec.message() << "\n";
    }
    done_ = true;
}

const char* run_state_name(RunState s) {
    switch (s) {
        case RunState::PREPARING: return "PREPARING";
        case RunState::RUNNING: return "RUNNING";
        case RunState::COMPLETED: return "COMPLETED";
        case RunState::TIMED_OUT: return "TIMED_OUT";
        case RunState::CRASHED: return "CRASHED";
        case RunState::REMOVED: return "REMOVED";
    }
    return "CRASHED";
}

// ---- Orchestrator ----

namespace {

struct ActiveMark {
    std::mutex& mu;
    std::set<std::string>& names;
    std::string name;
    ActiveMark(std::mutex& m, std::set<std::string>& s, std::string n) : mu(m), names(s), name(std::move(n)) {
        std::lock_guard<std::mutex> lk(mu);
        names.insert(name);
    }
    ~ActiveMark() {
        std::lock_guard<std::mutex> lk(mu);
        names.erase(name);
    }
};

std::string tail(const std::string& s, size_t n = 512) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

} // namespace

Orchestrator::Orchestrator(OrchestratorConfig cfg, EnvironmentService& env)
    : cfg_(std::move(cfg)), env_(env) {}

std::string Orchestrator::eval_env_name(Uid uid) {
    return std::string(kEvalPrefix) + std::to_string(uid) + "_" + std::to_string(now_ms_i64()) + "_" +
           random_tag(8);
}

std::string Orchestrator::verify_env_name(const std::string& fingerprint) {
    const std::string fp8 = fingerprint.size() >= 8 ? fingerprint.substr(0, 8) : std::string("unknown0");
    return std::string(kVerifyPrefix) + fp8 + "_" + std::to_string(now_ms_i64()) + "_" + random_tag(8);
}

std::string Orchestrator::prepare(const EnvSpec& spec) {
    std::error_code ec;
    std::filesystem::create_directories(spec.shared_dir, ec);
    if (ec) return "scratch dir: " + ec.message();
    // the container user is not the validator's uid
    std::filesystem::permissions(spec.shared_dir, std::filesystem::perms::all, ec);
    if (ec) return "scratch perms: " + ec.message();

    std::string err = env_.ensure_ready();
    if (!err.empty()) return err;
    return env_.host().create(spec);
}

EvaluationResult Orchestrator::evaluate(const Task& task, Uid uid, const std::filesystem::path& artifact,
                                        VerificationVerdict* flagged) {
    EvaluationReport rep = evaluate_report(task, uid, artifact);
    if (rep.final.adversarial && flagged) {
        flagged->verdict = Verdict::ADVERSARIAL;
        flagged->reason = rep.final.reason;
        flagged->evidence_json = rep.final.evidence_json;
    }
    return rep.final.result;
}

EvaluationReport Orchestrator::evaluate_report(const Task& task, Uid uid, const std::filesystem::path& artifact) {
    try {
        return evaluate_impl(task, uid, artifact);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] uid=" << uid << " evaluation aborted: " << e.what() << "\n";
        EvaluationReport rep;
        rep.final.result = EvaluationResult::zero(uid);
        rep.final.reason = e.what();
        rep.message = e.what();
        return rep;
    }
}

EvaluationReport Orchestrator::evaluate_impl(const Task& task, Uid uid, const std::filesystem::path& artifact) {
    EvaluationReport rep;
    rep.final.result = EvaluationResult::zero(uid);
    rep.env_name = eval_env_name(uid);

    ActiveMark mark(active_mu_, active_, rep.env_name);
    EnvironmentLease lease(env_.host(), rep.env_name, cfg_.work_dir / rep.env_name);

    EnvSpec spec;
    spec.name = rep.env_name;
    spec.image = env_.image();
    spec.shared_dir = std::filesystem::absolute(lease.scratch());
    spec.artifact_path = std::filesystem::absolute(artifact);
    spec.args = {"eval", std::string(kSharedMount) + "/task.json", std::to_string(uid), kModelMount,
                 std::string(kSharedMount) + "/" + kResultFile};
    spec.caps = cfg_.eval_caps;
    spec.seccomp = cfg_.seccomp;
    spec.seccomp_profile = SeccompProfile::EVAL;
    spec.env = cfg_.child_env;

    // PREPARING
    std::string err = prepare(spec);
    if (err.empty()) err = write_atomic(spec.shared_dir / "task.json", task_to_json(task));
    if (!err.empty()) {
        rep.message = "prepare: " + err;
        rep.final.reason = rep.message;
        std::cerr << "[orchestrator] uid=" << uid << " " << rep.message << "\n";
        lease.teardown();
        rep.removed = true;
        return rep;
    }

    // RUNNING
    const int timeout_ms = (cfg_.eval_caps.timeout_sec + cfg_.eval_caps.grace_sec) * 1000;
    RunOutcome run = env_.host().run(rep.env_name, timeout_ms);

    if (run.timed_out) {
        rep.terminal = RunState::TIMED_OUT;
        rep.message = "timed out after " + std::to_string(timeout_ms) + " ms";
    } else if (!run.error.empty()) {
        rep.terminal = RunState::CRASHED;
        rep.message = "host: " + run.error;
    } else if (run.exit_code != 0) {
        rep.terminal = RunState::CRASHED;
        rep.message = "exit " + std::to_string(run.exit_code) + ": " + tail(run.output);
    } else {
        std::string body;
        err = read_file_bounded(spec.shared_dir / kResultFile, kMaxDocumentBytes, &body);
        ResultDoc doc;
        if (err.empty()) err = result_doc_from_json(body, &doc);
        if (err.empty() && doc.uid != uid) err = "result for uid " + std::to_string(doc.uid);
        if (!err.empty()) {
            rep.terminal = RunState::CRASHED;
            rep.message = "result: " + err;
        } else {
            rep.terminal = RunState::COMPLETED;
            rep.final = finalize_result(doc, uid, cfg_.reward_floor);
            rep.message = rep.final.adversarial ? "flagged: " + rep.final.reason : "ok";
        }
    }
    if (rep.terminal != RunState::COMPLETED) rep.final.reason = rep.message;

    lease.teardown();
    rep.removed = true;
    std::cerr << "[orchestrator] uid=" << uid << " env=" << rep.env_name << " state="
              << run_state_name(rep.terminal) << " score=" << rep.final.result.score << " (" << rep.message << ")\n";
    return rep;
}

std::optional<VerificationVerdict> Orchestrator::verify_only(Uid uid, const std::filesystem::path& artifact,
                                                             const std::string& fingerprint) {
    return verify_report(uid, artifact, fingerprint).verdict;
}

VerificationReport Orchestrator::verify_report(Uid uid, const std::filesystem::path& artifact,
                                               const std::string& fingerprint) {
    try {
        return verify_impl(uid, artifact, fingerprint);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] uid=" << uid << " verification aborted: " << e.what() << "\n";
        VerificationReport rep;
        rep.message = e.what();
        return rep;
    }
}

VerificationReport Orchestrator::verify_impl(Uid uid, const std::filesystem::path& artifact,
                                             const std::string& fingerprint) {
    VerificationReport rep;
    rep.env_name = verify_env_name(fingerprint);

    ActiveMark mark(active_mu_, active_, rep.env_name);
    EnvironmentLease lease(env_.host(), rep.env_name, cfg_.work_dir / rep.env_name);

    EnvSpec spec;
    spec.name = rep.env_name;
    spec.image = env_.image();
    spec.shared_dir = std::filesystem::absolute(lease.scratch());
    spec.artifact_path = std::filesystem::absolute(artifact);
    spec.args = {"verify", std::to_string(uid), kModelMount, std::string(kSharedMount) + "/" + kVerificationFile};
    spec.caps = cfg_.verify_caps;
    spec.seccomp = cfg_.seccomp;
    spec.seccomp_profile = SeccompProfile::VERIFY;
    spec.env = cfg_.child_env;

    std::string err = prepare(spec);
    if (!err.empty()) {
        rep.message = "prepare: " + err;
        std::cerr << "[orchestrator] verify uid=" << uid << " " << rep.message << "\n";
        lease.teardown();
        rep.removed = true;
        return rep;
    }

    const int timeout_ms = (cfg_.verify_caps.timeout_sec + cfg_.verify_caps.grace_sec) * 1000;
    RunOutcome run = env_.host().run(rep.env_name, timeout_ms);

    if (run.timed_out) {
        rep.terminal = RunState::TIMED_OUT;
        rep.message = "timed out after " + std::to_string(timeout_ms) + " ms";
    } else if (!run.error.empty()) {
        rep.message = "host: " + run.error;
    } else if (run.exit_code != 0) {
        rep.message = "exit " + std::to_string(run.exit_code) + ": " + tail(run.output);
    } else {
        std::string body;
        err = read_file_bounded(spec.shared_dir / kVerificationFile, kMaxDocumentBytes, &body);
        VerificationDoc doc;
        if (err.empty()) err = verification_doc_from_json(body, &doc);
        if (!err.empty()) {
            rep.message = "verification: " + err;
        } else {
            rep.terminal = RunState::COMPLETED;
            rep.verdict = verdict_from_doc(doc);
            rep.message = std::string(verdict_name(rep.verdict->verdict)) + ": " + rep.verdict->reason;
        }
    }

    lease.teardown();
    rep.removed = true;
    std::cerr << "[orchestrator] verify uid=" << uid << " env=" << rep.env_name << " state="
              << run_state_name(rep.terminal) << " (" << rep.message << ")\n";
    return rep;
}

size_t Orchestrator::cleanup() {
    size_t removed = 0;
    ExecHost& host = env_.host();
    for (const char* prefix : {kEvalPrefix, kVerifyPrefix}) {
        for (const std::string& name : host.list(prefix)) {
            {
                std::lock_guard<std::mutex> lk(active_mu_);
                if (active_.count(name)) continue;
            }
            EnvironmentLease orphan(host, name, cfg_.work_dir / name);
            orphan.teardown();
            removed++;
        }
    }

    // scratch dirs left by a killed validator
    std::error_code ec;
    std::vector<std::filesystem::path> stale;
    if (std::filesystem::is_directory(cfg_.work_dir, ec)) {
        for (const auto& de : std::filesystem::directory_iterator(cfg_.work_dir, ec)) {
            const std::string name = de.path().filename().string();
            if (name.rfind(kEvalPrefix, 0) != 0 && name.rfind(kVerifyPrefix, 0) != 0) continue;
            std::lock_guard<std::mutex> lk(active_mu_);
            if (!active_.count(name)) stale.push_back(de.path());
        }
    }
    for (const auto& p : stale) {
        std::error_code rec;
        std::filesystem::remove_all(p, rec);
    }
    if (removed) std::cerr << "[orchestrator] cleanup removed " << removed << " orphaned environments\n";
    return removed;
}

} // namespace warden
