#include "warden/episode.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace warden {

RotorCmd action_to_rpm(const std::vector<double>& action, const ActionMap& m) {
    const double hover = hover_rpm();
    RotorCmd rpm{hover, hover, hover, hover};
    for (size_t i = 0; i < rpm.size() && i < action.size(); i++) {
        const double a = std::isfinite(action[i]) ? std::clamp(action[i], -1.0, 1.0) : 0.0;
        rpm[i] = std::clamp(hover * (1.0 + m.gain * a), 0.0, kMaxRpm);
    }
    return rpm;
}

ActionPlan record_episode(const MlpPolicy& policy, const Task& task, Simulator& sim, const ActionMap& m) {
    ActionPlan plan;
    const int64_t n = horizon_steps(task.horizon, task.sim_dt);
    sim.reset(task);

    std::vector<double> obs(kObsDim);
    for (int64_t k = 0; k < n; k++) {
        const Observation o = sim.observe();
        std::copy(o.begin(), o.end(), obs.begin());
        const RotorCmd cmd = action_to_rpm(policy.act(obs), m);
        if (plan.commands.empty() || plan.commands.back().rpm != cmd) {
            plan.commands.push_back(TimedCommand{(double)k * task.sim_dt, cmd});
        }
        (void)sim.step(cmd);
    }
    return plan;
}

ResultDoc run_evaluation(const Task& task, Uid uid, const std::filesystem::path& artifact, const EvalOptions& opt) {
    ResultDoc doc;
    doc.uid = uid;

    SecureLoader loader(opt.max_entry_bytes, opt.max_entry_bytes);
    ExecutionContext ctx;
    ctx.obs_dim = kObsDim;
    ctx.act_dim = kActDim;

    InspectionReport rep = inspect_artifact(artifact, ctx, loader, opt.inspection);
    doc.inspection_json = rep.verdict.evidence_json;
    if (rep.verdict.verdict == Verdict::ADVERSARIAL) {
        doc.is_fake_model = true;
        doc.fake_reason = rep.verdict.reason;
        return doc;
    }
    if (rep.verdict.verdict == Verdict::MISSING_METADATA || !rep.policy) {
        doc.error = "missing metadata: " + rep.verdict.reason;
        return doc;
    }

    PointMassSimulator sim;
    const ActionPlan plan = record_episode(*rep.policy, task, sim, opt.action);
    const ReplayOutcome out = replay(task, plan, sim, opt.replay);

    doc.success = out.success;
    doc.t = out.time_sec;
    doc.e = out.energy;
    doc.score = reward(out.success, out.time_sec, out.energy, task.horizon, opt.reward);
    std::cerr << "[evalhost] uid=" << uid << " success=" << out.success << " t=" << out.time_sec
              << " e=" << out.energy << " steps=" << out.steps << " score=" << doc.score << "\n";
    return doc;
}

VerificationDoc run_verification(Uid uid, const std::filesystem::path& artifact, const EvalOptions& opt) {
    SecureLoader loader(opt.max_entry_bytes, opt.max_entry_bytes);
    ExecutionContext ctx;
    ctx.obs_dim = kObsDim;
    ctx.act_dim = kActDim;
    InspectionReport rep = inspect_artifact(artifact, ctx, loader, opt.inspection);
    return verification_doc_from_verdict(uid, rep.verdict);
}

} // namespace warden
