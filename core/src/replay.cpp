#include "warden/replay.h"

#include <algorithm>
#include <cmath>

namespace warden {

int64_t horizon_steps(double horizon, double dt) {
    if (!(dt > 0.0) || !(horizon > 0.0)) return 0;
    return (int64_t)std::ceil(horizon / dt - 1e-9);
}

std::vector<RotorCmd> plan_to_table(const ActionPlan& plan, double dt, int64_t n_steps) {
    std::vector<RotorCmd> table((size_t)std::max<int64_t>(n_steps, 0), RotorCmd{0.0, 0.0, 0.0, 0.0});
    if (table.empty()) return table;

    // mark the step at which each command takes over
    std::vector<int64_t> start_of;
    start_of.reserve(plan.commands.size());
    for (const auto& c : plan.commands) {
        int64_t k = (int64_t)std::floor(c.t / dt + 1e-9);
        start_of.push_back(std::clamp<int64_t>(k, 0, n_steps - 1));
    }

    RotorCmd cur{0.0, 0.0, 0.0, 0.0};
    size_t next = 0;
    for (int64_t k = 0; k < n_steps; k++) {
        while (next < plan.commands.size() && start_of[next] <= k) {
            cur = plan.commands[next].rpm;
            next++;
        }
        table[(size_t)k] = cur;
    }
    return table;
}

bool contact_is_touchdown(const Vec3& pos, const Vec3& goal, const ReplayParams& p) {
    const double horiz = std::hypot(pos[0] - goal[0], pos[1] - goal[1]);
    const double vert = std::fabs(pos[2] - goal[2]);
    return horiz < p.contact_radius && vert < p.contact_height_tol;
}

bool within_landing_envelope(const Vec3& pos, const Vec3& goal, const ReplayParams& p) {
    const double horiz = std::hypot(pos[0] - goal[0], pos[1] - goal[1]);
    const double vert = std::fabs(pos[2] - goal[2]);
    return horiz < p.landing_radius && vert < p.landing_height_tol && pos[2] >= goal[2] - p.landing_below_tol;
}

ReplayOutcome replay(const Task& task, const ActionPlan& plan, Simulator& sim, const ReplayParams& p) {
    const double dt = task.sim_dt;
    const int64_t n_steps = horizon_steps(task.horizon, dt);
    const int64_t stable_needed = std::max<int64_t>(1, (int64_t)std::ceil(p.stable_landing_sec / dt - 1e-9));
    const std::vector<RotorCmd> table = plan_to_table(plan, dt, n_steps);

    sim.reset(task);
    ReplayOutcome out;
    int64_t stable = 0;

    for (int64_t k = 0; k < n_steps; k++) {
        const RotorCmd& cmd = table[(size_t)k];
        const double sq = cmd[0] * cmd[0] + cmd[1] * cmd[1] + cmd[2] * cmd[2] + cmd[3] * cmd[3];
        out.energy += p.energy_coeff * sq * dt;

        StepOutput so = sim.step(cmd);
        out.steps = k + 1;
        out.time_sec = (double)(k + 1) * dt;
        const Vec3 pos = sim.state().pos;

        for (const Contact& c : so.contacts) {
            if (!contact_is_touchdown(c.point, task.goal, p)) {
                out.collided = true;
                out.success = false;
                return out;
            }
        }

        if (within_landing_envelope(pos, task.goal, p)) {
            if (++stable >= stable_needed) {
                out.success = true;
                return out;
            }
        } else {
            stable = 0;
        }
    }
    return out;
}

ReplayOutcome replay(const Task& task, const ActionPlan& plan, const ReplayParams& p) {
    PointMassSimulator sim;
    return replay(task, plan, sim, p);
}

double reward(bool success, double time_sec, double energy, double horizon, const RewardParams& p) {
    double score = 0.0;
    if (success && std::isfinite(time_sec) && std::isfinite(energy)) {
        const double h = horizon > 0.0 ? horizon : 1.0;
        const double budget = p.energy_budget > 0.0 ? p.energy_budget : 1.0;
        score = 0.5 + 0.3 * std::max(0.0, 1.0 - time_sec / h) + 0.2 * std::max(0.0, 1.0 - energy / budget);
        score = std::clamp(score, 0.0, 1.0);
    }
    if (score == 0.0) score = p.floor;
    return score;
}

} // namespace warden
