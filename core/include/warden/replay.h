#pragma once

#include "warden/simulator.h"
#include "warden/types.h"

#include <cstdint>
#include <vector>

namespace warden {

// Tolerance envelope and energy model for replay. The defaults follow the
// 0.6 m landing platform: touchdown radius is 0.6 * 0.8 * 1.06.
struct ReplayParams {
    double stable_landing_sec{1.0};
    double landing_radius{0.6 * 0.8 * 1.06};
    double landing_height_tol{0.3};
    double landing_below_tol{0.1};
    double contact_radius{0.6 + 0.05};
    double contact_height_tol{0.3};
    double energy_coeff{kThrustCoeff / kPropEfficiency};
};

struct ReplayOutcome {
    bool success{false};
    bool collided{false};
    double time_sec{0.0};
    double energy{0.0};
    int64_t steps{0};
};

// Number of fixed steps covering the horizon.
int64_t horizon_steps(double horizon, double dt);

// Dense per-step command table: a command stamped t applies from step
// floor(t/dt + 1e-9), clamped into range; zero before the first command,
// then the latest command is held.
std::vector<RotorCmd> plan_to_table(const ActionPlan& plan, double dt, int64_t n_steps);

// True when a contact at pos counts as touchdown on the landing target.
bool contact_is_touchdown(const Vec3& pos, const Vec3& goal, const ReplayParams& p);

// True when pos lies inside the landing envelope of goal.
bool within_landing_envelope(const Vec3& pos, const Vec3& goal, const ReplayParams& p);

// Deterministic re-simulation of plan against task on sim.
ReplayOutcome replay(const Task& task, const ActionPlan& plan, Simulator& sim, const ReplayParams& p);

// Convenience overload using PointMassSimulator.
ReplayOutcome replay(const Task& task, const ActionPlan& plan, const ReplayParams& p = ReplayParams{});

struct RewardParams {
    double energy_budget{30.0};   // roughly twice the hover energy over a 30 s horizon
    double floor{0.01};
};

// Score in [0, 1]. Unsuccessful error-free runs receive the floor.
double reward(bool success, double time_sec, double energy, double horizon,
              const RewardParams& p = RewardParams{});

} // namespace warden
