#pragma once

#include "warden/types.h"

#include <cstdint>
#include <string>

namespace warden {

struct TaskGenConfig {
    double world_range{30.0};
    int n_obstacles{100};
    double height_scale{1.8};
    double r_min{10.0};
    double r_max{30.0};
    double h_min{2.0};
    double h_max{10.0};
    double clearance{2.0};      // obstacle-free radius around start and goal
    double horizon{30.0};
    double sim_dt{1.0 / 50.0};
};

// Same seed and config always give the same task.
Task random_task(uint64_t seed, const TaskGenConfig& cfg);

std::string task_to_json(const Task& t);
// Empty string on success. Rejects non-finite numbers and absurd sizes.
std::string task_from_json(const std::string& text, Task* out);

std::string plan_to_json(const ActionPlan& p);
std::string plan_from_json(const std::string& text, ActionPlan* out);

} // namespace warden
