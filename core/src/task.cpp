#include "warden/task.h"
#include "warden/json_util.h"

#include <cmath>
#include <random>

namespace warden {

static constexpr size_t kMaxObstacles = 4096;
static constexpr size_t kMaxCommands = 1 << 20;
static constexpr double kPi = 3.14159265358979323846;

static double uniform(std::mt19937_64& rng, double lo, double hi) {
    // explicit formula: std::uniform_real_distribution is not portable bit-for-bit
    const double u = (double)(rng() >> 11) * (1.0 / 9007199254740992.0);
    return lo + (hi - lo) * u;
}

static double dist_xy(const Vec3& a, const Vec3& b) {
    return std::hypot(a[0] - b[0], a[1] - b[1]);
}

Task random_task(uint64_t seed, const TaskGenConfig& cfg) {
    std::mt19937_64 rng(seed);
    Task t;
    t.map_seed = seed;
    t.horizon = cfg.horizon;
    t.sim_dt = cfg.sim_dt;
    t.start = Vec3{0.0, 0.0, 1.0};

    const double angle = uniform(rng, 0.0, 2.0 * kPi);
    const double radius = uniform(rng, cfg.r_min, cfg.r_max);
    const double height = uniform(rng, cfg.h_min, cfg.h_max);
    t.goal = Vec3{radius * std::cos(angle), radius * std::sin(angle), height};

    // bounded number of draws so a tiny world cannot spin forever
    const int max_draws = cfg.n_obstacles * 20;
    for (int draw = 0; draw < max_draws && (int)t.obstacles.size() < cfg.n_obstacles; draw++) {
        Obstacle ob;
        const double sx = uniform(rng, 0.5, 2.0);
        const double sy = uniform(rng, 0.5, 2.0);
        const double sz = uniform(rng, 1.0, 5.0) * cfg.height_scale;
        const double cx = uniform(rng, -cfg.world_range, cfg.world_range);
        const double cy = uniform(rng, -cfg.world_range, cfg.world_range);
        ob.half_extents = Vec3{sx / 2.0, sy / 2.0, sz / 2.0};
        ob.center = Vec3{cx, cy, sz / 2.0};

        const double reach = std::hypot(ob.half_extents[0], ob.half_extents[1]) + cfg.clearance;
        if (dist_xy(ob.center, t.start) < reach) continue;
        if (dist_xy(ob.center, t.goal) < reach) continue;
        t.obstacles.push_back(ob);
    }
    return t;
}

static json_object* vec3_json(const Vec3& v) {
    return json::new_number_array({v[0], v[1], v[2]});
}

static bool vec3_from(json_object* obj, const char* key, Vec3* out) {
    auto v = json::get_number_array(obj, key, 3);
    if (!v) return false;
    *out = Vec3{(*v)[0], (*v)[1], (*v)[2]};
    return true;
}

std::string task_to_json(const Task& t) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "start", vec3_json(t.start));
    json_object_object_add(d.root, "goal", vec3_json(t.goal));
    json_object* obs = json_object_new_array();
    for (const auto& o : t.obstacles) {
        json_object* jo = json_object_new_object();
        json_object_object_add(jo, "center", vec3_json(o.center));
        json_object_object_add(jo, "half_extents", vec3_json(o.half_extents));
        json_object_array_add(obs, jo);
    }
    json_object_object_add(d.root, "obstacles", obs);
    json_object_object_add(d.root, "horizon", json_object_new_double(t.horizon));
    json_object_object_add(d.root, "sim_dt", json_object_new_double(t.sim_dt));
    json_object_object_add(d.root, "map_seed", json_object_new_int64((int64_t)t.map_seed));
    return json::to_string(d.root);
}

std::string task_from_json(const std::string& text, Task* out) {
    std::string err;
    json::Doc d = json::parse(text, 8 * 1024 * 1024, 8, &err);
    if (!d) return "task: " + err;

    Task t;
    if (!vec3_from(d.root, "start", &t.start)) return "task: bad start";
    if (!vec3_from(d.root, "goal", &t.goal)) return "task: bad goal";

    auto horizon = json::get_number(d.root, "horizon");
    auto dt = json::get_number(d.root, "sim_dt");
    if (!horizon || !std::isfinite(*horizon) || *horizon <= 0.0 || *horizon > 3600.0) return "task: bad horizon";
    if (!dt || !std::isfinite(*dt) || *dt <= 0.0 || *dt > 1.0) return "task: bad sim_dt";
    t.horizon = *horizon;
    t.sim_dt = *dt;
    if (auto seed = json::get_int(d.root, "map_seed")) t.map_seed = (uint64_t)*seed;

    json_object* obs = json::get_array(d.root, "obstacles");
    if (!obs) return "task: obstacles missing";
    const size_t n = json_object_array_length(obs);
    if (n > kMaxObstacles) return "task: too many obstacles";
    for (size_t i = 0; i < n; i++) {
        json_object* jo = json_object_array_get_idx(obs, i);
        Obstacle o;
        if (!vec3_from(jo, "center", &o.center) || !vec3_from(jo, "half_extents", &o.half_extents))
            return "task: bad obstacle " + std::to_string(i);
        t.obstacles.push_back(o);
    }
    if (out) *out = std::move(t);
    return "";
}

std::string plan_to_json(const ActionPlan& p) {
    json::Doc d(json_object_new_object());
    json_object* arr = json_object_new_array();
    for (const auto& c : p.commands) {
        json_object* jc = json_object_new_object();
        json_object_object_add(jc, "t", json_object_new_double(c.t));
        json_object_object_add(jc, "rpm", json::new_number_array({c.rpm[0], c.rpm[1], c.rpm[2], c.rpm[3]}));
        json_object_array_add(arr, jc);
    }
    json_object_object_add(d.root, "commands", arr);
    return json::to_string(d.root);
}

std::string plan_from_json(const std::string& text, ActionPlan* out) {
    std::string err;
    json::Doc d = json::parse(text, 64 * 1024 * 1024, 8, &err);
    if (!d) return "plan: " + err;
    json_object* arr = json::get_array(d.root, "commands");
    if (!arr) return "plan: commands missing";
    const size_t n = json_object_array_length(arr);
    if (n > kMaxCommands) return "plan: too many commands";

    ActionPlan p;
    p.commands.reserve(n);
    double last_t = -INFINITY;
    for (size_t i = 0; i < n; i++) {
        json_object* jc = json_object_array_get_idx(arr, i);
        auto t = json::get_number(jc, "t");
        auto rpm = json::get_number_array(jc, "rpm", 4);
        if (!t || !std::isfinite(*t) || *t < 0.0 || !rpm) return "plan: bad command " + std::to_string(i);
        if (*t < last_t) return "plan: commands not time-ordered";
        last_t = *t;
        p.commands.push_back(TimedCommand{*t, RotorCmd{(*rpm)[0], (*rpm)[1], (*rpm)[2], (*rpm)[3]}});
    }
    if (out) *out = std::move(p);
    return "";
}

} // namespace warden
