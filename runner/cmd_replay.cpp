#include "cmd_replay.h"
#include "runner_utils.h"

#include "warden/aggregate.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"
#include "warden/replay.h"
#include "warden/task.h"

#include <cstdlib>
#include <iostream>

using namespace warden;

int cmd_task(int argc, char** argv) {
    auto pos = positionals(argc, argv, {});
    auto seed = pos.empty() ? std::nullopt : parse_u64(pos[0]);
    if (!seed) {
        std::cerr << "usage: warden_cli task <seed> [out.json]\n";
        return 2;
    }
    ValidatorConfig cfg = ValidatorConfig::from_env();
    TaskGenConfig tg;
    tg.horizon = cfg.horizon_sec;
    tg.sim_dt = cfg.sim_dt;
    const std::string body = task_to_json(random_task(*seed, tg));
    if (pos.size() >= 2) {
        std::string err = write_atomic(pos[1], body + "\n");
        if (!err.empty()) {
            std::cerr << err << "\n";
            return 1;
        }
        return 0;
    }
    std::cout << body << "\n";
    return 0;
}

// Re-simulate a recorded plan and print the outcome and its reward.
int cmd_replay(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: warden_cli replay <task.json> <plan.json>\n";
        return 2;
    }
    std::string task_text, plan_text;
    std::string err = read_file_bounded(argv[2], 16 * 1024 * 1024, &task_text);
    if (err.empty()) err = read_file_bounded(argv[3], 64 * 1024 * 1024, &plan_text);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 1;
    }
    Task task;
    ActionPlan plan;
    err = task_from_json(task_text, &task);
    if (!err.empty()) {
        std::cerr << "task: " << err << "\n";
        return 1;
    }
    err = plan_from_json(plan_text, &plan);
    if (!err.empty()) {
        std::cerr << "plan: " << err << "\n";
        return 1;
    }

    const ReplayOutcome out = replay(task, plan);
    const double score = reward(out.success, out.time_sec, out.energy, task.horizon);

    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "success", json_object_new_boolean(out.success));
    json_object_object_add(d.root, "collided", json_object_new_boolean(out.collided));
    json_object_object_add(d.root, "t", json_object_new_double(out.time_sec));
    json_object_object_add(d.root, "e", json_object_new_double(out.energy));
    json_object_object_add(d.root, "steps", json_object_new_int64(out.steps));
    json_object_object_add(d.root, "score", json_object_new_double(score));
    std::cout << json::to_string(d.root) << "\n";
    return 0;
}

// warden_cli boost <uid>=<score> ... [--beta B] [--no-burn] [--burn-uid U] [--burn-fraction F]
int cmd_boost(int argc, char** argv) {
    ValidatorConfig cfg = ValidatorConfig::from_env();
    double beta = cfg.beta;
    BurnConfig burn;
    burn.enabled = cfg.burn_enabled && !has_flag(argc, argv, "--no-burn");
    burn.reserved_uid = cfg.burn_uid;
    burn.fraction = cfg.burn_fraction;

    if (auto s = flag_value(argc, argv, "--beta")) beta = std::strtod(s->c_str(), nullptr);
    if (auto s = flag_value(argc, argv, "--burn-uid")) {
        auto v = parse_i64(*s);
        if (v) burn.reserved_uid = *v;
    }
    if (auto s = flag_value(argc, argv, "--burn-fraction")) burn.fraction = std::strtod(s->c_str(), nullptr);

    std::vector<EvaluationResult> results;
    for (const auto& a : positionals(argc, argv, {"--beta", "--burn-uid", "--burn-fraction"})) {
        const auto eq = a.find('=');
        auto uid = eq == std::string::npos ? std::nullopt : parse_i64(a.substr(0, eq));
        char* end = nullptr;
        const double score = eq == std::string::npos ? 0.0 : std::strtod(a.c_str() + eq + 1, &end);
        if (!uid || !end || *end != '\0') {
            std::cerr << "bad score '" << a << "', expected <uid>=<score>\n";
            return 2;
        }
        EvaluationResult r = EvaluationResult::zero(*uid);
        r.score = score;
        results.push_back(r);
    }
    if (results.empty()) {
        std::cerr << "usage: warden_cli boost <uid>=<score> ... [--beta B] [--no-burn] [--burn-uid U] "
                     "[--burn-fraction F]\n";
        return 2;
    }
    std::cout << weights_to_json(aggregate(results, beta, burn)) << "\n";
    return 0;
}
