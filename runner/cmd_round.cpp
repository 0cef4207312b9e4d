#include "cmd_round.h"
#include "runner_utils.h"

#include "warden/crypto.h"
#include "warden/json_util.h"
#include "warden/log.h"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace warden;

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop.store(true);
}

static void print_summary(const RoundSummary& s) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "round_id", json_object_new_string(s.round_id.c_str()));
    json_object_object_add(d.root, "seed", json_object_new_int64((int64_t)s.seed));
    json_object* res = json_object_new_array();
    for (const auto& r : s.results) {
        json::Doc one = json::parse(result_to_json(r));
        if (one) json_object_array_add(res, one.release());
    }
    json_object_object_add(d.root, "results", res);
    json::Doc w = json::parse(weights_to_json(s.published));
    json_object_object_add(d.root, "published", w ? w.release() : json_object_new_object());
    json_object_object_add(d.root, "log", json_object_new_string(s.log_path.c_str()));
    json_object_object_add(d.root, "error", json_object_new_string(s.error.c_str()));
    std::cout << json::to_string(d.root) << "\n";
}

int cmd_round(int argc, char** argv) {
    ValidatorConfig cfg = ValidatorConfig::from_env();
    uint64_t seed = secure_rand64();
    if (auto s = flag_value(argc, argv, "--seed")) {
        auto v = parse_u64(*s);
        if (!v) {
            std::cerr << "usage: warden_cli round [--seed N]\n";
            return 2;
        }
        seed = *v;
    }

    ValidatorStack stack(cfg);
    std::string err = stack.load();
    if (!err.empty()) {
        std::cerr << "[round] " << err << "\n";
        return 1;
    }
    RoundSummary s = stack.round.run_round(seed, RoundCoordinator::new_round_id());
    print_summary(s);

    err = verify_chain(s.log_path);
    if (!err.empty()) {
        std::cerr << "[round] audit chain broken: " << err << "\n";
        return 1;
    }
    return s.error.empty() ? 0 : 1;
}

int cmd_serve(int argc, char** argv) {
    ValidatorConfig cfg = ValidatorConfig::from_env();
    int max_rounds = 0;
    if (auto s = flag_value(argc, argv, "--rounds")) {
        auto v = parse_i64(*s);
        if (!v || *v < 0) {
            std::cerr << "usage: warden_cli serve [--rounds N]\n";
            return 2;
        }
        max_rounds = (int)*v;
    }

    ::signal(SIGPIPE, SIG_IGN);
    ::signal(SIGINT, on_signal);
    ::signal(SIGTERM, on_signal);

    ValidatorStack stack(cfg);
    std::string err = stack.load();
    if (!err.empty()) {
        std::cerr << "[round] " << err << "\n";
        return 1;
    }

    // build the base image before the first round instead of inside it
    err = stack.env.ensure_ready();
    if (!err.empty()) std::cerr << "[warn] " << err << " (retried before each evaluation)\n";

    std::cerr << "[round] serving: profile=" << profile_name(detect_profile()) << " host=" << cfg.host_kind
              << " pacing=" << cfg.pacing_sec << "s\n";
    int n = stack.round.serve(max_rounds, &g_stop);
    std::cerr << "[round] stopped after " << n << " rounds\n";
    return 0;
}
