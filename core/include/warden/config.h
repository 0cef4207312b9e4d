#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace warden {

enum class Profile { DEV, PROD };

// Detect profile from WARDEN_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: local process host, seccomp off, short pacing
// PROD: docker host, seccomp on, hour-long pacing
void apply_profile_defaults(Profile p);

int64_t getenv_i64(const char* key, int64_t defv);
double getenv_f64(const char* key, double defv);
bool getenv_bool(const char* key, bool defv);
std::string getenv_str(const char* key, const std::string& defv);

// Replay/reward tunables read by the evaluation binary. Returns the ones set
// in this process as (key, value) pairs so a host that does not inherit the
// validator environment (docker) can forward them.
std::vector<std::pair<std::string, std::string>> evalhost_env();

// Resource ceiling for one sandboxed environment.
struct ResourceCaps {
    int64_t memory_mb{6144};
    double cpus{2.0};
    int pids{20};
    int nofile{64};
    int64_t fsize_bytes{500LL * 1024 * 1024};
    int timeout_sec{120};
    int grace_sec{10};
};

struct ValidatorConfig {
    std::string state_dir{"warden_state"};
    std::string cache_dir{"warden_state/models"};
    std::string drop_dir{"submissions"};        // DirectoryTransport root

    int64_t max_artifact_bytes{50LL * 1024 * 1024};
    int64_t max_entry_bytes{50LL * 1024 * 1024};
    int64_t max_uncompressed_bytes{50LL * 1024 * 1024};   // sum over one archive's entries

    std::string host_kind{"local"};             // "docker" | "local"
    std::string base_image{"warden_evaluator_base:latest"};
    std::string dockerfile{"evalhost/Dockerfile"};
    std::string build_context{"."};
    std::string evalhost_path{"warden_evalhost"};
    bool seccomp{false};

    ResourceCaps eval_caps;
    ResourceCaps verify_caps{4096, 1.0, 10, 32, 250LL * 1024 * 1024, 60, 0};

    int fetch_batch{8};
    double beta{5.0};
    bool burn_enabled{true};
    int64_t burn_uid{0};
    double burn_fraction{0.90};
    double ema_alpha{0.20};

    double sim_dt{1.0 / 50.0};
    double horizon_sec{30.0};
    int pacing_sec{300};

    static ValidatorConfig from_env();
};

} // namespace warden
