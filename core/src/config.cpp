#include "warden/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace warden {

Profile detect_profile() {
    const char* env = std::getenv("WARDEN_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any fetch threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("WARDEN_HOST",              "local", NO_OVERWRITE);
            setenv("WARDEN_SECCOMP_ENABLE",    "0",     NO_OVERWRITE);
            setenv("WARDEN_EVAL_TIMEOUT_SEC",  "120",   NO_OVERWRITE);
            setenv("WARDEN_PACING_SEC",        "5",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("WARDEN_HOST",              "docker", NO_OVERWRITE);
            setenv("WARDEN_SECCOMP_ENABLE",    "1",      NO_OVERWRITE);
            setenv("WARDEN_EVAL_TIMEOUT_SEC",  "120",    NO_OVERWRITE);
            setenv("WARDEN_VERIFY_TIMEOUT_SEC","60",     NO_OVERWRITE);
            setenv("WARDEN_PACING_SEC",        "3600",   NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    char* end = nullptr;
    long long x = std::strtoll(v, &end, 10);
    if (!end || *end != '\0') return defv;
    return static_cast<int64_t>(x);
}

double getenv_f64(const char* key, double defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    char* end = nullptr;
    double x = std::strtod(v, &end);
    if (!end || *end != '\0') return defv;
    return x;
}

bool getenv_bool(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return v;
}

std::vector<std::pair<std::string, std::string>> evalhost_env() {
    static const char* const kKeys[] = {
        "WARDEN_MAX_ENTRY_BYTES",
        "WARDEN_STABLE_LANDING_SEC",
        "WARDEN_LANDING_RADIUS",
        "WARDEN_LANDING_HEIGHT_TOL",
        "WARDEN_ENERGY_BUDGET",
    };
    std::vector<std::pair<std::string, std::string>> out;
    for (const char* k : kKeys) {
        const char* v = std::getenv(k);
        if (v && *v) out.emplace_back(k, v);
    }
    return out;
}

ValidatorConfig ValidatorConfig::from_env() {
    ValidatorConfig c;
    c.state_dir = getenv_str("WARDEN_STATE_DIR", c.state_dir);
    c.cache_dir = getenv_str("WARDEN_CACHE_DIR", c.state_dir + "/models");
    c.drop_dir = getenv_str("WARDEN_DROP_DIR", c.drop_dir);

    c.max_artifact_bytes = getenv_i64("WARDEN_MAX_ARTIFACT_BYTES", c.max_artifact_bytes);
    c.max_entry_bytes = getenv_i64("WARDEN_MAX_ENTRY_BYTES", c.max_artifact_bytes);
    c.max_uncompressed_bytes = getenv_i64("WARDEN_MAX_UNCOMPRESSED_BYTES", c.max_uncompressed_bytes);

    c.host_kind = getenv_str("WARDEN_HOST", c.host_kind);
    c.base_image = getenv_str("WARDEN_BASE_IMAGE", c.base_image);
    c.dockerfile = getenv_str("WARDEN_DOCKERFILE", c.dockerfile);
    c.build_context = getenv_str("WARDEN_BUILD_CONTEXT", c.build_context);
    c.evalhost_path = getenv_str("WARDEN_EVALHOST", c.evalhost_path);
    c.seccomp = getenv_bool("WARDEN_SECCOMP_ENABLE", c.seccomp);

    c.eval_caps.memory_mb = getenv_i64("WARDEN_EVAL_MEMORY_MB", c.eval_caps.memory_mb);
    c.eval_caps.cpus = getenv_f64("WARDEN_EVAL_CPUS", c.eval_caps.cpus);
    c.eval_caps.pids = (int)getenv_i64("WARDEN_EVAL_PIDS", c.eval_caps.pids);
    c.eval_caps.timeout_sec = (int)getenv_i64("WARDEN_EVAL_TIMEOUT_SEC", c.eval_caps.timeout_sec);
    c.eval_caps.grace_sec = (int)getenv_i64("WARDEN_EVAL_GRACE_SEC", c.eval_caps.grace_sec);

    c.verify_caps.memory_mb = getenv_i64("WARDEN_VERIFY_MEMORY_MB", c.verify_caps.memory_mb);
    c.verify_caps.timeout_sec = (int)getenv_i64("WARDEN_VERIFY_TIMEOUT_SEC", c.verify_caps.timeout_sec);

    c.fetch_batch = std::max(1, (int)getenv_i64("WARDEN_FETCH_BATCH", c.fetch_batch));
    c.beta = getenv_f64("WARDEN_BETA", c.beta);
    c.burn_enabled = getenv_bool("WARDEN_BURN", c.burn_enabled);
    c.burn_uid = getenv_i64("WARDEN_BURN_UID", c.burn_uid);
    c.burn_fraction = std::clamp(getenv_f64("WARDEN_BURN_FRACTION", c.burn_fraction), 0.0, 1.0);
    c.ema_alpha = std::clamp(getenv_f64("WARDEN_EMA_ALPHA", c.ema_alpha), 0.0, 1.0);

    c.sim_dt = getenv_f64("WARDEN_SIM_DT", c.sim_dt);
    if (!(c.sim_dt > 0.0)) c.sim_dt = 1.0 / 50.0;
    c.horizon_sec = getenv_f64("WARDEN_HORIZON_SEC", c.horizon_sec);
    c.pacing_sec = (int)getenv_i64("WARDEN_PACING_SEC", c.pacing_sec);
    return c;
}

} // namespace warden
