#include "test_common.h"
#include "warden/config.h"
#include <cstdlib>

int main() {
    // Default profile is DEV
    unsetenv("WARDEN_PROFILE");
    auto p = warden::detect_profile();
    expect_true(p == warden::Profile::DEV, "default should be DEV");

    setenv("WARDEN_PROFILE", "PROD", 1);
    p = warden::detect_profile();
    expect_true(p == warden::Profile::PROD, "should detect PROD case-insensitive");

    // Apply defaults (won't override existing)
    setenv("WARDEN_HOST", "local", 1);
    unsetenv("WARDEN_SECCOMP_ENABLE");
    unsetenv("WARDEN_PACING_SEC");
    warden::apply_profile_defaults(warden::Profile::PROD);
    expect_true(warden::getenv_str("WARDEN_HOST", "") == "local", "should NOT override pre-existing env var");
    expect_true(warden::getenv_bool("WARDEN_SECCOMP_ENABLE", false), "PROD should enable seccomp");
    expect_eq_ll(warden::getenv_i64("WARDEN_PACING_SEC", 0), 3600, "PROD pacing");

    expect_true(std::string(warden::profile_name(warden::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(warden::profile_name(warden::Profile::PROD)) == "prod", "prod name");

    // typed getters fall back on garbage
    setenv("WARDEN_TEST_NUM", "12x", 1);
    expect_eq_ll(warden::getenv_i64("WARDEN_TEST_NUM", 7), 7, "bad integer falls back");
    setenv("WARDEN_TEST_NUM", "0.25", 1);
    expect_near(warden::getenv_f64("WARDEN_TEST_NUM", 1.0), 0.25, 0.0, "double parses");
    setenv("WARDEN_TEST_NUM", "maybe", 1);
    expect_true(warden::getenv_bool("WARDEN_TEST_NUM", true), "bad bool falls back");

    // from_env
    setenv("WARDEN_STATE_DIR", "/tmp/warden_cfg_state", 1);
    unsetenv("WARDEN_CACHE_DIR");
    setenv("WARDEN_BURN_FRACTION", "1.5", 1);
    setenv("WARDEN_FETCH_BATCH", "0", 1);
    setenv("WARDEN_SIM_DT", "-1", 1);
    setenv("WARDEN_EVAL_TIMEOUT_SEC", "30", 1);
    warden::ValidatorConfig c = warden::ValidatorConfig::from_env();
    expect_true(c.cache_dir == "/tmp/warden_cfg_state/models", "cache dir follows state dir");
    expect_near(c.burn_fraction, 1.0, 0.0, "burn fraction clamped");
    expect_eq_ll(c.fetch_batch, 1, "fetch batch at least 1");
    expect_near(c.sim_dt, 1.0 / 50.0, 1e-15, "non-positive dt falls back");
    expect_eq_ll(c.eval_caps.timeout_sec, 30, "eval timeout from env");
    expect_eq_ll(c.verify_caps.pids, 10, "verify caps keep their defaults");

    // archive caps are independent
    setenv("WARDEN_MAX_ENTRY_BYTES", "1000", 1);
    setenv("WARDEN_MAX_UNCOMPRESSED_BYTES", "5000", 1);
    c = warden::ValidatorConfig::from_env();
    expect_eq_ll(c.max_entry_bytes, 1000, "per-entry cap from env");
    expect_eq_ll(c.max_uncompressed_bytes, 5000, "total uncompressed cap from env");
    unsetenv("WARDEN_MAX_UNCOMPRESSED_BYTES");
    c = warden::ValidatorConfig::from_env();
    expect_eq_ll(c.max_uncompressed_bytes, 50LL * 1024 * 1024, "total cap does not follow the entry cap");

    // evaluation-binary tunables forwarded only when set
    unsetenv("WARDEN_STABLE_LANDING_SEC");
    unsetenv("WARDEN_LANDING_HEIGHT_TOL");
    unsetenv("WARDEN_ENERGY_BUDGET");
    setenv("WARDEN_LANDING_RADIUS", "0.25", 1);
    setenv("WARDEN_ENERGY_BUDGET", "", 1);
    auto fwd = warden::evalhost_env();
    expect_eq_ll((long long)fwd.size(), 2, "only set tunables forwarded");
    expect_true(fwd[0].first == "WARDEN_MAX_ENTRY_BYTES" && fwd[0].second == "1000", "entry cap forwarded");
    expect_true(fwd[1].first == "WARDEN_LANDING_RADIUS" && fwd[1].second == "0.25", "landing radius forwarded");
    unsetenv("WARDEN_MAX_ENTRY_BYTES");
    unsetenv("WARDEN_LANDING_RADIUS");
    unsetenv("WARDEN_ENERGY_BUDGET");

    unsetenv("WARDEN_PROFILE");
    unsetenv("WARDEN_HOST");
    unsetenv("WARDEN_SECCOMP_ENABLE");
    unsetenv("WARDEN_PACING_SEC");
    unsetenv("WARDEN_EVAL_TIMEOUT_SEC");
    unsetenv("WARDEN_VERIFY_TIMEOUT_SEC");
    unsetenv("WARDEN_TEST_NUM");
    unsetenv("WARDEN_STATE_DIR");
    unsetenv("WARDEN_BURN_FRACTION");
    unsetenv("WARDEN_FETCH_BATCH");
    unsetenv("WARDEN_SIM_DT");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
