#pragma once

#include "warden/sandbox.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace warden {

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{0};          // CPU time seconds (0 = unlimited)
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{0};            // per-uid process count (0 = leave alone)

    bool no_new_privs{true};
    bool scrub_env{true};           // drop LD_PRELOAD / LD_LIBRARY_PATH
    std::vector<std::pair<std::string, std::string>> set_env;   // applied after scrubbing

    // seccomp-BPF allowlist (Linux only, requires no_new_privs).
    bool enable_seccomp{false};
    SeccompProfile seccomp_profile{SeccompProfile::EVAL};
};

struct ProcResult {
    int pid{-1};
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), capture stdout+stderr (merged),
// enforce timeout and rlimits. The child leads its own process group; on
// timeout the whole group is SIGKILLed and reaped before returning.
// Returns true if the process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res);

// Split a command string into argv tokens.
// Supports single/double quotes and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace warden
