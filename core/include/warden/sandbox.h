#pragma once

// Warden sandbox: seccomp-BPF syscall allowlist for evaluation children.
//
// Allowlist-only. Any syscall not on the list kills the process (SIGSYS).
// Enabled with ProcLimits.enable_seccomp or WARDEN_SECCOMP_ENABLE=1.
// Supports x86_64 and aarch64.
//
// No profile admits socket syscalls: evaluation and verification never
// touch the network. mprotect with PROT_EXEC is refused in every profile.

#include <string>

namespace warden {

enum class SeccompProfile {
    EVAL,    // policy episode: file I/O, memory, clone for runtime threads
    VERIFY,  // inspection only: EVAL minus fork/clone
};

const char* seccomp_profile_name(SeccompProfile p);

// Install the filter on the calling process. Must run after
// prctl(PR_SET_NO_NEW_PRIVS, 1). execve stays allowed so the filter can be
// installed between fork and exec.
// Returns empty string on success, error message on failure.
// On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter(SeccompProfile profile);

bool seccomp_available();

} // namespace warden
