#include "warden/sandbox.h"

const char* warden::seccomp_profile_name(SeccompProfile p) {
    return p == SeccompProfile::VERIFY ? "verify" : "eval";
}

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>

#if defined(__x86_64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define WARDEN_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define WARDEN_AUDIT_ARCH 0
#endif

#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace warden {

#if WARDEN_AUDIT_ARCH != 0

#if defined(__x86_64__)
static const unsigned int kBase[] = {
    0, 1, 2, 3, 4, 5, 6, 7, 8,   // read write open close stat fstat lstat poll lseek
    9, 10, 11, 12,               // mmap mprotect munmap brk
    13, 14, 15,                  // rt_sigaction rt_sigprocmask rt_sigreturn
    16, 17, 18, 19, 20, 21,      // ioctl pread64 pwrite64 readv writev access
    22, 23, 24, 25, 28,          // pipe select sched_yield mremap madvise
    32, 33, 35, 37, 39,          // dup dup2 nanosleep alarm getpid
    59, 60, 61, 62, 63,          // execve exit wait4 kill uname
    72, 73, 74, 75, 76, 77, 78,  // fcntl flock fsync fdatasync truncate ftruncate getdents
    79, 80, 81, 82, 83, 84, 85,  // getcwd chdir fchdir rename mkdir rmdir creat
    87, 89, 90, 91, 95, 96, 97,  // unlink readlink chmod fchmod umask gettimeofday getrlimit
    99, 100, 102, 104, 107, 108, // sysinfo times getuid getgid geteuid getegid
    110, 111, 131, 137, 138,     // getppid getpgrp sigaltstack statfs fstatfs
    157, 158, 202, 204, 217,     // prctl arch_prctl futex sched_getaffinity getdents64
    218, 228, 229, 230, 231,     // set_tid_address clock_* exit_group
    234, 257, 258, 262, 263,     // tgkill openat mkdirat newfstatat unlinkat
    264, 267, 269, 270, 271,     // renameat readlinkat faccessat pselect6 ppoll
    273, 292, 293, 302, 316,     // set_robust_list dup3 pipe2 prlimit64 renameat2
    318, 332, 334, 439,          // getrandom statx rseq faccessat2
};
static const unsigned int kSpawn[] = { 56, 57, 435 };   // clone fork clone3
static const unsigned int kMprotectNr = 10;
#elif defined(__aarch64__)
static const unsigned int kBase[] = {
    56, 57, 62, 63, 64, 65, 66, 67, 68,  // openat close lseek read write readv writev pread64 pwrite64
    25, 29, 32, 74, 79, 80,              // fcntl ioctl flock ftruncate fstatat fstat
    46, 53, 49, 50, 34, 35, 38, 78,      // fchmod fchmodat chdir fchdir mkdirat unlinkat renameat readlinkat
    52, 48, 23, 24, 59, 73, 72,          // faccessat faccessat2 dup dup3 pipe2 ppoll pselect6
    43, 44, 76,                          // statfs fstatfs truncate
    222, 226, 215, 214, 233, 225,        // mmap mprotect munmap brk madvise mremap
    134, 135, 139, 132,                  // rt_sigaction rt_sigprocmask rt_sigreturn sigaltstack
    93, 94, 260, 129, 131, 160,          // exit exit_group wait4 kill tgkill uname
    163, 261, 179, 153,                  // getrlimit prlimit64 sysinfo times
    174, 176, 175, 177, 172, 173,        // getuid getgid geteuid getegid getpid getppid
    221, 96, 99, 98,                     // execve set_tid_address set_robust_list futex
    113, 114, 115, 169, 278, 291,        // clock_* gettimeofday getrandom statx
    167, 39, 82, 83, 61, 17,             // prctl umask fsync fdatasync getdents64 getcwd
    101, 124, 123, 293,                  // nanosleep sched_yield sched_getaffinity rseq
};
static const unsigned int kSpawn[] = { 220, 435 };      // clone clone3
static const unsigned int kMprotectNr = 226;
#endif

static std::vector<unsigned int> allowlist_for(SeccompProfile profile) {
    std::vector<unsigned int> out(kBase, kBase + sizeof(kBase) / sizeof(kBase[0]));
    if (profile == SeccompProfile::EVAL) {
        out.insert(out.end(), kSpawn, kSpawn + sizeof(kSpawn) / sizeof(kSpawn[0]));
    }
    return out;
}

std::string install_seccomp_filter(SeccompProfile profile) {
    const std::vector<unsigned int> allow = allowlist_for(profile);
    const size_t n = allow.size();
    if (n + 5 > 255) return "seccomp: allowlist too long for 8-bit jumps";

    // Layout:
    //   [0]       load arch
    //   [1]       arch == native ? skip : fall through
    //   [2]       KILL
    //   [3]       load nr
    //   [4..4+n)  nr == allow[s] ? (mprotect ? MPROT : ALLOW) : next
    //   [4+n]     KILL (default deny)
    //   [4+n+1]   MPROT: load args[2]
    //   [4+n+2]   prot & PROT_EXEC ? KILL_EXEC : ALLOW_MPROT
    //   [4+n+3]   ALLOW_MPROT
    //   [4+n+4]   KILL_EXEC
    //   [4+n+5]   ALLOW
    std::vector<struct sock_filter> f;
    f.reserve(n + 10);

    f.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    f.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, WARDEN_AUDIT_ARCH, 1, 0));
    f.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n; s++) {
        const size_t jt = (allow[s] == kMprotectNr) ? (n - s) : (n + 4 - s);
        f.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, allow[s], jt, 0));
    }

    f.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS,
                            offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    f.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JSET | BPF_K, 0x4, 1, 0));
    f.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    f.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)f.size();
    prog.filter = f.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
}

#else

std::string install_seccomp_filter(SeccompProfile) {
    return "seccomp: unsupported architecture";
}

#endif

bool seccomp_available() {
    // 0: available and inactive, 2: filter already active, -1/EINVAL: absent
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace warden

#else // !__linux__

namespace warden {

std::string install_seccomp_filter(SeccompProfile) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace warden

#endif
