#include "warden/proc.h"
#include "warden/config.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace warden {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Child side between fork and exec. Only async-signal-safe calls plus the
// seccomp install, which does not allocate after the vector is built.
[[noreturn]] static void exec_child(const std::vector<std::string>& argv, const std::string& cwd,
                                    const ProcLimits& lim, int out_fd) {
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(out_fd, STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);

    // own process group so a timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

    if (lim.scrub_env) {
        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");
    }
    for (const auto& kv : lim.set_env) (void)setenv(kv.first.c_str(), kv.second.c_str(), 1);

#ifdef __linux__
    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    // a sandbox that failed to install must not run the payload
    if (lim.enable_seccomp && !install_seccomp_filter(lim.seccomp_profile).empty()) _exit(125);

    execvp(cargv[0], cargv.data());
    _exit(127);
}

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Optional operator-provided wrapper (nsjail/bwrap), prepended to argv.
    std::vector<std::string> eff_argv = argv;
    if (getenv_bool("WARDEN_PROC_WRAPPER_ENABLE", false)) {
        auto toks = split_argv_quoted(getenv_str("WARDEN_PROC_WRAPPER", ""));
        if (!toks.empty()) {
            toks.insert(toks.end(), eff_argv.begin(), eff_argv.end());
            eff_argv.swap(toks);
        }
    }

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        close(pipefd[0]);
        exec_child(eff_argv, cwd, lim, pipefd[1]);
    }

    (void)setpgid(pid, pid);
    close(pipefd[1]);
    res->pid = (int)pid;

    auto start = std::chrono::steady_clock::now();
    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) {
                size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
                size_t take = std::min(can, (size_t)n);
                if (take < (size_t)n) res->output_truncated = true;
                out.append(buf, buf + take);
                continue;
            }
            if (n == -1 && errno == EINTR) continue;
            break; // EAGAIN, EOF or error
        }
    };

    int status = 0;
    while (true) {
        drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        (void)poll(&pfd, 1, slice);
    }

    // grandchildren may still hold the group; never leave them behind
    (void)kill(-pid, SIGKILL);

    drain();
    close(pipefd[0]);
    res->output = std::move(out);

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace warden
