#include "test_common.h"

#include "warden/proc.h"
#include "warden/sandbox.h"

#include <chrono>
#include <filesystem>

#ifdef __linux__
#include <csignal>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace warden;

int main() {
    namespace fs = std::filesystem;

    // argv splitting
    {
        auto v = split_argv_quoted("docker run 'a b' \"c \\\"d\\\"\"  e");
        expect_eq_ll((long long)v.size(), 5, "token count");
        expect_true(v[2] == "a b", "single quotes group");
        expect_true(v[3] == "c \"d\"", "escapes inside double quotes");
        expect_true(split_argv_quoted("unterminated 'quote").empty(), "unterminated quote is an error");
    }

    // capture, exit code, cwd
    {
        fs::path dir = fs::temp_directory_path() / "warden_test_proc";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);

        ProcLimits lim;
        ProcResult r;
        bool started = proc_run_capture_sandboxed({"/bin/sh", "-c", "echo out; echo err 1>&2; pwd; exit 3"},
                                                  dir.string(), lim, &r);
        expect_true(started, "process starts: " + r.error);
        expect_eq_ll(r.exit_code, 3, "exit code captured");
        expect_true(!r.timed_out, "no timeout");
        expect_true(r.output.find("out") != std::string::npos && r.output.find("err") != std::string::npos,
                    "stdout and stderr merged");
        expect_true(r.output.find("warden_test_proc") != std::string::npos, "runs in the requested cwd");
        fs::remove_all(dir, ec);
    }

    // timeout kills the whole group, including background children
    {
        ProcLimits lim;
        lim.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(proc_run_capture_sandboxed({"/bin/sh", "-c", "sleep 30 & sleep 30"}, "", lim, &r), "sleeper starts");
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "timeout reported");
        expect_true(ms < 5000, "timeout enforced promptly");
        expect_true(r.exit_code >= 128, "killed by signal");
    }

    // output cap
    {
        ProcLimits lim;
        lim.stdout_max_bytes = 100;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed({"/bin/sh", "-c", "i=0; while [ $i -lt 200 ]; do echo xxxxxxxx; i=$((i+1)); done"},
                                               "", lim, &r),
                    "chatty process starts");
        expect_true(r.output_truncated, "truncation flagged");
        expect_eq_ll((long long)r.output.size(), 100, "output capped");
    }

    // missing binary and empty argv
    {
        ProcLimits lim;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed({"/nonexistent/warden_binary"}, "", lim, &r), "fork still happens");
        expect_eq_ll(r.exit_code, 127, "exec failure is 127");
        expect_true(!proc_run_capture_sandboxed({}, "", lim, &r), "empty argv refused");
        expect_true(!r.error.empty(), "empty argv explained");
    }

    // file size limit
    {
        fs::path dir = fs::temp_directory_path() / "warden_test_proc_fsize";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);
        ProcLimits lim;
        lim.rlimit_fsize_mb = 1;
        ProcResult r;
        expect_true(proc_run_capture_sandboxed({"/bin/sh", "-c", "head -c 3000000 /dev/zero > big"}, dir.string(), lim, &r),
                    "writer starts");
        expect_true(r.exit_code != 0, "write past RLIMIT_FSIZE fails");
        expect_true(fs::file_size(dir / "big", ec) <= 1024 * 1024, "file stops at the limit");
        fs::remove_all(dir, ec);
    }

    expect_true(std::string(seccomp_profile_name(SeccompProfile::VERIFY)) == "verify", "profile name");

#ifdef __linux__
    expect_true(seccomp_available(), "seccomp should be available on Linux");

    // allowed syscalls keep working under the filter
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = install_seccomp_filter(SeccompProfile::EVAL);
            if (!err.empty()) _exit(1);
            const char* msg = "seccomp_ok\n";
            ssize_t n = write(STDOUT_FILENO, msg, 11);
            _exit(n > 0 ? 0 : 2);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0, "child with seccomp should exit cleanly after write()");
    }

    // the network is never reachable from a sandboxed child
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = install_seccomp_filter(SeccompProfile::VERIFY);
            if (!err.empty()) _exit(1);
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            _exit(fd >= 0 ? 3 : 4);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS, "socket() kills a sandboxed child");
    }
#endif

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
