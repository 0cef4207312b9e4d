#pragma once

// exec_host.h
//
// Execution-environment collaborator: create/run/inspect/kill/remove keyed
// by a unique name. Every environment has no network and fixed CPU, memory,
// process-count, fd and file-size ceilings. The shared directory is the only
// writable mount; the artifact is mounted read-only.

#include "warden/config.h"
#include "warden/proc.h"
#include "warden/sandbox.h"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// Paths as seen from inside an environment. Arguments refer to these;
// hosts that do not mount map them back to the host paths.
constexpr const char* kSharedMount = "/workspace/shared";
constexpr const char* kModelMount = "/workspace/model.zip";

struct EnvSpec {
    std::string name;
    std::string image;
    std::filesystem::path shared_dir;
    std::filesystem::path artifact_path;
    std::vector<std::string> args;    // arguments after the entrypoint
    ResourceCaps caps;
    bool seccomp{false};
    SeccompProfile seccomp_profile{SeccompProfile::EVAL};
    std::vector<std::pair<std::string, std::string>> env;   // set for the entrypoint
};

struct RunOutcome {
    int exit_code{-1};
    bool timed_out{false};
    std::string output;   // merged stdout+stderr, truncated
    std::string error;    // host-side failure (could not start, etc.)
};

class ExecHost {
public:
    virtual ~ExecHost() = default;

    virtual bool image_present(const std::string& image) = 0;
    // Synchronous. Empty string on success.
    virtual std::string build_image(const std::string& image) = 0;

    // Empty string on success.
    virtual std::string create(const EnvSpec& spec) = 0;
    // Blocks until the entrypoint exits or timeout_ms elapses. On timeout
    // the environment is killed before returning.
    virtual RunOutcome run(const std::string& name, int timeout_ms) = 0;
    // "created", "running", "exited"; nullopt if no such environment.
    virtual std::optional<std::string> inspect(const std::string& name) = 0;
    // Both idempotent: an unknown name is not an error.
    virtual std::string kill(const std::string& name) = 0;
    virtual std::string remove(const std::string& name) = 0;

    virtual std::vector<std::string> list(const std::string& prefix) = 0;
};

// Container runtime driven through the docker CLI. Every CLI call goes
// through proc_run_capture_sandboxed with its own timeout.
class DockerHost : public ExecHost {
public:
    DockerHost(std::string docker_bin, std::string dockerfile, std::string build_context);

    bool image_present(const std::string& image) override;
    std::string build_image(const std::string& image) override;
    std::string create(const EnvSpec& spec) override;
    RunOutcome run(const std::string& name, int timeout_ms) override;
    std::optional<std::string> inspect(const std::string& name) override;
    std::string kill(const std::string& name) override;
    std::string remove(const std::string& name) override;
    std::vector<std::string> list(const std::string& prefix) override;

    // The docker create argv for spec (exposed for inspection in tests).
    std::vector<std::string> create_argv(const EnvSpec& spec) const;

private:
    ProcResult docker(const std::vector<std::string>& args, int timeout_ms) const;

    std::string bin_;
    std::string dockerfile_;
    std::string context_;
};

// fork/exec of the evaluation binary under rlimits, a fresh process group,
// NO_NEW_PRIVS and (optionally) seccomp. The "image" is the program path.
// The pids cap is not enforced here: RLIMIT_NPROC counts every process of
// the real uid.
class LocalProcessHost : public ExecHost {
public:
    explicit LocalProcessHost(std::string program);

    bool image_present(const std::string& image) override;
    std::string build_image(const std::string& image) override;
    std::string create(const EnvSpec& spec) override;
    RunOutcome run(const std::string& name, int timeout_ms) override;
    std::optional<std::string> inspect(const std::string& name) override;
    std::string kill(const std::string& name) override;
    std::string remove(const std::string& name) override;
    std::vector<std::string> list(const std::string& prefix) override;

    // argv for spec with container paths mapped to host paths.
    std::vector<std::string> local_argv(const EnvSpec& spec) const;

private:
    struct Env {
        EnvSpec spec;
        std::string state;
    };

    std::string program_;
    std::mutex mu_;
    std::map<std::string, Env> envs_;
};

} // namespace warden
