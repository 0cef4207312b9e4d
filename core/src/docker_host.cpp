#include "warden/exec_host.h"

#include <cctype>
#include <iostream>
#include <sstream>

namespace warden {

static constexpr int kDockerCliTimeoutMs = 60 * 1000;
static constexpr int kDockerBuildTimeoutMs = 30 * 60 * 1000;

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

DockerHost::DockerHost(std::string docker_bin, std::string dockerfile, std::string build_context)
    : bin_(std::move(docker_bin)), dockerfile_(std::move(dockerfile)), context_(std::move(build_context)) {}

ProcResult DockerHost::docker(const std::vector<std::string>& args, int timeout_ms) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(bin_);
    argv.insert(argv.end(), args.begin(), args.end());

    // The CLI itself is trusted; only the container is capped.
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = 256 * 1024;
    lim.rlimit_as_mb = 0;
    lim.rlimit_fsize_mb = 0;
    lim.rlimit_nofile = 1024;
    lim.scrub_env = false;

    ProcResult r;
    if (!proc_run_capture_sandboxed(argv, "", lim, &r) && r.error.empty()) r.error = "docker did not start";
    return r;
}

bool DockerHost::image_present(const std::string& image) {
    ProcResult r = docker({"image", "inspect", "--format", "{{.Id}}", image}, kDockerCliTimeoutMs);
    return r.error.empty() && !r.timed_out && r.exit_code == 0;
}

std::string DockerHost::build_image(const std::string& image) {
    std::cerr << "[orchestrator] building image " << image << " from " << dockerfile_ << "\n";
    ProcResult r = docker({"build", "-t", image, "-f", dockerfile_, context_}, kDockerBuildTimeoutMs);
    if (!r.error.empty()) return r.error;
    if (r.timed_out) return "docker build timed out";
    if (r.exit_code != 0) return "docker build exit " + std::to_string(r.exit_code) + ": " + r.output;
    return "";
}

std::vector<std::string> DockerHost::create_argv(const EnvSpec& spec) const {
    const ResourceCaps& c = spec.caps;
    std::ostringstream cpus;
    cpus << c.cpus;

    std::vector<std::string> a = {
        "create",
        "--name", spec.name,
        "--network", "none",
        "--memory", std::to_string(c.memory_mb) + "m",
        "--memory-swap", std::to_string(c.memory_mb) + "m",
        "--cpus", cpus.str(),
        "--pids-limit", std::to_string(c.pids),
        "--ulimit", "nofile=" + std::to_string(c.nofile) + ":" + std::to_string(c.nofile),
        "--ulimit", "fsize=" + std::to_string(c.fsize_bytes) + ":" + std::to_string(c.fsize_bytes),
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m",
        "--user", "1000:1000",
        "-v", spec.shared_dir.string() + ":" + kSharedMount + ":rw",
        "-v", spec.artifact_path.string() + ":" + kModelMount + ":ro",
        "--env", std::string("WARDEN_EVALHOST_SECCOMP=") + (spec.seccomp ? "1" : "0"),
        "--env", std::string("WARDEN_SECCOMP_PROFILE=") + seccomp_profile_name(spec.seccomp_profile),
    };
    for (const auto& kv : spec.env) {
        a.push_back("--env");
        a.push_back(kv.first + "=" + kv.second);
    }
    a.push_back(spec.image);
    a.insert(a.end(), spec.args.begin(), spec.args.end());
    return a;
}

std::string DockerHost::create(const EnvSpec& spec) {
    ProcResult r = docker(create_argv(spec), kDockerCliTimeoutMs);
    if (!r.error.empty()) return r.error;
    if (r.timed_out) return "docker create timed out";
    if (r.exit_code != 0) return "docker create exit " + std::to_string(r.exit_code) + ": " + trim(r.output);
    return "";
}

RunOutcome DockerHost::run(const std::string& name, int timeout_ms) {
    RunOutcome out;
    ProcResult r = docker({"start", "-a", name}, timeout_ms);
    out.output = r.output;
    out.error = r.error;
    out.timed_out = r.timed_out;
    out.exit_code = r.exit_code;
    // detaching the CLI does not stop the container
    if (r.timed_out) (void)kill(name);
    return out;
}

std::optional<std::string> DockerHost::inspect(const std::string& name) {
    ProcResult r = docker({"inspect", "-f", "{{.State.Status}}", name}, kDockerCliTimeoutMs);
    if (!r.error.empty() || r.timed_out || r.exit_code != 0) return std::nullopt;
    return trim(r.output);
}

std::string DockerHost::kill(const std::string& name) {
    ProcResult r = docker({"kill", name}, kDockerCliTimeoutMs);
    if (!r.error.empty()) return r.error;
    // non-zero for an unknown or already stopped container: nothing to do
    return "";
}

std::string DockerHost::remove(const std::string& name) {
    ProcResult r = docker({"rm", "-f", name}, kDockerCliTimeoutMs);
    if (!r.error.empty()) return r.error;
    if (r.timed_out) return "docker rm timed out";
    if (r.exit_code != 0 && inspect(name)) return "docker rm exit " + std::to_string(r.exit_code);
    return "";
}

std::vector<std::string> DockerHost::list(const std::string& prefix) {
    std::vector<std::string> names;
    ProcResult r = docker({"ps", "-a", "--filter", "name=" + prefix, "--format", "{{.Names}}"}, kDockerCliTimeoutMs);
    if (!r.error.empty() || r.timed_out || r.exit_code != 0) {
        std::cerr << "[warn] docker ps failed: " << (r.error.empty() ? trim(r.output) : r.error) << "\n";
        return names;
    }
    std::istringstream in(r.output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        // the name filter is a substring match
        if (!line.empty() && line.compare(0, prefix.size(), prefix) == 0) names.push_back(line);
    }
    return names;
}

} // namespace warden
