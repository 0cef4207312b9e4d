#include "warden/exec_host.h"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace warden {

static bool executable_on_path(const std::string& prog) {
    if (prog.empty()) return false;
    if (prog.find('/') != std::string::npos) return access(prog.c_str(), X_OK) == 0;
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::istringstream in(path);
    std::string dir;
    while (std::getline(in, dir, ':')) {
        if (dir.empty()) continue;
        const std::string cand = dir + "/" + prog;
        if (access(cand.c_str(), X_OK) == 0) return true;
    }
    return false;
}

static std::string map_path(const std::string& arg, const std::string& mount, const std::filesystem::path& host) {
    if (arg == mount) return host.string();
    if (arg.size() > mount.size() && arg.compare(0, mount.size(), mount) == 0 && arg[mount.size()] == '/') {
        return (host / arg.substr(mount.size() + 1)).string();
    }
    return arg;
}

LocalProcessHost::LocalProcessHost(std::string program) : program_(std::move(program)) {}

bool LocalProcessHost::image_present(const std::string& image) {
    return executable_on_path(image.empty() ? program_ : image);
}

std::string LocalProcessHost::build_image(const std::string& image) {
    const std::string prog = image.empty() ? program_ : image;
    if (executable_on_path(prog)) return "";
    return "evaluation binary not found: " + prog;
}

std::vector<std::string> LocalProcessHost::local_argv(const EnvSpec& spec) const {
    std::vector<std::string> argv;
    argv.push_back(spec.image.empty() ? program_ : spec.image);
    for (const auto& a : spec.args) {
        std::string m = map_path(a, kSharedMount, spec.shared_dir);
        m = map_path(m, kModelMount, spec.artifact_path);
        argv.push_back(m);
    }
    return argv;
}

std::string LocalProcessHost::create(const EnvSpec& spec) {
    if (spec.name.empty()) return "environment name is empty";
    std::lock_guard<std::mutex> lk(mu_);
    if (envs_.count(spec.name)) return "environment exists: " + spec.name;
    envs_[spec.name] = Env{spec, "created"};
    return "";
}

RunOutcome LocalProcessHost::run(const std::string& name, int timeout_ms) {
    RunOutcome out;
    EnvSpec spec;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = envs_.find(name);
        if (it == envs_.end()) {
            out.error = "no such environment: " + name;
            return out;
        }
        if (it->second.state != "created") {
            out.error = "environment not runnable: " + it->second.state;
            return out;
        }
        it->second.state = "running";
        spec = it->second.spec;
    }

    const ResourceCaps& c = spec.caps;
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = 64 * 1024;
    lim.rlimit_cpu_sec = std::max(1, c.timeout_sec + c.grace_sec);
    lim.rlimit_as_mb = (size_t)std::max<int64_t>(0, c.memory_mb);
    lim.rlimit_fsize_mb = (size_t)std::max<int64_t>(1, c.fsize_bytes / (1024 * 1024));
    lim.rlimit_nofile = c.nofile;
    lim.enable_seccomp = spec.seccomp;
    lim.seccomp_profile = spec.seccomp_profile;
    lim.set_env = spec.env;

    ProcResult r;
    (void)proc_run_capture_sandboxed(local_argv(spec), spec.shared_dir.string(), lim, &r);
    out.exit_code = r.exit_code;
    out.timed_out = r.timed_out;
    out.output = std::move(r.output);
    out.error = std::move(r.error);

    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(name);
    if (it != envs_.end()) it->second.state = "exited";
    return out;
}

std::optional<std::string> LocalProcessHost::inspect(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(name);
    if (it == envs_.end()) return std::nullopt;
    return it->second.state;
}

// The process group is already gone when run() returns: the runner kills
// and reaps it on every path.
std::string LocalProcessHost::kill(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = envs_.find(name);
    if (it != envs_.end() && it->second.state == "created") it->second.state = "exited";
    return "";
}

std::string LocalProcessHost::remove(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    envs_.erase(name);
    return "";
}

std::vector<std::string> LocalProcessHost::list(const std::string& prefix) {
    std::vector<std::string> names;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : envs_) {
        if (kv.first.compare(0, prefix.size(), prefix) == 0) names.push_back(kv.first);
    }
    return names;
}

} // namespace warden
