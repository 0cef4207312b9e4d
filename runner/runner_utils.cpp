#include "runner_utils.h"

#include "warden/json_util.h"

#include <cerrno>
#include <cstdlib>

namespace warden {

GateConfig gate_config(const ValidatorConfig& cfg) {
    GateConfig g;
    g.cache_dir = cfg.cache_dir;
    g.max_artifact_bytes = (uint64_t)cfg.max_artifact_bytes;
    g.max_uncompressed_bytes = (uint64_t)cfg.max_uncompressed_bytes;
    return g;
}

OrchestratorConfig orchestrator_config(const ValidatorConfig& cfg) {
    OrchestratorConfig o;
    o.work_dir = std::filesystem::path(cfg.state_dir) / "work";
    o.eval_caps = cfg.eval_caps;
    o.verify_caps = cfg.verify_caps;
    o.seccomp = cfg.seccomp;
    o.child_env = evalhost_env();
    return o;
}

std::unique_ptr<ExecHost> make_exec_host(const ValidatorConfig& cfg) {
    if (cfg.host_kind == "docker") {
        return std::make_unique<DockerHost>(getenv_str("WARDEN_DOCKER_BIN", "docker"), cfg.dockerfile,
                                            cfg.build_context);
    }
    return std::make_unique<LocalProcessHost>(cfg.evalhost_path);
}

std::string host_image(const ValidatorConfig& cfg) {
    return cfg.host_kind == "docker" ? cfg.base_image : cfg.evalhost_path;
}

ValidatorStack::ValidatorStack(const ValidatorConfig& c)
    : cfg(c),
      blacklist(std::filesystem::path(c.state_dir) / "blacklist.json"),
      verified(std::filesystem::path(c.state_dir) / "verified.json"),
      gate(gate_config(c), blacklist, backend),
      transport(c.drop_dir),
      host(make_exec_host(c)),
      env(*host, host_image(c)),
      orch(orchestrator_config(c), env),
      verifier(blacklist, verified, gate, std::filesystem::path(c.state_dir) / "quarantine"),
      book(std::filesystem::path(c.state_dir) / "scores.json"),
      sink(std::filesystem::path(c.state_dir) / "weights.json"),
      round(c, transport, blacklist, gate, verifier, orch, book, sink) {}

std::string ValidatorStack::load() {
    std::error_code ec;
    std::filesystem::create_directories(cfg.state_dir, ec);
    if (ec) return cfg.state_dir + ": " + ec.message();
    std::string err = blacklist.load();
    if (!err.empty()) return "blacklist: " + err;
    err = verified.load();
    if (!err.empty()) return "verified set: " + err;
    err = book.load();
    if (!err.empty()) return "score book: " + err;
    return "";
}

std::optional<std::string> flag_value(int argc, char** argv, const std::string& name) {
    for (int i = 2; i + 1 < argc; i++) {
        if (name == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, const std::string& name) {
    for (int i = 2; i < argc; i++) {
        if (name == argv[i]) return true;
    }
    return false;
}

std::vector<std::string> positionals(int argc, char** argv, const std::vector<std::string>& valued) {
    std::vector<std::string> out;
    for (int i = 2; i < argc; i++) {
        const std::string a = argv[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            for (const auto& v : valued) {
                if (a == v) {
                    i++;
                    break;
                }
            }
            continue;
        }
        out.push_back(a);
    }
    return out;
}

std::optional<uint64_t> parse_u64(const std::string& s) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || !end || *end != '\0') return std::nullopt;
    return (uint64_t)v;
}

std::optional<int64_t> parse_i64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return std::nullopt;
    return (int64_t)v;
}

std::string result_to_json(const EvaluationResult& r) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "uid", json_object_new_int64(r.uid));
    json_object_object_add(d.root, "success", json_object_new_boolean(r.success));
    json_object_object_add(d.root, "t", json_object_new_double(r.time_sec));
    json_object_object_add(d.root, "e", json_object_new_double(r.energy));
    json_object_object_add(d.root, "score", json_object_new_double(r.score));
    return json::to_string(d.root);
}

std::string weights_to_json(const WeightVector& w) {
    json::Doc d(json_object_new_object());
    json_object* arr = json_object_new_array();
    for (size_t i = 0; i < w.uids.size() && i < w.weights.size(); i++) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "uid", json_object_new_int64(w.uids[i]));
        json_object_object_add(e, "weight", json_object_new_double(w.weights[i]));
        json_object_array_add(arr, e);
    }
    json_object_object_add(d.root, "weights", arr);
    json_object_object_add(d.root, "sum", json_object_new_double(w.sum()));
    return json::to_string(d.root);
}

} // namespace warden
