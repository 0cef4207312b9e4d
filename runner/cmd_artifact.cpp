#include "cmd_artifact.h"
#include "runner_utils.h"

#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"
#include "warden/loader.h"
#include "warden/task.h"

#include <iostream>

using namespace warden;

int cmd_admit(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: warden_cli admit <artifact.zip> [--max-uncompressed BYTES]\n";
        return 2;
    }
    ValidatorConfig cfg = ValidatorConfig::from_env();
    FingerprintSet blacklist(std::filesystem::path(cfg.state_dir) / "blacklist.json");
    std::string err = blacklist.load();
    if (!err.empty()) {
        std::cerr << "blacklist: " << err << "\n";
        return 1;
    }
    ZipBackend backend;
    IntegrityGate gate(gate_config(cfg), blacklist, backend);

    uint64_t cap = gate.config().max_uncompressed_bytes;
    if (auto s = flag_value(argc, argv, "--max-uncompressed")) {
        auto v = parse_u64(*s);
        if (!v) {
            std::cerr << "bad --max-uncompressed: " << *s << "\n";
            return 2;
        }
        cap = *v;
    }

    std::string raw;
    err = read_file_bounded(argv[2], (size_t)cfg.max_artifact_bytes + 1, &raw);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 1;
    }
    Admission a = gate.admit(raw, cap);

    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "accepted", json_object_new_boolean(a.accepted));
    json_object_object_add(d.root, "reason", json_object_new_string(reject_reason_name(a.reason)));
    json_object_object_add(d.root, "message", json_object_new_string(a.message.c_str()));
    json_object_object_add(d.root, "fingerprint", json_object_new_string(a.fingerprint.c_str()));
    std::cout << json::to_string(d.root) << "\n";
    return a.accepted ? 0 : 1;
}

// Exit: 0 legitimate, 1 adversarial or missing metadata, 3 no verdict.
int cmd_verify(int argc, char** argv) {
    auto pos = positionals(argc, argv, {});
    auto uid = pos.size() == 2 ? parse_i64(pos[0]) : std::nullopt;
    if (!uid) {
        std::cerr << "usage: warden_cli verify <uid> <artifact.zip> [--commit]\n";
        return 2;
    }
    const std::filesystem::path artifact = pos[1];
    const std::string fp = sha256_hex_file(artifact);
    if (fp.empty()) {
        std::cerr << "cannot read " << artifact.string() << "\n";
        return 1;
    }

    ValidatorStack stack(ValidatorConfig::from_env());
    std::string err = stack.load();
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 1;
    }

    std::optional<VerificationVerdict> v = stack.orch.verify_only(*uid, artifact, fp);
    if (!v) {
        std::cout << "{\"verdict\":null}\n";
        return 3;
    }
    // --commit persists the verdict exactly as a round would
    if (has_flag(argc, argv, "--commit")) {
        err = stack.verifier.apply(*uid, fp, artifact, *v);
        if (!err.empty()) std::cerr << "[verifier] " << err << "\n";
    }

    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "uid", json_object_new_int64(*uid));
    json_object_object_add(d.root, "fingerprint", json_object_new_string(fp.c_str()));
    json_object_object_add(d.root, "verdict", json_object_new_string(verdict_name(v->verdict)));
    json_object_object_add(d.root, "reason", json_object_new_string(v->reason.c_str()));
    json::Doc ev = json::parse(v->evidence_json);
    json_object_object_add(d.root, "inspection_results", ev ? ev.release() : json_object_new_object());
    std::cout << json::to_string(d.root) << "\n";
    return v->verdict == Verdict::LEGITIMATE ? 0 : 1;
}

int cmd_evaluate(int argc, char** argv) {
    auto pos = positionals(argc, argv, {"--seed", "--task"});
    auto uid = pos.size() == 2 ? parse_i64(pos[0]) : std::nullopt;
    if (!uid) {
        std::cerr << "usage: warden_cli evaluate <uid> <artifact.zip> [--seed N | --task task.json]\n";
        return 2;
    }
    ValidatorConfig cfg = ValidatorConfig::from_env();

    Task task;
    if (auto tp = flag_value(argc, argv, "--task")) {
        std::string text;
        std::string err = read_file_bounded(*tp, 16 * 1024 * 1024, &text);
        if (err.empty()) err = task_from_json(text, &task);
        if (!err.empty()) {
            std::cerr << "task: " << err << "\n";
            return 2;
        }
    } else {
        uint64_t seed = secure_rand64();
        if (auto s = flag_value(argc, argv, "--seed")) {
            auto v = parse_u64(*s);
            if (!v) {
                std::cerr << "bad --seed: " << *s << "\n";
                return 2;
            }
            seed = *v;
        }
        TaskGenConfig tg;
        tg.horizon = cfg.horizon_sec;
        tg.sim_dt = cfg.sim_dt;
        task = random_task(seed, tg);
    }

    std::unique_ptr<ExecHost> host = make_exec_host(cfg);
    EnvironmentService env(*host, host_image(cfg));
    Orchestrator orch(orchestrator_config(cfg), env);

    VerificationVerdict flagged;
    EvaluationResult r = orch.evaluate(task, *uid, pos[1], &flagged);
    std::cout << result_to_json(r) << "\n";
    if (flagged.verdict == Verdict::ADVERSARIAL) {
        std::cerr << "[orchestrator] flagged adversarial: " << flagged.reason << "\n";
        return 1;
    }
    return 0;
}

int cmd_pack(int argc, char** argv) {
    if (argc < 5) {
        std::cerr << "usage: warden_cli pack <safe_policy_meta.json> <policy.tensors> <out.zip>\n";
        return 2;
    }
    std::string meta_text, tensors;
    std::string err = read_file_bounded(argv[2], json::DEFAULT_MAX_BYTES, &meta_text);
    if (err.empty()) err = read_file_bounded(argv[3], 50u * 1024 * 1024, &tensors);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 1;
    }

    PolicyMeta meta;
    err = parse_policy_meta(meta_text, &meta);
    if (!err.empty()) {
        std::cerr << "metadata: " << err << "\n";
        return 1;
    }
    TensorFile tf;
    err = decode_tensors(tensors, &tf);
    if (!err.empty()) {
        std::cerr << "tensors: " << err << "\n";
        return 1;
    }

    SecureLoader loader;
    err = loader.store(meta, tf.tensors, argv[4]);
    if (!err.empty()) {
        std::cerr << "pack: " << err << "\n";
        return 1;
    }
    // refuse to hand out an artifact the validator would reject
    LoadResult lr = loader.load(argv[4], ExecutionContext{});
    if (!lr.ok()) {
        std::cerr << "pack: artifact does not load (" << integrity_kind_name(lr.error.kind) << "): "
                  << lr.error.message << "\n";
        remove_quiet(argv[4]);
        return 1;
    }
    std::cout << sha256_hex_file(argv[4]) << "  " << argv[4] << "\n";
    return 0;
}

int cmd_blacklist(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: warden_cli blacklist list | add <fingerprint>\n";
        return 2;
    }
    ValidatorConfig cfg = ValidatorConfig::from_env();
    std::error_code ec;
    std::filesystem::create_directories(cfg.state_dir, ec);
    FingerprintSet bl(std::filesystem::path(cfg.state_dir) / "blacklist.json");
    std::string err = bl.load();
    if (!err.empty()) {
        std::cerr << "blacklist: " << err << "\n";
        return 1;
    }

    const std::string sub = argv[2];
    if (sub == "list") {
        for (const auto& fp : bl.snapshot()) std::cout << fp << "\n";
        return 0;
    }
    if (sub == "add" && argc >= 4) {
        const std::string fp = argv[3];
        if (!is_fingerprint(fp)) {
            std::cerr << "not a sha256 fingerprint: " << fp << "\n";
            return 2;
        }
        err = bl.add(fp);
        if (!err.empty()) {
            std::cerr << err << "\n";
            return 1;
        }
        std::cout << "blacklisted " << fp << " (" << bl.size() << " total)\n";
        return 0;
    }
    std::cerr << "usage: warden_cli blacklist list | add <fingerprint>\n";
    return 2;
}
