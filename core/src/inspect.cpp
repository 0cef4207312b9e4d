#include "warden/inspect.h"
#include "warden/archive.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>

namespace warden {

bool is_foreign_entry(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    auto slash = n.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? n : n.substr(slash + 1);
    if (base == "data.pkl") return true;

    static const char* kSuffixes[] = {".pkl", ".pickle", ".py", ".pyc", ".so", ".dll", ".dylib", ".sh", ".exe"};
    for (const char* suf : kSuffixes) {
        const size_t len = std::char_traits<char>::length(suf);
        if (base.size() >= len && base.compare(base.size() - len, len, suf) == 0) return true;
    }
    return false;
}

static InspectionReport finish(Verdict v, const std::string& reason, json::Doc& evidence) {
    json_object_object_add(evidence.root, "verdict", json_object_new_string(verdict_name(v)));
    json_object_object_add(evidence.root, "reason", json_object_new_string(reason.c_str()));
    InspectionReport r;
    r.verdict.verdict = v;
    r.verdict.reason = reason;
    r.verdict.evidence_json = json::canonical(evidence.root);
    return r;
}

InspectionReport inspect_artifact(const std::filesystem::path& path, const ExecutionContext& ctx,
                                  const SecureLoader& loader, const InspectionLimits& lim) {
    json::Doc evidence(json_object_new_object());

    // ---- structural ----
    json_object* st = json_object_new_object();
    json_object_object_add(evidence.root, "structural", st);

    std::string bytes;
    std::string err = read_file_bounded(path, 64u * 1024 * 1024, &bytes);
    if (!err.empty()) {
        json_object_object_add(st, "error", json_object_new_string(err.c_str()));
        return finish(Verdict::ADVERSARIAL, "artifact unreadable: " + err, evidence);
    }

    std::vector<ArchiveEntry> entries;
    {
        ZipBackend zb;
        err = zb.list_entries(bytes, &entries);
    }
    if (!err.empty()) {
        json_object_object_add(st, "error", json_object_new_string(err.c_str()));
        return finish(Verdict::ADVERSARIAL, "archive index unreadable", evidence);
    }

    std::vector<std::string> names, foreign;
    bool has_meta = false, has_weights = false;
    for (const auto& e : entries) {
        names.push_back(e.name);
        if (e.name == kMetaEntry) has_meta = true;
        if (e.name == kWeightsEntry) has_weights = true;
        if (is_foreign_entry(e.name)) foreign.push_back(e.name);
    }
    json_object_object_add(st, "entries", json::new_string_array(names));
    json_object_object_add(st, "foreign", json::new_string_array(foreign));
    json_object_object_add(st, "has_metadata", json_object_new_boolean(has_meta));
    json_object_object_add(st, "has_weights", json_object_new_boolean(has_weights));

    if (!foreign.empty()) return finish(Verdict::ADVERSARIAL, "foreign entry '" + foreign.front() + "'", evidence);
    if (entries.size() > lim.max_entries) {
        return finish(Verdict::ADVERSARIAL, std::to_string(entries.size()) + " entries in archive", evidence);
    }
    if (!has_meta || !has_weights) {
        return finish(Verdict::MISSING_METADATA,
                      !has_meta ? std::string(kMetaEntry) + " missing" : std::string(kWeightsEntry) + " missing",
                      evidence);
    }

    // ---- numeric ----
    json_object* nu = json_object_new_object();
    json_object_object_add(evidence.root, "numeric", nu);

    LoadResult lr = loader.load_bytes(std::move(bytes), ctx);
    if (!lr.ok()) {
        json_object_object_add(nu, "load_error", json_object_new_string(integrity_kind_name(lr.error.kind)));
        json_object_object_add(nu, "message", json_object_new_string(lr.error.message.c_str()));
        if (lr.error.kind == IntegrityKind::MISSING_METADATA)
            return finish(Verdict::MISSING_METADATA, lr.error.message, evidence);
        return finish(Verdict::ADVERSARIAL, std::string("load failed: ") + integrity_kind_name(lr.error.kind), evidence);
    }

    size_t non_finite = 0, oversized = 0, weight_mats = 0, constant_mats = 0;
    double max_abs = 0.0;
    for (const auto& kv : lr.policy->parameters()) {
        const Tensor& t = kv.second;
        for (double v : t.data) {
            if (!std::isfinite(v)) {
                non_finite++;
                continue;
            }
            max_abs = std::max(max_abs, std::fabs(v));
            if (std::fabs(v) > lim.max_abs_weight) oversized++;
        }
        const std::string suffix = ".weight";
        if (kv.first.size() > suffix.size() &&
            kv.first.compare(kv.first.size() - suffix.size(), suffix.size(), suffix) == 0) {
            weight_mats++;
            if (t.data.empty() || std::all_of(t.data.begin(), t.data.end(),
                                              [&](double v) { return v == t.data.front(); })) {
                constant_mats++;
            }
        }
    }
    json_object_object_add(nu, "non_finite", json_object_new_int64((int64_t)non_finite));
    json_object_object_add(nu, "oversized", json_object_new_int64((int64_t)oversized));
    json_object_object_add(nu, "max_abs", json_object_new_double(std::isfinite(max_abs) ? max_abs : 0.0));
    json_object_object_add(nu, "weight_matrices", json_object_new_int64((int64_t)weight_mats));
    json_object_object_add(nu, "constant_matrices", json_object_new_int64((int64_t)constant_mats));

    if (non_finite > 0) return finish(Verdict::ADVERSARIAL, "non-finite weights", evidence);
    if (oversized > 0) return finish(Verdict::ADVERSARIAL, "weights exceed magnitude bound", evidence);
    if (weight_mats > 0 && constant_mats == weight_mats)
        return finish(Verdict::ADVERSARIAL, "every weight matrix is constant", evidence);

    // ---- behavioural ----
    json_object* be = json_object_new_object();
    json_object_object_add(evidence.root, "behavioural", be);

    std::mt19937_64 rng(lim.probe_seed);
    std::vector<std::vector<double>> outputs;
    size_t bad_outputs = 0;
    for (int i = 0; i < lim.probes; i++) {
        std::vector<double> obs((size_t)ctx.obs_dim);
        for (double& x : obs) x = ((double)(rng() >> 11) * (1.0 / 9007199254740992.0)) * 20.0 - 10.0;
        std::vector<double> a = lr.policy->act(obs);
        if (std::any_of(a.begin(), a.end(), [](double v) { return !std::isfinite(v); })) bad_outputs++;
        outputs.push_back(std::move(a));
    }
    double spread = 0.0;
    for (size_t i = 1; i < outputs.size(); i++) {
        for (size_t j = 0; j < outputs[i].size(); j++) {
            spread = std::max(spread, std::fabs(outputs[i][j] - outputs[0][j]));
        }
    }
    json_object_object_add(be, "probes", json_object_new_int(lim.probes));
    json_object_object_add(be, "non_finite_outputs", json_object_new_int64((int64_t)bad_outputs));
    json_object_object_add(be, "output_spread", json_object_new_double(std::isfinite(spread) ? spread : 0.0));

    if (bad_outputs > 0) return finish(Verdict::ADVERSARIAL, "non-finite policy outputs", evidence);
    if (lim.probes > 1 && !(spread > 1e-12))
        return finish(Verdict::ADVERSARIAL, "policy output ignores its observation", evidence);

    InspectionReport r = finish(Verdict::LEGITIMATE, "all checks passed", evidence);
    r.policy = std::move(lr.policy);
    return r;
}

} // namespace warden
