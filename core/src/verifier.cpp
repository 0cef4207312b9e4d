#include "warden/verifier.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"
#include "warden/log.h"

#include <iostream>

namespace warden {

Verifier::Verifier(FingerprintSet& blacklist, FingerprintSet& verified, IntegrityGate& gate,
                   std::filesystem::path quarantine_dir)
    : blacklist_(blacklist), verified_(verified), gate_(gate), quarantine_dir_(std::move(quarantine_dir)) {}

bool Verifier::needs_verification(const std::string& fp) const {
    return !verified_.contains(fp) && !blacklist_.contains(fp);
}

std::optional<VerificationVerdict> Verifier::verify_if_new(Uid uid, const std::filesystem::path& artifact,
                                                           const std::string& fp, Orchestrator& orch) {
    if (!needs_verification(fp)) return std::nullopt;

    std::optional<VerificationVerdict> v = orch.verify_only(uid, artifact, fp);
    if (!v) {
        std::cerr << "[verifier] uid=" << uid << " fp=" << fp.substr(0, 8) << " no verdict, retry next round\n";
        return std::nullopt;
    }
    std::string err = apply(uid, fp, artifact, *v);
    if (!err.empty()) std::cerr << "[verifier] uid=" << uid << " apply failed: " << err << "\n";
    return v;
}

std::string Verifier::apply(Uid uid, const std::string& fp, const std::filesystem::path& artifact,
                            const VerificationVerdict& v) {
    std::cerr << "[verifier] uid=" << uid << " fp=" << fp.substr(0, 8) << " " << verdict_name(v.verdict)
              << ": " << v.reason << "\n";

    switch (v.verdict) {
        case Verdict::ADVERSARIAL: {
            // evidence first: the cached copy is about to go
            std::string qerr = quarantine(uid, fp, artifact, v);
            if (!qerr.empty()) std::cerr << "[warn] quarantine uid=" << uid << ": " << qerr << "\n";
            std::string err = blacklist_.add(fp);
            gate_.evict(uid);
            if (!err.empty()) return "blacklist: " + err;
            err = verified_.add(fp);
            if (!err.empty()) return "verified set: " + err;
            return "";
        }
        case Verdict::MISSING_METADATA:
            gate_.evict(uid);
            return "";
        case Verdict::LEGITIMATE:
            return verified_.add(fp);
    }
    return "";
}

std::string Verifier::quarantine(Uid uid, const std::string& fp, const std::filesystem::path& artifact,
                                 const VerificationVerdict& v) const {
    if (!is_fingerprint(fp)) return "not a fingerprint: " + fp;
    const std::filesystem::path dir = quarantine_dir_ / fp;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return dir.string() + ": " + ec.message();

    if (std::filesystem::exists(artifact, ec)) {
        std::filesystem::copy_file(artifact, dir / "artifact.zip",
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) return "copy: " + ec.message();
    }

    json::Doc ev(json_object_new_object());
    json_object_object_add(ev.root, "uid", json_object_new_int64(uid));
    json_object_object_add(ev.root, "fingerprint", json_object_new_string(fp.c_str()));
    json_object_object_add(ev.root, "reason", json_object_new_string(v.reason.c_str()));
    json_object_object_add(ev.root, "ts", json_object_new_string(iso_now().c_str()));
    json::Doc insp = json::parse(v.evidence_json);
    json_object_object_add(ev.root, "inspection_results", insp ? insp.release() : json_object_new_object());
    return write_atomic(dir / "evidence.json", json::canonical(ev.root) + "\n");
}

} // namespace warden
