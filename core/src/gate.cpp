#include "warden/gate.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"

#include <fstream>
#include <iostream>
#include <vector>

namespace warden {

const char* reject_reason_name(RejectReason r) {
    switch (r) {
        case RejectReason::NONE:                 return "none";
        case RejectReason::MALFORMED:            return "malformed";
        case RejectReason::TRAVERSAL:            return "traversal";
        case RejectReason::OVERSIZED:            return "oversized";
        case RejectReason::BLACKLISTED:          return "blacklisted";
        case RejectReason::EMPTY:                return "empty";
        case RejectReason::FINGERPRINT_MISMATCH: return "fingerprint_mismatch";
        case RejectReason::TOO_MANY_ENTRIES:     return "too_many_entries";
    }
    return "unknown";
}

bool is_traversal_name(const std::string& name) {
    if (name.empty()) return true;
    if (name[0] == '/' || name[0] == '\\') return true;
    if (name.size() >= 2 && name[1] == ':') return true;
    if (name.find('\0') != std::string::npos) return true;

    size_t start = 0;
    for (size_t i = 0; i <= name.size(); i++) {
        if (i == name.size() || name[i] == '/' || name[i] == '\\') {
            if (name.compare(start, i - start, "..") == 0 && i - start == 2) return true;
            start = i + 1;
        }
    }
    return false;
}

static Admission log_reject(Admission a) {
    std::cerr << "[gate] reject " << reject_reason_name(a.reason);
    if (!a.fingerprint.empty()) std::cerr << " fp=" << a.fingerprint.substr(0, 16);
    std::cerr << ": " << a.message << "\n";
    return a;
}

IntegrityGate::IntegrityGate(GateConfig cfg, const FingerprintSet& blacklist, ArchiveBackend& backend)
    : cfg_(std::move(cfg)), blacklist_(blacklist), backend_(backend) {}

Admission IntegrityGate::admit(const std::string& raw, uint64_t max_uncompressed) const {
    if (raw.empty()) return log_reject(Admission::reject(RejectReason::EMPTY, "empty artifact"));
    if ((uint64_t)raw.size() > cfg_.max_artifact_bytes) {
        return log_reject(Admission::reject(RejectReason::OVERSIZED,
            "artifact is " + std::to_string(raw.size()) + " bytes, limit " +
            std::to_string(cfg_.max_artifact_bytes)));
    }

    // blacklist first: a barred blob never reaches the archive parser
    const std::string fp = sha256_hex(raw);
    if (blacklist_.contains(fp)) {
        return log_reject(Admission::reject(RejectReason::BLACKLISTED, "fingerprint is blacklisted", fp));
    }

    std::vector<ArchiveEntry> entries;
    std::string err = backend_.list_entries(raw, &entries);
    if (!err.empty()) return log_reject(Admission::reject(RejectReason::MALFORMED, err, fp));
    if (entries.empty()) return log_reject(Admission::reject(RejectReason::EMPTY, "archive has no entries", fp));
    if (entries.size() > cfg_.max_entries) {
        return log_reject(Admission::reject(RejectReason::TOO_MANY_ENTRIES,
            std::to_string(entries.size()) + " entries, limit " + std::to_string(cfg_.max_entries), fp));
    }

    uint64_t total = 0;
    for (const auto& e : entries) {
        if (is_traversal_name(e.name)) {
            return log_reject(Admission::reject(RejectReason::TRAVERSAL, "unsafe entry name '" + e.name + "'", fp));
        }
        if (e.size > max_uncompressed - total || total + e.size < total) {
            return log_reject(Admission::reject(RejectReason::OVERSIZED,
                "uncompressed total exceeds " + std::to_string(max_uncompressed), fp));
        }
        total += e.size;
    }
    return Admission::accept(fp);
}

std::filesystem::path IntegrityGate::cache_path(Uid uid) const {
    return cfg_.cache_dir / ("UID_" + std::to_string(uid) + ".zip");
}

void IntegrityGate::evict(Uid uid) const {
    auto p = cache_path(uid);
    auto part = p;
    part += ".part";
    remove_quiet(part);
    if (!remove_quiet(p)) std::cerr << "[warn] could not remove " << p.string() << "\n";
}

CacheOutcome IntegrityGate::refresh(Uid uid, Transport& transport) {
    auto ref = transport.fetch_artifact_reference(uid);
    if (!ref) {
        CacheOutcome out;
        out.status = CacheOutcome::Status::SKIPPED;
        out.message = "no artifact reference";
        return out;
    }
    if (ref->size_hint > cfg_.max_artifact_bytes) {
        CacheOutcome out;
        out.status = CacheOutcome::Status::REJECTED;
        out.fingerprint = ref->fingerprint;
        out.admission = log_reject(Admission::reject(RejectReason::OVERSIZED,
            "advertised size " + std::to_string(ref->size_hint) + " exceeds limit", ref->fingerprint));
        out.message = out.admission.message;
        evict(uid);
        return out;
    }
    return refresh_cache(uid, ref->fingerprint, transport);
}

CacheOutcome IntegrityGate::refresh_cache(Uid uid, const std::string& advertised_fp, Transport& transport) {
    CacheOutcome out;
    out.fingerprint = advertised_fp;

    if (!is_fingerprint(advertised_fp)) {
        out.status = CacheOutcome::Status::SKIPPED;
        out.message = "advertised fingerprint is not a sha256 hex digest";
        return out;
    }
    if (blacklist_.contains(advertised_fp)) {
        evict(uid);
        out.status = CacheOutcome::Status::SKIPPED;
        out.admission = Admission::reject(RejectReason::BLACKLISTED, "advertised fingerprint is blacklisted", advertised_fp);
        out.message = out.admission.message;
        return out;
    }

    const auto path = cache_path(uid);
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec) && constant_time_eq(sha256_hex_file(path), advertised_fp)) {
        std::string raw;
        std::string err = read_file_bounded(path, cfg_.max_artifact_bytes, &raw);
        Admission a = err.empty() ? admit(raw)
                                  : Admission::reject(RejectReason::OVERSIZED, err, advertised_fp);
        if (a.accepted) {
            out.status = CacheOutcome::Status::READY;
            out.path = path;
            return out;
        }
        std::cerr << "[gate] cached artifact for uid " << uid << " failed re-admission, refetching\n";
        evict(uid);
    }

    return fetch_and_store(uid, advertised_fp, transport);
}

CacheOutcome IntegrityGate::fetch_and_store(Uid uid, const std::string& advertised_fp, Transport& transport) {
    CacheOutcome out;
    out.fingerprint = advertised_fp;
    const auto path = cache_path(uid);
    std::error_code ec;

    auto fail = [&](Admission a) {
        evict(uid);
        out.status = CacheOutcome::Status::REJECTED;
        out.admission = std::move(a);
        out.message = out.admission.message;
        return out;
    };

    std::string raw;
    std::string err = transport.fetch_artifact_bytes(uid, (size_t)cfg_.max_artifact_bytes, &raw);
    if (!err.empty()) {
        // a transport failure is "no update", not a verdict on the artifact
        evict(uid);
        out.status = CacheOutcome::Status::SKIPPED;
        out.message = "fetch failed: " + err;
        std::cerr << "[gate] uid " << uid << " " << out.message << "\n";
        return out;
    }

    const std::string got_fp = sha256_hex(raw);
    if (!constant_time_eq(got_fp, advertised_fp)) {
        return fail(log_reject(Admission::reject(RejectReason::FINGERPRINT_MISMATCH,
            "downloaded bytes hash to " + got_fp.substr(0, 16), advertised_fp)));
    }

    Admission a = admit(raw);
    if (!a.accepted) return fail(a);

    std::filesystem::create_directories(cfg_.cache_dir, ec);
    auto part = path;
    part += ".part";
    {
        std::ofstream f(part, std::ios::binary | std::ios::trunc);
        f.write(raw.data(), (std::streamsize)raw.size());
        f.flush();
        if (!f) {
            evict(uid);
            out.status = CacheOutcome::Status::SKIPPED;
            out.message = "cannot write " + part.string();
            return out;
        }
    }
    std::filesystem::rename(part, path, ec);
    if (ec) {
        evict(uid);
        out.status = CacheOutcome::Status::SKIPPED;
        out.message = "rename failed: " + ec.message();
        return out;
    }

    out.status = CacheOutcome::Status::READY;
    out.path = path;
    out.fingerprint = a.fingerprint;
    return out;
}

} // namespace warden
