#pragma once

#include "warden/archive.h"
#include "warden/fingerprint_set.h"
#include "warden/transport.h"
#include "warden/types.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace warden {

enum class RejectReason {
    NONE,
    MALFORMED,
    TRAVERSAL,
    OVERSIZED,
    BLACKLISTED,
    EMPTY,
    FINGERPRINT_MISMATCH,
    TOO_MANY_ENTRIES,
};

const char* reject_reason_name(RejectReason r);

struct Admission {
    bool accepted{false};
    RejectReason reason{RejectReason::NONE};
    std::string message;
    std::string fingerprint;

    static Admission accept(std::string fp) {
        Admission a;
        a.accepted = true;
        a.fingerprint = std::move(fp);
        return a;
    }
    static Admission reject(RejectReason r, std::string msg, std::string fp = "") {
        Admission a;
        a.reason = r;
        a.message = std::move(msg);
        a.fingerprint = std::move(fp);
        return a;
    }
};

// True for names that could escape an extraction root: absolute paths,
// backslash-rooted or drive-prefixed paths, and any ".." segment.
bool is_traversal_name(const std::string& name);

struct GateConfig {
    std::filesystem::path cache_dir{"warden_state/models"};
    uint64_t max_artifact_bytes{50ULL * 1024 * 1024};      // raw blob
    uint64_t max_uncompressed_bytes{50ULL * 1024 * 1024};  // sum over entries
    size_t max_entries{64};
};

struct CacheOutcome {
    enum class Status { READY, SKIPPED, REJECTED };

    Status status{Status::SKIPPED};
    std::filesystem::path path;
    std::string fingerprint;
    Admission admission;        // set when status == REJECTED
    std::string message;
};

// Admission control over the artifact cache. Reads the blacklist, never
// writes it. Every decision is made over the archive index only.
class IntegrityGate {
public:
    IntegrityGate(GateConfig cfg, const FingerprintSet& blacklist, ArchiveBackend& backend);

    Admission admit(const std::string& raw, uint64_t max_uncompressed) const;
    Admission admit(const std::string& raw) const { return admit(raw, cfg_.max_uncompressed_bytes); }

    // Queries the transport for the advertised reference, then refresh_cache.
    CacheOutcome refresh(Uid uid, Transport& transport);

    // Ensure <cache>/UID_<uid>.zip holds an admitted artifact whose
    // fingerprint equals advertised_fp, fetching when needed. Any admission
    // failure leaves no cache entry behind.
    CacheOutcome refresh_cache(Uid uid, const std::string& advertised_fp, Transport& transport);

    std::filesystem::path cache_path(Uid uid) const;
    void evict(Uid uid) const;

    const GateConfig& config() const { return cfg_; }

private:
    CacheOutcome fetch_and_store(Uid uid, const std::string& advertised_fp, Transport& transport);

    GateConfig cfg_;
    const FingerprintSet& blacklist_;
    ArchiveBackend& backend_;
};

} // namespace warden
