#pragma once

#include "warden/fingerprint_set.h"
#include "warden/gate.h"
#include "warden/orchestrator.h"
#include "warden/types.h"

#include <filesystem>
#include <optional>
#include <string>

namespace warden {

// Owns the blacklist write path. Every fingerprint gets one verification
// that produces a verdict; adversarial verdicts are final.
class Verifier {
public:
    Verifier(FingerprintSet& blacklist, FingerprintSet& verified, IntegrityGate& gate,
             std::filesystem::path quarantine_dir);

    // False for fingerprints that already produced a legitimate or
    // adversarial verdict.
    bool needs_verification(const std::string& fp) const;

    // verify_only + apply for a fingerprint seen for the first time.
    // nullopt when already verified or when the run gave no verdict.
    std::optional<VerificationVerdict> verify_if_new(Uid uid, const std::filesystem::path& artifact,
                                                     const std::string& fp, Orchestrator& orch);

    // Commit a verdict:
    //   ADVERSARIAL       quarantine copy + evidence, blacklist, evict
    //   MISSING_METADATA  evict only (re-verified when it comes back)
    //   LEGITIMATE        mark verified
    // Empty string on success.
    std::string apply(Uid uid, const std::string& fp, const std::filesystem::path& artifact,
                      const VerificationVerdict& v);

    // <quarantine>/<fp>/ holding the artifact and evidence.json.
    std::string quarantine(Uid uid, const std::string& fp, const std::filesystem::path& artifact,
                           const VerificationVerdict& v) const;

    const std::filesystem::path& quarantine_dir() const { return quarantine_dir_; }

private:
    FingerprintSet& blacklist_;
    FingerprintSet& verified_;
    IntegrityGate& gate_;
    std::filesystem::path quarantine_dir_;
};

} // namespace warden
