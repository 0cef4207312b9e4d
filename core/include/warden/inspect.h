#pragma once

#include "warden/loader.h"
#include "warden/types.h"

#include <filesystem>
#include <memory>
#include <string>

namespace warden {

struct InspectionLimits {
    size_t max_entries{16};
    double max_abs_weight{1e4};
    int probes{32};
    uint64_t probe_seed{0x5eed5eedULL};
};

struct InspectionReport {
    VerificationVerdict verdict;
    std::unique_ptr<MlpPolicy> policy;   // set only for legitimate artifacts
};

// Three-layer anti-cheat pass over one artifact: structural (entries),
// numeric (decoder, loader and weight statistics), behavioural (probe the
// policy with fixed observations). evidence_json records every check.
InspectionReport inspect_artifact(const std::filesystem::path& path, const ExecutionContext& ctx,
                                  const SecureLoader& loader, const InspectionLimits& lim = InspectionLimits{});

// True for entry names that can only carry code or pickled objects.
bool is_foreign_entry(const std::string& name);

} // namespace warden
