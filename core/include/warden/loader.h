#pragma once

#include "warden/policy.h"
#include "warden/tensor_codec.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace warden {

constexpr const char* kMetaEntry = "safe_policy_meta.json";
constexpr const char* kWeightsEntry = "policy.tensors";

enum class IntegrityKind {
    NONE,
    MISSING_METADATA,
    MISSING_WEIGHTS,
    BAD_METADATA,
    BAD_TENSORS,
    UNSAFE_DESERIALIZATION_UNSUPPORTED,
    KEY_MISMATCH,
    SHAPE_MISMATCH,
    ARCHIVE,
};

const char* integrity_kind_name(IntegrityKind k);

struct IntegrityError {
    IntegrityKind kind{IntegrityKind::NONE};
    std::string message;
    std::vector<std::string> missing;
    std::vector<std::string> unexpected;
};

struct LoadResult {
    std::unique_ptr<MlpPolicy> policy;   // null unless fully loaded
    IntegrityError error;

    bool ok() const { return policy != nullptr; }
};

// Rebuilds a policy from an artifact without generic deserialization:
// closed metadata -> make_policy -> strict copy of decoded numeric tensors.
class SecureLoader {
public:
    explicit SecureLoader(size_t max_entry_bytes = 50u * 1024 * 1024,
                          size_t max_archive_bytes = 50u * 1024 * 1024);

    LoadResult load(const std::filesystem::path& path, const ExecutionContext& ctx) const;
    LoadResult load_bytes(std::string bytes, const ExecutionContext& ctx) const;

    // Write a compliant artifact. Empty string on success.
    std::string store(const PolicyMeta& meta, const std::map<std::string, Tensor>& weights,
                      const std::filesystem::path& path) const;

private:
    size_t max_entry_bytes_;
    size_t max_archive_bytes_;
};

} // namespace warden
