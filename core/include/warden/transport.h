#pragma once

#include "warden/types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden {

struct ArtifactReference {
    std::string fingerprint;   // as advertised by the participant, untrusted
    uint64_t size_hint{0};
};

// Peer-discovery / artifact transport collaborator.
// Absence of a reference is "no update this round", never an error.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::vector<Uid> participants() = 0;

    virtual std::optional<ArtifactReference> fetch_artifact_reference(Uid uid) = 0;

    // Fetch at most max_bytes. A larger reply must be refused without
    // buffering it. Empty string on success, error message otherwise.
    virtual std::string fetch_artifact_bytes(Uid uid, size_t max_bytes, std::string* out) = 0;
};

// Participants drop artifacts as <root>/<uid>.zip. An optional
// <root>/<uid>.ref.json ({"fingerprint": "..."}) overrides the advertised
// fingerprint; otherwise the file's own hash is advertised.
class DirectoryTransport : public Transport {
public:
    explicit DirectoryTransport(std::filesystem::path root);

    std::vector<Uid> participants() override;
    std::optional<ArtifactReference> fetch_artifact_reference(Uid uid) override;
    std::string fetch_artifact_bytes(Uid uid, size_t max_bytes, std::string* out) override;

private:
    std::filesystem::path artifact_path(Uid uid) const;

    std::filesystem::path root_;
};

} // namespace warden
