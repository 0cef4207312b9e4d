#include "warden/transport.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"

#include <algorithm>
#include <cctype>

namespace warden {

DirectoryTransport::DirectoryTransport(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path DirectoryTransport::artifact_path(Uid uid) const {
    return root_ / (std::to_string(uid) + ".zip");
}

std::vector<Uid> DirectoryTransport::participants() {
    std::vector<Uid> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return out;
    for (auto& de : std::filesystem::directory_iterator(root_, ec)) {
        if (!de.is_regular_file(ec)) continue;
        const auto p = de.path();
        if (p.extension() != ".zip") continue;
        const std::string stem = p.stem().string();
        if (stem.empty() || stem.size() > 18) continue;
        if (!std::all_of(stem.begin(), stem.end(), [](unsigned char c) { return std::isdigit(c); })) continue;
        out.push_back((Uid)std::stoll(stem));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<ArtifactReference> DirectoryTransport::fetch_artifact_reference(Uid uid) {
    const auto art = artifact_path(uid);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(art, ec)) return std::nullopt;

    ArtifactReference ref;
    ref.size_hint = (uint64_t)std::filesystem::file_size(art, ec);

    const auto sidecar = root_ / (std::to_string(uid) + ".ref.json");
    if (std::filesystem::exists(sidecar, ec)) {
        std::string body;
        if (!read_file_bounded(sidecar, 4096, &body).empty()) return std::nullopt;
        json::Doc d = json::parse(body, 4096, 4);
        auto fp = json::get_string(d.root, "fingerprint");
        if (!fp) return std::nullopt;
        ref.fingerprint = *fp;
        return ref;
    }

    ref.fingerprint = sha256_hex_file(art);
    if (ref.fingerprint.empty()) return std::nullopt;
    return ref;
}

std::string DirectoryTransport::fetch_artifact_bytes(Uid uid, size_t max_bytes, std::string* out) {
    return read_file_bounded(artifact_path(uid), max_bytes, out);
}

} // namespace warden
