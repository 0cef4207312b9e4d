#include "warden/loader.h"
#include "warden/archive.h"
#include "warden/fsutil.h"

#include <algorithm>
#include <iostream>

namespace warden {

const char* integrity_kind_name(IntegrityKind k) {
    switch (k) {
        case IntegrityKind::NONE:                               return "none";
        case IntegrityKind::MISSING_METADATA:                   return "missing_metadata";
        case IntegrityKind::MISSING_WEIGHTS:                    return "missing_weights";
        case IntegrityKind::BAD_METADATA:                       return "bad_metadata";
        case IntegrityKind::BAD_TENSORS:                        return "bad_tensors";
        case IntegrityKind::UNSAFE_DESERIALIZATION_UNSUPPORTED: return "unsafe_deserialization_unsupported";
        case IntegrityKind::KEY_MISMATCH:                       return "key_mismatch";
        case IntegrityKind::SHAPE_MISMATCH:                     return "shape_mismatch";
        case IntegrityKind::ARCHIVE:                            return "archive";
    }
    return "unknown";
}

static LoadResult fail(IntegrityKind kind, std::string msg) {
    std::cerr << "[loader] " << integrity_kind_name(kind) << ": " << msg << "\n";
    LoadResult r;
    r.error.kind = kind;
    r.error.message = std::move(msg);
    return r;
}

SecureLoader::SecureLoader(size_t max_entry_bytes, size_t max_archive_bytes)
    : max_entry_bytes_(max_entry_bytes), max_archive_bytes_(max_archive_bytes) {}

LoadResult SecureLoader::load(const std::filesystem::path& path, const ExecutionContext& ctx) const {
    std::string bytes;
    std::string err = read_file_bounded(path, max_archive_bytes_, &bytes);
    if (!err.empty()) return fail(IntegrityKind::ARCHIVE, err);
    return load_bytes(std::move(bytes), ctx);
}

LoadResult SecureLoader::load_bytes(std::string bytes, const ExecutionContext& ctx) const {
    const CodecCapability& cap = tensor_codec_probe();
    if (!cap.ok) return fail(IntegrityKind::UNSAFE_DESERIALIZATION_UNSUPPORTED, cap.reason);

    std::string err;
    auto za = ZipArchive::open(std::move(bytes), &err);
    if (!za) return fail(IntegrityKind::ARCHIVE, err);

    auto meta_idx = za->find(kMetaEntry);
    if (!meta_idx) return fail(IntegrityKind::MISSING_METADATA, std::string(kMetaEntry) + " not found");
    auto weights_idx = za->find(kWeightsEntry);
    if (!weights_idx) return fail(IntegrityKind::MISSING_WEIGHTS, std::string(kWeightsEntry) + " not found");

    std::string meta_text;
    err = za->read(*meta_idx, std::min<size_t>(max_entry_bytes_, 64 * 1024), &meta_text);
    if (!err.empty()) return fail(IntegrityKind::BAD_METADATA, err);
    PolicyMeta meta;
    err = parse_policy_meta(meta_text, &meta);
    if (!err.empty()) return fail(IntegrityKind::BAD_METADATA, err);

    std::string blob;
    err = za->read(*weights_idx, max_entry_bytes_, &blob);
    if (!err.empty()) return fail(IntegrityKind::BAD_TENSORS, err);
    TensorFile tf;
    err = decode_tensors(blob, &tf);
    if (!err.empty()) return fail(IntegrityKind::BAD_TENSORS, err);

    std::unique_ptr<MlpPolicy> policy = make_policy(meta, ctx, &err);
    if (!policy) return fail(IntegrityKind::BAD_METADATA, err);

    StateMismatch mm;
    if (!policy->load_state_dict(tf.tensors, &mm)) {
        const IntegrityKind kind = (mm.missing.empty() && mm.unexpected.empty())
                                       ? IntegrityKind::SHAPE_MISMATCH
                                       : IntegrityKind::KEY_MISMATCH;
        LoadResult r = fail(kind, mm.describe());
        r.error.missing = std::move(mm.missing);
        r.error.unexpected = std::move(mm.unexpected);
        return r;
    }

    LoadResult r;
    r.policy = std::move(policy);
    return r;
}

std::string SecureLoader::store(const PolicyMeta& meta, const std::map<std::string, Tensor>& weights,
                                const std::filesystem::path& path) const {
    TensorFile tf;
    tf.tensors = weights;
    tf.metadata["format"] = "warden-tensors-1";
    std::string blob;
    std::string err = encode_tensors(tf, &blob);
    if (!err.empty()) return err;
    if (blob.size() > max_entry_bytes_) return "weights exceed entry limit";

    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
    return write_zip(path, {{kMetaEntry, policy_meta_to_json(meta)}, {kWeightsEntry, blob}});
}

} // namespace warden
