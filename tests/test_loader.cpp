#include "test_common.h"
#include "test_artifacts.h"

#include "warden/archive.h"
#include "warden/loader.h"

#include <cstring>
#include <filesystem>

using namespace warden;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "warden_test_loader";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    SecureLoader loader;
    const PolicyMeta meta = small_meta();
    const auto weights = seeded_weights(meta, 99);

    // store -> load is bit exact
    {
        std::string err = loader.store(meta, weights, dir / "good.zip");
        expect_true(err.empty(), "store: " + err);
        LoadResult r = loader.load(dir / "good.zip", ExecutionContext{});
        expect_true(r.ok(), std::string("load: ") + integrity_kind_name(r.error.kind) + " " + r.error.message);
        expect_true(r.error.kind == IntegrityKind::NONE, "no error kind on success");
        for (const auto& kv : weights) {
            const Tensor& got = r.policy->parameters().at(kv.first);
            expect_true(got.shape == kv.second.shape, "shape for " + kv.first);
            expect_true(std::memcmp(got.data.data(), kv.second.data.data(), got.data.size() * sizeof(double)) == 0,
                        "bits for " + kv.first);
        }
    }

    // renamed key: mismatch named, no policy
    {
        auto renamed = weights;
        renamed["action_net.weightz"] = renamed.at("action_net.weight");
        renamed.erase("action_net.weight");
        std::string err = write_zip(dir / "renamed.zip", {{kMetaEntry, policy_meta_to_json(meta)},
                                                          {kWeightsEntry, encoded(renamed)}});
        expect_true(err.empty(), "write renamed: " + err);
        LoadResult r = loader.load(dir / "renamed.zip", ExecutionContext{});
        expect_true(!r.ok() && r.policy == nullptr, "renamed key must not load");
        expect_true(r.error.kind == IntegrityKind::KEY_MISMATCH, "renamed key is a key mismatch");
        expect_eq_ll((long long)r.error.missing.size(), 1, "one missing key");
        expect_true(r.error.missing[0] == "action_net.weight", "missing key named");
        expect_true(r.error.unexpected.size() == 1 && r.error.unexpected[0] == "action_net.weightz",
                    "unexpected key named");
    }

    // wrong shape only
    {
        auto reshaped = weights;
        Tensor& t = reshaped["value_net.bias"];
        t.shape = {1, 1};
        std::string err = write_zip(dir / "shape.zip", {{kMetaEntry, policy_meta_to_json(meta)},
                                                        {kWeightsEntry, encoded(reshaped)}});
        expect_true(err.empty(), "write reshaped: " + err);
        LoadResult r = loader.load(dir / "shape.zip", ExecutionContext{});
        expect_true(r.error.kind == IntegrityKind::SHAPE_MISMATCH, "shape mismatch kind");
    }

    // missing entries
    {
        std::string err = write_zip(dir / "nometa.zip", {{kWeightsEntry, encoded(weights)}});
        expect_true(err.empty(), "write nometa: " + err);
        expect_true(loader.load(dir / "nometa.zip", ExecutionContext{}).error.kind == IntegrityKind::MISSING_METADATA,
                    "missing metadata kind");

        err = write_zip(dir / "noweights.zip", {{kMetaEntry, policy_meta_to_json(meta)}});
        expect_true(err.empty(), "write noweights: " + err);
        expect_true(loader.load(dir / "noweights.zip", ExecutionContext{}).error.kind == IntegrityKind::MISSING_WEIGHTS,
                    "missing weights kind");
    }

    // hostile metadata and tensors
    {
        std::string err = write_zip(dir / "badmeta.zip",
                                    {{kMetaEntry, "{\"activation_fn\":\"builtins.eval\",\"net_arch\":[16,16]}"},
                                     {kWeightsEntry, encoded(weights)}});
        expect_true(err.empty(), "write badmeta: " + err);
        expect_true(loader.load(dir / "badmeta.zip", ExecutionContext{}).error.kind == IntegrityKind::BAD_METADATA,
                    "unknown activation is bad metadata");

        err = write_zip(dir / "badtensors.zip", {{kMetaEntry, policy_meta_to_json(meta)},
                                                 {kWeightsEntry, "\x80\x02}q(X"}});
        expect_true(err.empty(), "write badtensors: " + err);
        expect_true(loader.load(dir / "badtensors.zip", ExecutionContext{}).error.kind == IntegrityKind::BAD_TENSORS,
                    "pickle bytes are bad tensors");
    }

    // not an archive at all
    {
        LoadResult r = loader.load_bytes("definitely not a zip", ExecutionContext{});
        expect_true(r.error.kind == IntegrityKind::ARCHIVE, "garbage is an archive error");
        expect_true(loader.load(dir / "absent.zip", ExecutionContext{}).error.kind == IntegrityKind::ARCHIVE,
                    "absent file is an archive error");
    }

    // entry larger than the per-entry cap
    {
        SecureLoader tight(256);
        expect_true(!tight.store(meta, weights, dir / "tight.zip").empty(), "store refuses weights above entry cap");
        LoadResult r = tight.load(dir / "good.zip", ExecutionContext{});
        expect_true(r.error.kind == IntegrityKind::BAD_TENSORS, "oversized weights entry refused on load");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_loader: ALL PASSED" << std::endl;
    return 0;
}
