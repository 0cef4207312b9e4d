#include "test_common.h"

#include "warden/archive.h"
#include "warden/crypto.h"
#include "warden/fingerprint_set.h"
#include "warden/gate.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>

using namespace warden;

// Records every call; answers with a canned index.
class SpyBackend : public ArchiveBackend {
public:
    std::vector<ArchiveEntry> entries;
    std::string list_error;
    int list_calls{0};
    int extract_calls{0};

    std::string list_entries(const std::string&, std::vector<ArchiveEntry>* out) override {
        list_calls++;
        if (!list_error.empty()) return list_error;
        *out = entries;
        return "";
    }
    std::string extract_entry(const std::string&, const std::string&, size_t, std::string*) override {
        extract_calls++;
        return "not used by the gate";
    }
};

class MapTransport : public Transport {
public:
    std::map<Uid, std::string> blobs;
    std::map<Uid, std::string> advertised;
    std::string fail;
    int fetches{0};

    std::vector<Uid> participants() override {
        std::vector<Uid> out;
        for (const auto& kv : blobs) out.push_back(kv.first);
        return out;
    }
    std::optional<ArtifactReference> fetch_artifact_reference(Uid uid) override {
        auto it = blobs.find(uid);
        if (it == blobs.end()) return std::nullopt;
        ArtifactReference r;
        r.fingerprint = advertised.count(uid) ? advertised[uid] : sha256_hex(it->second);
        r.size_hint = it->second.size();
        return r;
    }
    std::string fetch_artifact_bytes(Uid uid, size_t max_bytes, std::string* out) override {
        fetches++;
        if (!fail.empty()) return fail;
        auto it = blobs.find(uid);
        if (it == blobs.end()) return "no artifact";
        if (it->second.size() > max_bytes) return "too large";
        *out = it->second;
        return "";
    }
};

static std::string zip_bytes(const std::filesystem::path& p, const std::string& payload) {
    std::string err = write_zip(p, {{"safe_policy_meta.json", "{}"}, {"policy.tensors", payload}});
    if (!err.empty()) die("write_zip: " + err);
    std::string raw;
    std::ifstream in(p, std::ios::binary);
    raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return raw;
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "warden_test_gate";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    FingerprintSet blacklist(dir / "blacklist.json");
    expect_true(blacklist.load().empty(), "blacklist load");

    expect_true(is_traversal_name("../../etc/passwd"), "dotdot traversal");
    expect_true(is_traversal_name("/etc/passwd"), "absolute path");
    expect_true(is_traversal_name("C:\\x"), "drive path");
    expect_true(is_traversal_name("a\\..\\b"), "backslash dotdot");
    expect_true(!is_traversal_name("dir/..hidden"), "dotdot prefix is a plain name");
    expect_true(!is_traversal_name("policy.tensors"), "plain name");

    // admission over a spy backend
    {
        SpyBackend spy;
        GateConfig cfg;
        cfg.cache_dir = dir / "models";
        cfg.max_entries = 4;
        IntegrityGate gate(cfg, blacklist, spy);

        const std::string raw = "PK-not-really";
        expect_true(blacklist.add(sha256_hex(raw)).empty(), "blacklist add");
        Admission a = gate.admit(raw, 1000);
        expect_true(!a.accepted && a.reason == RejectReason::BLACKLISTED, "blacklisted blob refused");
        expect_eq_ll(spy.list_calls, 0, "blacklisted blob never reaches the archive parser");

        spy.entries = {{"safe_policy_meta.json", 10}, {"../../etc/passwd", 1}};
        a = gate.admit("other bytes", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::TRAVERSAL, "traversal refused");
        expect_eq_ll(spy.list_calls, 1, "index listed once");
        expect_eq_ll(spy.extract_calls, 0, "admission never extracts");

        spy.entries = {{"a", 600}, {"b", 400}};
        a = gate.admit("other bytes", 1000);
        expect_true(a.accepted, "total exactly at the cap admitted: " + a.message);
        expect_true(a.fingerprint == sha256_hex("other bytes"), "fingerprint of the raw blob");
        a = gate.admit("other bytes", 999);
        expect_true(!a.accepted && a.reason == RejectReason::OVERSIZED, "one byte over the cap refused");

        spy.entries = {{"a", UINT64_MAX}, {"b", 2}};
        a = gate.admit("other bytes", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::OVERSIZED, "overflowing sizes refused");

        spy.entries = {{"a", 1}, {"b", 1}, {"c", 1}, {"d", 1}, {"e", 1}};
        a = gate.admit("other bytes", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::TOO_MANY_ENTRIES, "entry count capped");

        spy.entries.clear();
        a = gate.admit("other bytes", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::EMPTY, "empty archive refused");

        spy.list_error = "central directory corrupt";
        a = gate.admit("other bytes", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::MALFORMED, "malformed archive refused");

        a = gate.admit("", 1000);
        expect_true(!a.accepted && a.reason == RejectReason::EMPTY, "empty blob refused");
    }
    {
        SpyBackend spy;
        GateConfig cfg;
        cfg.max_artifact_bytes = 8;
        IntegrityGate gate(cfg, blacklist, spy);
        Admission a = gate.admit("123456789");
        expect_true(!a.accepted && a.reason == RejectReason::OVERSIZED, "raw blob over the limit refused");
        expect_eq_ll(spy.list_calls, 0, "oversized blob never parsed");
    }

    // cache refresh over real archives
    {
        ZipBackend zb;
        GateConfig cfg;
        cfg.cache_dir = dir / "models";
        IntegrityGate gate(cfg, blacklist, zb);
        MapTransport tr;
        tr.blobs[1] = zip_bytes(dir / "one.zip", "weights-one");
        const std::string fp1 = sha256_hex(tr.blobs[1]);

        CacheOutcome co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::READY, "first refresh fetches: " + co.message);
        expect_true(co.path == gate.cache_path(1) && fs::exists(co.path), "cached under UID_1.zip");
        expect_true(sha256_hex_file(co.path) == fp1, "cached bytes match");
        expect_eq_ll(tr.fetches, 1, "one fetch");

        co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::READY, "second refresh served from cache");
        expect_eq_ll(tr.fetches, 1, "cache hit does not fetch");

        // participant advertises a new fingerprint but serves different bytes
        tr.blobs[1] = zip_bytes(dir / "two.zip", "weights-two");
        tr.advertised[1] = sha256_hex("something else");
        co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::REJECTED, "fingerprint mismatch rejected");
        expect_true(co.admission.reason == RejectReason::FINGERPRINT_MISMATCH, "mismatch reason");
        expect_true(!fs::exists(gate.cache_path(1)), "rejection leaves no cache entry");
        tr.advertised.erase(1);

        tr.fail = "connection reset";
        co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::SKIPPED, "transport failure is a skip");
        tr.fail.clear();

        expect_true(gate.refresh(2, tr).status == CacheOutcome::Status::SKIPPED, "no reference is a skip");

        tr.advertised[1] = "not-a-digest";
        expect_true(gate.refresh(1, tr).status == CacheOutcome::Status::SKIPPED, "malformed advertised fingerprint");
        tr.advertised.erase(1);

        co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::READY, "recovers on the next refresh");
        expect_true(blacklist.add(co.fingerprint).empty(), "blacklist the cached artifact");
        co = gate.refresh(1, tr);
        expect_true(co.status == CacheOutcome::Status::SKIPPED, "blacklisted advertisement skipped");
        expect_true(co.admission.reason == RejectReason::BLACKLISTED, "blacklisted reason");
        expect_true(!fs::exists(gate.cache_path(1)), "blacklisted artifact evicted");

        tr.blobs[3] = "garbage that is not a zip";
        co = gate.refresh(3, tr);
        expect_true(co.status == CacheOutcome::Status::REJECTED && co.admission.reason == RejectReason::MALFORMED,
                    "non-archive rejected");
        expect_true(!fs::exists(gate.cache_path(3)), "no cache entry for a rejected blob");
    }
    {
        SpyBackend spy;
        GateConfig cfg;
        cfg.cache_dir = dir / "models";
        cfg.max_artifact_bytes = 4;
        IntegrityGate gate(cfg, blacklist, spy);
        MapTransport tr;
        tr.blobs[9] = "much longer than four bytes";
        CacheOutcome co = gate.refresh(9, tr);
        expect_true(co.status == CacheOutcome::Status::REJECTED, "oversized advertisement rejected");
        expect_eq_ll(tr.fetches, 0, "oversized advertisement never fetched");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_gate: ALL PASSED" << std::endl;
    return 0;
}
