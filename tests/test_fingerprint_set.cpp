#include "test_common.h"

#include "warden/crypto.h"
#include "warden/fingerprint_set.h"
#include "warden/fsutil.h"

#include <filesystem>
#include <thread>
#include <vector>

using namespace warden;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "warden_test_fpset";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    const fs::path file = dir / "blacklist.json";

    FingerprintSet set(file);
    expect_true(set.load().empty(), "missing file loads as empty set");
    expect_eq_ll((long long)set.size(), 0, "empty set");

    const std::string a = sha256_hex("a");
    const std::string b = sha256_hex("b");
    expect_true(set.add(a).empty(), "add a");
    expect_true(set.add(a).empty(), "re-add is not an error");
    expect_eq_ll((long long)set.size(), 1, "re-add keeps one member");
    expect_true(!set.add("nope").empty(), "malformed fingerprint refused");
    expect_true(fs::exists(file), "add persists before returning");

    // concurrent adders
    {
        std::vector<std::thread> th;
        for (int i = 0; i < 8; i++) {
            th.emplace_back([&set, i] {
                for (int j = 0; j < 10; j++) {
                    std::string err = set.add(sha256_hex("t" + std::to_string(i) + "_" + std::to_string(j)));
                    if (!err.empty()) die("concurrent add: " + err);
                }
            });
        }
        for (auto& t : th) t.join();
    }
    expect_true(set.add(b).empty(), "add b");
    expect_eq_ll((long long)set.size(), 82, "all concurrent adds present");

    FingerprintSet reloaded(file);
    expect_true(reloaded.load().empty(), "reload");
    expect_eq_ll((long long)reloaded.size(), 82, "reloaded size");
    expect_true(reloaded.contains(a) && reloaded.contains(b), "reloaded members");
    expect_true(!reloaded.contains(sha256_hex("c")), "non-member");

    // malformed entries are skipped, corrupt files keep prior contents
    expect_true(write_atomic(file, "{\"fingerprints\":[\"" + a + "\",\"junk\",5]}").empty(), "write file");
    FingerprintSet fresh(file);
    expect_true(fresh.load().empty(), "load with junk entries");
    expect_eq_ll((long long)fresh.size(), 1, "junk entries skipped");

    expect_true(write_atomic(file, "{not json").empty(), "write corrupt file");
    expect_true(!fresh.load().empty(), "corrupt file is an error");
    expect_eq_ll((long long)fresh.size(), 1, "previous contents kept on error");

    // load merges: members on disk join, members in memory stay
    expect_true(write_atomic(file, "{\"fingerprints\":[\"" + b + "\"]}").empty(), "write other member");
    expect_true(fresh.load().empty(), "merge load");
    expect_true(fresh.contains(a) && fresh.contains(b), "in-memory and on-disk members both kept");
    {
        FingerprintSet check(file);
        expect_true(check.load().empty() && check.contains(a), "missing member written back");
    }

    // an add whose save failed survives the next load and is persisted later
    {
        const fs::path blocker = dir / "blocked";
        expect_true(write_atomic(blocker, "not a directory").empty(), "write blocker");
        FingerprintSet pending(blocker / "set.json");
        const std::string c = sha256_hex("c");
        expect_true(!pending.add(c).empty(), "save under a regular file fails");
        expect_true(pending.contains(c), "member kept after a failed save");
        (void)pending.load();
        expect_true(pending.contains(c), "failed add survives load");

        fs::remove(blocker, ec);
        fs::create_directories(blocker, ec);
        expect_true(pending.load().empty(), "load with a missing file retries the save");
        FingerprintSet check(blocker / "set.json");
        expect_true(check.load().empty() && check.contains(c), "pending member persisted");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_fingerprint_set: ALL PASSED" << std::endl;
    return 0;
}
