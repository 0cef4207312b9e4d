#include "test_common.h"

#include "warden/crypto.h"

#include <filesystem>
#include <fstream>
#include <set>

using namespace warden;

int main() {
    namespace fs = std::filesystem;

    // FIPS 180-2 vectors
    expect_true(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
    expect_true(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");
    expect_true(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
                    "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
                "sha256 two blocks");

    // incremental == one shot, across block boundaries
    {
        std::string big(1000, 'a');
        Sha256 h;
        for (size_t i = 0; i < big.size(); i += 37) h.update(big.substr(i, 37));
        expect_true(h.hex_digest() == sha256_hex(big), "incremental digest");
    }

    fs::path dir = fs::temp_directory_path() / "warden_test_crypto";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    {
        std::string blob(200 * 1024, '\0');
        for (size_t i = 0; i < blob.size(); i++) blob[i] = (char)(i * 31 + 7);
        std::ofstream(dir / "blob", std::ios::binary).write(blob.data(), (std::streamsize)blob.size());
        expect_true(sha256_hex_file(dir / "blob") == sha256_hex(blob), "file digest matches memory digest");
        expect_true(sha256_hex_file(dir / "missing").empty(), "missing file gives empty digest");
    }

    expect_true(is_fingerprint(sha256_hex("x")), "digest is a fingerprint");
    expect_true(!is_fingerprint("ABC"), "short string is not a fingerprint");
    expect_true(!is_fingerprint(std::string(64, 'G')), "non-hex is not a fingerprint");
    expect_true(!is_fingerprint(std::string(64, 'A')), "upper-case hex is not a fingerprint");

    expect_true(constant_time_eq("abc", "abc"), "ct equal");
    expect_true(!constant_time_eq("abc", "abd"), "ct differ");
    expect_true(!constant_time_eq("abc", "abcd"), "ct length differ");

    std::set<std::string> tags;
    for (int i = 0; i < 16; i++) tags.insert(random_tag());
    expect_true(tags.size() > 1, "random tags vary");
    expect_eq_ll((long long)random_tag(12).size(), 12, "tag length");

    fs::remove_all(dir, ec);
    std::cerr << "test_crypto: ALL PASSED" << std::endl;
    return 0;
}
