#include "warden/crypto.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace warden {

namespace {

constexpr std::array<uint32_t, 64> K = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
inline uint32_t bsig0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t bsig1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t ssig0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t ssig1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

void compress(uint32_t state[8], const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (uint32_t(block[i*4+0]) << 24) |
               (uint32_t(block[i*4+1]) << 16) |
               (uint32_t(block[i*4+2]) << 8) |
               (uint32_t(block[i*4+3]) << 0);
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ssig1(w[i-2]) + w[i-7] + ssig0(w[i-15]) + w[i-16];
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + bsig1(e) + ch(e,f,g) + K[i] + w[i];
        uint32_t t2 = bsig0(a) + maj(a,b,c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a; state[1] += b; state[2] += c; state[3] += d;
    state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

std::string to_hex(const uint8_t* p, size_t n) {
    static const char* hexd = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = hexd[(p[i] >> 4) & 0xF];
        out[i*2+1] = hexd[p[i] & 0xF];
    }
    return out;
}

bool fill_random(void* dst, size_t n) {
#if defined(__linux__)
    if (::getrandom(dst, n, 0) == (ssize_t)n) return true;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (!f) return false;
    size_t got = std::fread(dst, 1, n, f);
    std::fclose(f);
    return got == n;
}

} // namespace

Sha256::Sha256() {
    static const uint32_t init[8] = {
        0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
        0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u
    };
    std::memcpy(h_, init, sizeof(h_));
}

void Sha256::update(const uint8_t* data, size_t n) {
    if (finished_ || n == 0) return;
    total_ += n;
    if (buf_len_ > 0) {
        size_t take = std::min(n, sizeof(buf_) - buf_len_);
        std::memcpy(buf_ + buf_len_, data, take);
        buf_len_ += take;
        data += take;
        n -= take;
        if (buf_len_ == sizeof(buf_)) {
            compress(h_, buf_);
            buf_len_ = 0;
        }
    }
    while (n >= 64) {
        compress(h_, data);
        data += 64;
        n -= 64;
    }
    if (n > 0) {
        std::memcpy(buf_, data, n);
        buf_len_ = n;
    }
}

std::array<uint8_t, 32> Sha256::digest() {
    if (!finished_) {
        const uint64_t bitlen = total_ * 8ULL;
        uint8_t pad[128];
        std::memset(pad, 0, sizeof(pad));
        pad[0] = 0x80;
        size_t pad_len = (buf_len_ < 56) ? (56 - buf_len_) : (120 - buf_len_);
        for (int i = 0; i < 8; i++) {
            pad[pad_len + i] = uint8_t((bitlen >> (56 - 8 * i)) & 0xff);
        }
        // update() would count the padding into total_, so feed blocks directly
        size_t n = pad_len + 8;
        const uint8_t* p = pad;
        while (n > 0) {
            size_t take = std::min(n, sizeof(buf_) - buf_len_);
            std::memcpy(buf_ + buf_len_, p, take);
            buf_len_ += take;
            p += take;
            n -= take;
            if (buf_len_ == sizeof(buf_)) {
                compress(h_, buf_);
                buf_len_ = 0;
            }
        }
        finished_ = true;
    }
    std::array<uint8_t, 32> out{};
    for (int i = 0; i < 8; i++) {
        out[i*4+0] = uint8_t((h_[i] >> 24) & 0xff);
        out[i*4+1] = uint8_t((h_[i] >> 16) & 0xff);
        out[i*4+2] = uint8_t((h_[i] >> 8) & 0xff);
        out[i*4+3] = uint8_t((h_[i] >> 0) & 0xff);
    }
    return out;
}

std::string Sha256::hex_digest() {
    auto d = digest();
    return to_hex(d.data(), d.size());
}

std::string sha256_hex(const uint8_t* data, size_t n) {
    Sha256 h;
    h.update(data, n);
    return h.hex_digest();
}

std::string sha256_hex_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    Sha256 h;
    std::vector<char> buf(64 * 1024);
    while (f) {
        f.read(buf.data(), (std::streamsize)buf.size());
        std::streamsize got = f.gcount();
        if (got > 0) h.update(reinterpret_cast<const uint8_t*>(buf.data()), (size_t)got);
    }
    if (f.bad()) return "";
    return h.hex_digest();
}

bool is_fingerprint(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!ok) return false;
    }
    return true;
}

bool constant_time_eq(const std::string& a, const std::string& b) {
    const size_t len = (a.size() >= b.size()) ? a.size() : b.size();
    volatile uint8_t v = (a.size() != b.size()) ? 1 : 0;
    for (size_t i = 0; i < len; i++) {
        uint8_t ca = (i < a.size()) ? (uint8_t)a[i] : 0;
        uint8_t cb = (i < b.size()) ? (uint8_t)b[i] : 0;
        v |= ca ^ cb;
    }
    return v == 0;
}

uint32_t secure_rand32() {
    uint32_t v = 0;
    if (fill_random(&v, sizeof(v))) return v;
    // no fallback to a predictable seed
    std::fprintf(stderr, "FATAL: secure_rand32() cannot obtain random bytes\n");
    std::abort();
}

uint64_t secure_rand64() {
    uint64_t v = 0;
    if (fill_random(&v, sizeof(v))) return v;
    std::fprintf(stderr, "FATAL: secure_rand64() cannot obtain random bytes\n");
    std::abort();
}

std::string random_tag(size_t hex_chars) {
    std::vector<uint8_t> raw((hex_chars + 1) / 2);
    for (size_t i = 0; i < raw.size(); i += 4) {
        uint32_t r = secure_rand32();
        for (size_t j = 0; j < 4 && i + j < raw.size(); j++) {
            raw[i + j] = uint8_t((r >> (8 * j)) & 0xff);
        }
    }
    return to_hex(raw.data(), raw.size()).substr(0, hex_chars);
}

} // namespace warden
