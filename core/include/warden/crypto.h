#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace warden {

// Incremental SHA-256. Artifact fingerprints are sha256 over the full blob,
// rendered as 64 lowercase hex chars.
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> digest();
    std::string hex_digest();

private:
    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
    bool finished_{false};
};

std::string sha256_hex(const uint8_t* data, size_t n);
inline std::string sha256_hex(const std::string& s) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Fingerprint of a file, streamed in 64 KiB chunks. Empty string on I/O error.
std::string sha256_hex_file(const std::filesystem::path& path);

// True if s looks like a fingerprint (64 lowercase hex chars).
bool is_fingerprint(const std::string& s);

// Constant-time string equality (fingerprint comparison).
bool constant_time_eq(const std::string& a, const std::string& b);

// Cryptographically secure random values (getrandom, /dev/urandom fallback).
uint32_t secure_rand32();
uint64_t secure_rand64();

// Short random hex tag for environment names.
std::string random_tag(size_t hex_chars = 8);

} // namespace warden
