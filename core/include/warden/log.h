#pragma once
#include <cstdint>
#include <fstream>
#include <string>

namespace warden {

struct RoundHeader {
    std::string round_id;
    std::string profile_id;
    std::string spec_version{"warden-1"};
};

// Append-only audit trail. Every record carries chain_prev/chain_hash where
// chain_hash = SHA256(chain_prev || canonical(record)).
class JsonlLogger {
public:
    JsonlLogger(const RoundHeader& hdr, const std::string& path);
    void event(int64_t seq, const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }
    const std::string& chain_head() const { return chain_prev_; }
    bool ok() const { return out_.good(); }

private:
    RoundHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
};

// Re-walk a log file and check every link. Empty string on success.
std::string verify_chain(const std::string& path);

std::string iso_now();

} // namespace warden
