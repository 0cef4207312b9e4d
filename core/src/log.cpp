#include "warden/log.h"
#include "warden/crypto.h"
#include "warden/json_util.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace warden {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

static const std::string kGenesis(64, '0');

// Record body shared by the hashed form and the written line.
static json_object* make_record(const RoundHeader& hdr, int64_t seq, const std::string& name,
                                const std::string& payload_json, const std::string& ts) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));

    json::Doc p = json::parse(payload_json);
    json_object_object_add(rec, "payload",
                           p ? p.release() : json_object_new_string(payload_json.c_str()));

    json_object_object_add(rec, "profile_id", json_object_new_string(hdr.profile_id.c_str()));
    json_object_object_add(rec, "round_id", json_object_new_string(hdr.round_id.c_str()));
    json_object_object_add(rec, "spec_version", json_object_new_string(hdr.spec_version.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64(seq));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));
    return rec;
}

JsonlLogger::JsonlLogger(const RoundHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(kGenesis) {
    if (!out_) std::cerr << "[warn] cannot open audit log " << path << "\n";
}

void JsonlLogger::event(int64_t seq, const std::string& name, const std::string& payload_json) {
    const std::string ts = iso_now();

    json::Doc rec(make_record(hdr_, seq, name, payload_json, ts));
    const std::string record = json::canonical(rec.root);
    const std::string chain_hash = sha256_hex(chain_prev_ + record);

    json_object_object_add(rec.root, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(rec.root, "chain_prev", json_object_new_string(chain_prev_.c_str()));

    out_ << json::canonical(rec.root) << "\n";
    out_.flush();
    chain_prev_ = chain_hash;
}

std::string verify_chain(const std::string& path) {
    std::ifstream in(path);
    if (!in) return "cannot open " + path;

    std::string prev = kGenesis;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        std::string perr;
        json::Doc d = json::parse(line, json::DEFAULT_MAX_BYTES, 32, &perr);
        if (!d) return "line " + std::to_string(lineno) + ": " + perr;

        auto got_prev = json::get_string(d.root, "chain_prev");
        auto got_hash = json::get_string(d.root, "chain_hash");
        if (!got_prev || !got_hash) return "line " + std::to_string(lineno) + ": missing chain fields";
        if (*got_prev != prev) return "line " + std::to_string(lineno) + ": chain_prev mismatch";

        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        const std::string expect = sha256_hex(prev + json::canonical(d.root));
        if (!constant_time_eq(expect, *got_hash))
            return "line " + std::to_string(lineno) + ": chain_hash mismatch";
        prev = *got_hash;
    }
    return "";
}

} // namespace warden
