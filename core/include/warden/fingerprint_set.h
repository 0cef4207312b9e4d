#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace warden {

// Durable, append-only set of artifact fingerprints backed by one JSON file
// ({"fingerprints": [...]}). Used for the Blacklist and the verified set.
//
// Every add() that changes membership is persisted before it returns; the
// file is replaced by atomic rename, so concurrent readers never observe a
// torn write. All members are guarded by one mutex.
class FingerprintSet {
public:
    explicit FingerprintSet(std::filesystem::path file);

    // Merge the file into the in-memory set. A missing file adds nothing.
    // Members the file lacks (an add() whose save failed) are saved again.
    // Returns empty string on success, error message otherwise; in-memory
    // members are never dropped.
    std::string load();

    bool contains(const std::string& fp) const;

    // Add and persist. Returns empty string on success (including when the
    // fingerprint was already present), error message if the save failed.
    std::string add(const std::string& fp);

    size_t size() const;
    std::vector<std::string> snapshot() const;
    const std::filesystem::path& file() const { return file_; }

private:
    std::string save_locked() const;

    std::filesystem::path file_;
    mutable std::mutex mu_;
    std::set<std::string> items_;
};

} // namespace warden
