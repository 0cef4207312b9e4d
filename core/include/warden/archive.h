#pragma once

// archive.h
//
// ZIP access for submitted artifacts through libzip. Reading happens from an
// in-memory buffer only: nothing is ever extracted to the filesystem. The
// index (names + declared uncompressed sizes) is available without
// decompressing any entry.

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

typedef struct zip zip_t;

namespace warden {

struct ArchiveEntry {
    std::string name;
    uint64_t size{0};   // declared uncompressed size
};

class ZipArchive {
public:
    // Open an archive held in memory. Takes ownership of the bytes.
    static std::unique_ptr<ZipArchive> open(std::string bytes, std::string* err);
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    const std::vector<ArchiveEntry>& entries() const { return entries_; }
    std::optional<size_t> find(const std::string& name) const;

    // Decompress one entry. Refuses entries whose declared size exceeds
    // max_bytes before reading, and stops if the stream runs past it.
    std::string read(size_t index, size_t max_bytes, std::string* out) const;

private:
    ZipArchive() = default;

    std::string bytes_;        // must outlive za_
    zip_t* za_{nullptr};
    std::vector<ArchiveEntry> entries_;
};

// Seam used by the integrity gate; tests substitute a spy.
class ArchiveBackend {
public:
    virtual ~ArchiveBackend() = default;

    // Parse the central directory only. Empty string on success.
    virtual std::string list_entries(const std::string& bytes, std::vector<ArchiveEntry>* out) = 0;

    // Decompress one named entry into memory. Empty string on success.
    virtual std::string extract_entry(const std::string& bytes, const std::string& name,
                                      size_t max_bytes, std::string* out) = 0;
};

class ZipBackend : public ArchiveBackend {
public:
    std::string list_entries(const std::string& bytes, std::vector<ArchiveEntry>* out) override;
    std::string extract_entry(const std::string& bytes, const std::string& name,
                              size_t max_bytes, std::string* out) override;
};

// Write a fresh archive at path (truncating). Entries are stored deflated in
// the given order. Names are written verbatim. Empty string on success.
std::string write_zip(const std::filesystem::path& path,
                      const std::vector<std::pair<std::string, std::string>>& entries);

} // namespace warden
