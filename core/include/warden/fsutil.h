#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace warden {

// Write body to dst via <dst>.tmp + rename so readers never see a torn file.
// Returns empty string on success, error message otherwise.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Read a whole file, refusing anything larger than max_bytes.
// Returns empty string on success, error message otherwise.
std::string read_file_bounded(const std::filesystem::path& p, size_t max_bytes, std::string* out);

// Best-effort removal; true if the path no longer exists.
bool remove_quiet(const std::filesystem::path& p);

int64_t now_ms_i64();
void sleep_ms(int64_t ms);

} // namespace warden
