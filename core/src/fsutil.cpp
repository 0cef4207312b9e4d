#include "warden/fsutil.h"

#include <chrono>
#include <fstream>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace warden {

std::string write_atomic(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return "cannot write " + tmp.string();
    size_t off = 0;
    while (off < body.size()) {
        ssize_t n = ::write(fd, body.data() + off, body.size() - off);
        if (n < 0) {
            ::close(fd);
            std::filesystem::remove(tmp, ec);
            return "write failed " + tmp.string();
        }
        off += (size_t)n;
    }
    (void)::fsync(fd);
    ::close(fd);

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename failed: " + ec.message();
    }
    return "";
}

std::string read_file_bounded(const std::filesystem::path& p, size_t max_bytes, std::string* out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) return "not a regular file: " + p.string();
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) return "stat failed: " + p.string();
    if (sz > max_bytes) return "file exceeds " + std::to_string(max_bytes) + " bytes: " + p.string();

    std::ifstream f(p, std::ios::binary);
    if (!f) return "cannot open " + p.string();
    std::string buf;
    buf.resize((size_t)sz);
    if (sz > 0 && !f.read(&buf[0], (std::streamsize)sz)) return "short read " + p.string();
    // file grew between stat and read
    if (f.peek() != std::ifstream::traits_type::eof()) return "file changed while reading " + p.string();
    if (out) *out = std::move(buf);
    return "";
}

bool remove_quiet(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
    return !std::filesystem::exists(p, ec);
}

int64_t now_ms_i64() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void sleep_ms(int64_t ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace warden
