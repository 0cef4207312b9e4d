#include "warden/archive.h"

#include <zip.h>

namespace warden {

static std::string zip_err_str(zip_error_t* ze) {
    std::string s = zip_error_strerror(ze);
    zip_error_fini(ze);
    return s;
}

std::unique_ptr<ZipArchive> ZipArchive::open(std::string bytes, std::string* err) {
    std::unique_ptr<ZipArchive> a(new ZipArchive());
    a->bytes_ = std::move(bytes);

    zip_error_t ze;
    zip_error_init(&ze);
    zip_source_t* src = zip_source_buffer_create(a->bytes_.data(), a->bytes_.size(), 0, &ze);
    if (!src) {
        if (err) *err = "zip source: " + zip_err_str(&ze);
        return nullptr;
    }
    a->za_ = zip_open_from_source(src, ZIP_RDONLY | ZIP_CHECKCONS, &ze);
    if (!a->za_) {
        zip_source_free(src);
        if (err) *err = "zip open: " + zip_err_str(&ze);
        return nullptr;
    }
    zip_error_fini(&ze);

    zip_int64_t n = zip_get_num_entries(a->za_, 0);
    if (n < 0) {
        if (err) *err = "zip: cannot count entries";
        return nullptr;
    }
    a->entries_.reserve((size_t)n);
    for (zip_int64_t i = 0; i < n; i++) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(a->za_, (zip_uint64_t)i, 0, &st) != 0 ||
            !(st.valid & ZIP_STAT_NAME) || !(st.valid & ZIP_STAT_SIZE)) {
            if (err) *err = "zip: unreadable entry " + std::to_string(i);
            return nullptr;
        }
        a->entries_.push_back(ArchiveEntry{st.name, (uint64_t)st.size});
    }
    return a;
}

ZipArchive::~ZipArchive() {
    // read-only handle; zip_discard never writes back
    if (za_) zip_discard(za_);
}

std::optional<size_t> ZipArchive::find(const std::string& name) const {
    for (size_t i = 0; i < entries_.size(); i++) {
        if (entries_[i].name == name) return i;
    }
    return std::nullopt;
}

std::string ZipArchive::read(size_t index, size_t max_bytes, std::string* out) const {
    if (index >= entries_.size()) return "zip: entry index out of range";
    const ArchiveEntry& e = entries_[index];
    if (e.size > max_bytes) {
        return "zip: entry '" + e.name + "' declares " + std::to_string(e.size) +
               " bytes, limit " + std::to_string(max_bytes);
    }

    zip_file_t* zf = zip_fopen_index(za_, (zip_uint64_t)index, 0);
    if (!zf) return std::string("zip: cannot open '") + e.name + "': " + zip_strerror(za_);

    std::string buf;
    buf.resize((size_t)e.size);
    zip_int64_t got = 0;
    if (e.size > 0) got = zip_fread(zf, &buf[0], e.size);
    // one more byte must not exist: the header lied about the size otherwise
    char extra;
    zip_int64_t more = zip_fread(zf, &extra, 1);
    zip_fclose(zf);

    if (got < 0 || more < 0) return "zip: read failed for '" + e.name + "'";
    if ((uint64_t)got != e.size || more != 0) return "zip: size mismatch for '" + e.name + "'";
    if (out) *out = std::move(buf);
    return "";
}

std::string ZipBackend::list_entries(const std::string& bytes, std::vector<ArchiveEntry>* out) {
    std::string err;
    auto a = ZipArchive::open(bytes, &err);
    if (!a) return err;
    if (out) *out = a->entries();
    return "";
}

std::string ZipBackend::extract_entry(const std::string& bytes, const std::string& name,
                                      size_t max_bytes, std::string* out) {
    std::string err;
    auto a = ZipArchive::open(bytes, &err);
    if (!a) return err;
    auto idx = a->find(name);
    if (!idx) return "zip: no entry '" + name + "'";
    return a->read(*idx, max_bytes, out);
}

std::string write_zip(const std::filesystem::path& path,
                      const std::vector<std::pair<std::string, std::string>>& entries) {
    int zerr = 0;
    zip_t* za = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &zerr);
    if (!za) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, zerr);
        return "zip create " + path.string() + ": " + zip_err_str(&ze);
    }

    for (const auto& kv : entries) {
        // the buffer is referenced until zip_close; entries outlives it
        zip_source_t* src = zip_source_buffer(za, kv.second.data(), kv.second.size(), 0);
        if (!src) {
            std::string msg = zip_strerror(za);
            zip_discard(za);
            return "zip source: " + msg;
        }
        zip_int64_t idx = zip_file_add(za, kv.first.c_str(), src, ZIP_FL_ENC_UTF_8);
        if (idx < 0) {
            std::string msg = zip_strerror(za);
            zip_source_free(src);
            zip_discard(za);
            return "zip add '" + kv.first + "': " + msg;
        }
        (void)zip_set_file_compression(za, (zip_uint64_t)idx, ZIP_CM_DEFLATE, 0);
    }

    if (zip_close(za) != 0) {
        std::string msg = zip_strerror(za);
        zip_discard(za);
        return "zip close: " + msg;
    }
    return "";
}

} // namespace warden
