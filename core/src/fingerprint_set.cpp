#include "warden/fingerprint_set.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"

#include <iostream>

namespace warden {

static constexpr size_t kMaxSetFileBytes = 64 * 1024 * 1024;

FingerprintSet::FingerprintSet(std::filesystem::path file) : file_(std::move(file)) {}

std::string FingerprintSet::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.empty() ? "" : save_locked();
    }

    std::string body;
    std::string err = read_file_bounded(file_, kMaxSetFileBytes, &body);
    if (!err.empty()) return err;

    json::Doc d = json::parse(body, kMaxSetFileBytes, 4, &err);
    if (!d) return file_.string() + ": " + err;
    json_object* arr = json::get_array(d.root, "fingerprints");
    if (!arr) return file_.string() + ": missing fingerprints array";

    std::set<std::string> loaded;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!el || !json_object_is_type(el, json_type_string)) continue;
        std::string fp = json_object_get_string(el);
        if (!is_fingerprint(fp)) {
            std::cerr << "[warn] " << file_.string() << ": skipping malformed fingerprint\n";
            continue;
        }
        loaded.insert(std::move(fp));
    }

    std::lock_guard<std::mutex> lk(mu_);
    const size_t on_disk = loaded.size();
    items_.insert(loaded.begin(), loaded.end());
    // members whose save failed earlier are written back now
    if (items_.size() > on_disk) return save_locked();
    return "";
}

bool FingerprintSet::contains(const std::string& fp) const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.count(fp) != 0;
}

std::string FingerprintSet::add(const std::string& fp) {
    if (!is_fingerprint(fp)) return "not a fingerprint: " + fp;
    std::lock_guard<std::mutex> lk(mu_);
    if (!items_.insert(fp).second) return "";
    return save_locked();
}

size_t FingerprintSet::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
}

std::vector<std::string> FingerprintSet::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<std::string>(items_.begin(), items_.end());
}

std::string FingerprintSet::save_locked() const {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "fingerprints",
                           json::new_string_array(std::vector<std::string>(items_.begin(), items_.end())));
    return write_atomic(file_, json::canonical(d.root) + "\n");
}

} // namespace warden
