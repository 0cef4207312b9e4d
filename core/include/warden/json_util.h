#pragma once

// json_util.h
//
// Thin RAII + typed-accessor layer over json-c. Every document that crosses a
// trust boundary (artifact metadata, tensor headers, sandbox result files)
// goes through parse(), which enforces a byte cap and a nesting-depth cap.

#include <json-c/json.h>

#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::json {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hand ownership to the caller (e.g. to attach under another object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

constexpr size_t DEFAULT_MAX_BYTES = 4 * 1024 * 1024;
constexpr int DEFAULT_MAX_DEPTH = 16;

// Strict parse: rejects trailing garbage, oversize input, and deep nesting.
Doc parse(const std::string& text,
          size_t max_bytes = DEFAULT_MAX_BYTES,
          int max_depth = DEFAULT_MAX_DEPTH,
          std::string* err = nullptr);

// Typed member access. Return nullopt when the key is absent or mistyped.
std::optional<std::string> get_string(json_object* obj, const char* key);
std::optional<int64_t> get_int(json_object* obj, const char* key);
std::optional<double> get_number(json_object* obj, const char* key);
std::optional<bool> get_bool(json_object* obj, const char* key);
json_object* get_object(json_object* obj, const char* key);
json_object* get_array(json_object* obj, const char* key);

// Numeric array of exactly n elements (n == 0 means any length).
std::optional<std::vector<double>> get_number_array(json_object* obj, const char* key, size_t n = 0);

bool is_number(json_object* v);

// Compact serialization.
std::string to_string(json_object* obj);

// Sorted-key serialization; identical documents always produce identical text.
std::string canonical(json_object* obj);

json_object* new_number_array(const std::vector<double>& values);
json_object* new_string_array(const std::vector<std::string>& values);

} // namespace warden::json
