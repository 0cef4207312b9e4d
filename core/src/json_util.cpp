#include "warden/json_util.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace warden::json {

Doc parse(const std::string& text, size_t max_bytes, int max_depth, std::string* err) {
    if (text.size() > max_bytes) {
        if (err) *err = "json exceeds " + std::to_string(max_bytes) + " bytes";
        return Doc{};
    }
    if (text.size() > static_cast<size_t>(INT_MAX)) {
        if (err) *err = "json too large";
        return Doc{};
    }
    json_tokener* tok = json_tokener_new_ex(max_depth);
    if (!tok) {
        if (err) *err = "json_tokener_new_ex failed";
        return Doc{};
    }
    json_tokener_set_flags(tok, JSON_TOKENER_STRICT);
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(), static_cast<int>(text.size()));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success || !obj) {
        if (obj) json_object_put(obj);
        if (err) *err = std::string("json parse: ") + json_tokener_error_desc(jerr);
        return Doc{};
    }
    // only whitespace may follow the document
    for (size_t i = consumed; i < text.size(); i++) {
        char c = text[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            json_object_put(obj);
            if (err) *err = "json parse: trailing data";
            return Doc{};
        }
    }
    return Doc{obj};
}

static json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

bool is_number(json_object* v) {
    return v && (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int));
}

std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

std::optional<double> get_number(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!is_number(v)) return std::nullopt;
    return json_object_get_double(v);
}

std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

json_object* get_object(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_object)) return nullptr;
    return v;
}

json_object* get_array(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_array)) return nullptr;
    return v;
}

std::optional<std::vector<double>> get_number_array(json_object* obj, const char* key, size_t n) {
    json_object* arr = get_array(obj, key);
    if (!arr) return std::nullopt;
    const size_t len = json_object_array_length(arr);
    if (n != 0 && len != n) return std::nullopt;
    std::vector<double> out;
    out.reserve(len);
    for (size_t i = 0; i < len; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!is_number(el)) return std::nullopt;
        double d = json_object_get_double(el);
        if (!std::isfinite(d)) return std::nullopt;
        out.push_back(d);
    }
    return out;
}

std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

json_object* new_number_array(const std::vector<double>& values) {
    json_object* arr = json_object_new_array();
    for (double v : values) json_object_array_add(arr, json_object_new_double(v));
    return arr;
}

json_object* new_string_array(const std::vector<std::string>& values) {
    json_object* arr = json_object_new_array();
    for (const auto& s : values) json_object_array_add(arr, json_object_new_string(s.c_str()));
    return arr;
}

} // namespace warden::json
