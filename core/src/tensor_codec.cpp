#include "warden/tensor_codec.h"
#include "warden/json_util.h"

#include <algorithm>
#include <cstring>
#include <limits>
#include <mutex>

namespace warden {

const char* dtype_name(DType d) {
    return d == DType::F64 ? "F64" : "F32";
}

size_t dtype_size(DType d) {
    return d == DType::F64 ? 8 : 4;
}

size_t Tensor::numel() const {
    size_t n = 1;
    for (int64_t d : shape) n *= (size_t)d;
    return n;
}

static uint64_t load_le64(const unsigned char* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) v = (v << 8) | p[i];
    return v;
}

static uint32_t load_le32(const unsigned char* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

static void store_le64(uint64_t v, std::string* out) {
    for (int i = 0; i < 8; i++) out->push_back((char)((v >> (8 * i)) & 0xff));
}

static void store_le32(uint32_t v, std::string* out) {
    for (int i = 0; i < 4; i++) out->push_back((char)((v >> (8 * i)) & 0xff));
}

static bool valid_name(const std::string& s) {
    if (s.empty() || s.size() > 256) return false;
    for (unsigned char c : s) {
        if (c < 0x20 || c > 0x7e) return false;
    }
    return true;
}

namespace {

struct Slot {
    std::string name;
    uint64_t begin;
    uint64_t end;
};

} // namespace

static std::string parse_entry(const std::string& name, json_object* spec, uint64_t data_len,
                               Tensor* t, Slot* slot) {
    if (!json_object_is_type(spec, json_type_object)) return "tensor '" + name + "': not an object";

    int nkeys = 0;
    json_object_object_foreach(spec, k, v) {
        (void)v;
        nkeys++;
        if (std::strcmp(k, "dtype") != 0 && std::strcmp(k, "shape") != 0 && std::strcmp(k, "data_offsets") != 0)
            return "tensor '" + name + "': unexpected key '" + k + "'";
    }
    if (nkeys != 3) return "tensor '" + name + "': expected dtype, shape, data_offsets";

    auto dt = json::get_string(spec, "dtype");
    if (!dt) return "tensor '" + name + "': dtype must be a string";
    if (*dt == "F32") t->dtype = DType::F32;
    else if (*dt == "F64") t->dtype = DType::F64;
    else return "tensor '" + name + "': unsupported dtype '" + *dt + "'";

    json_object* shape = json::get_array(spec, "shape");
    if (!shape) return "tensor '" + name + "': shape must be an array";
    const size_t rank = json_object_array_length(shape);
    if (rank > kMaxTensorRank) return "tensor '" + name + "': rank too high";
    uint64_t numel = 1;
    t->shape.clear();
    for (size_t i = 0; i < rank; i++) {
        json_object* d = json_object_array_get_idx(shape, i);
        if (!d || !json_object_is_type(d, json_type_int)) return "tensor '" + name + "': shape must hold integers";
        int64_t dim = json_object_get_int64(d);
        if (dim < 0 || dim > (int64_t)std::numeric_limits<uint32_t>::max())
            return "tensor '" + name + "': bad dimension";
        if (dim != 0 && numel > std::numeric_limits<uint64_t>::max() / (uint64_t)dim)
            return "tensor '" + name + "': element count overflows";
        numel *= (uint64_t)dim;
        t->shape.push_back(dim);
    }

    json_object* offs = json::get_array(spec, "data_offsets");
    if (!offs || json_object_array_length(offs) != 2) return "tensor '" + name + "': data_offsets must be [begin, end]";
    json_object* b = json_object_array_get_idx(offs, 0);
    json_object* e = json_object_array_get_idx(offs, 1);
    if (!b || !e || !json_object_is_type(b, json_type_int) || !json_object_is_type(e, json_type_int))
        return "tensor '" + name + "': data_offsets must hold integers";
    int64_t bi = json_object_get_int64(b);
    int64_t ei = json_object_get_int64(e);
    if (bi < 0 || ei < bi || (uint64_t)ei > data_len) return "tensor '" + name + "': offsets out of range";

    const uint64_t width = dtype_size(t->dtype);
    if (numel > data_len / width || (uint64_t)(ei - bi) != numel * width)
        return "tensor '" + name + "': byte length does not match shape";

    slot->name = name;
    slot->begin = (uint64_t)bi;
    slot->end = (uint64_t)ei;
    return "";
}

std::string decode_tensors(const std::string& bytes, TensorFile* out) {
    if (bytes.size() < 8) return "tensors: truncated header length";
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const uint64_t hlen = load_le64(p);
    if (hlen == 0 || hlen > kMaxTensorHeaderBytes) return "tensors: header length out of range";
    if (hlen > bytes.size() - 8) return "tensors: header exceeds file";

    const std::string header = bytes.substr(8, (size_t)hlen);
    const uint64_t data_off = 8 + hlen;
    const uint64_t data_len = bytes.size() - data_off;

    std::string err;
    json::Doc d = json::parse(header, kMaxTensorHeaderBytes, 4, &err);
    if (!d) return "tensors: " + err;
    if (!json_object_is_type(d.root, json_type_object)) return "tensors: header is not an object";

    TensorFile tf;
    std::vector<Slot> slots;
    json_object_object_foreach(d.root, key, spec) {
        const std::string name = key;
        if (name == "__metadata__") {
            if (!json_object_is_type(spec, json_type_object)) return "tensors: __metadata__ must be an object";
            json_object_object_foreach(spec, mk, mv) {
                if (!json_object_is_type(mv, json_type_string)) return "tensors: __metadata__ values must be strings";
                tf.metadata[mk] = json_object_get_string(mv);
            }
            continue;
        }
        if (!valid_name(name)) return "tensors: invalid tensor name";
        if (tf.tensors.size() >= kMaxTensorCount) return "tensors: too many tensors";

        Tensor t;
        Slot s;
        err = parse_entry(name, spec, data_len, &t, &s);
        if (!err.empty()) return "tensors: " + err;
        tf.tensors.emplace(name, std::move(t));
        slots.push_back(std::move(s));
    }

    // offsets must tile the data section exactly: no overlap, no gap, no tail
    std::sort(slots.begin(), slots.end(), [](const Slot& a, const Slot& b) {
        return a.begin != b.begin ? a.begin < b.begin : a.end < b.end;
    });
    uint64_t cursor = 0;
    for (const auto& s : slots) {
        if (s.begin != cursor) {
            return s.begin < cursor ? "tensors: overlapping data for '" + s.name + "'"
                                    : "tensors: gap before '" + s.name + "'";
        }
        cursor = s.end;
    }
    if (cursor != data_len) return "tensors: trailing bytes after data";

    for (const auto& s : slots) {
        Tensor& t = tf.tensors[s.name];
        const unsigned char* src = p + data_off + s.begin;
        const size_t n = t.numel();
        t.data.resize(n);
        if (t.dtype == DType::F32) {
            for (size_t i = 0; i < n; i++) {
                uint32_t bits = load_le32(src + 4 * i);
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                t.data[i] = (double)f;
            }
        } else {
            for (size_t i = 0; i < n; i++) {
                uint64_t bits = load_le64(src + 8 * i);
                double v;
                std::memcpy(&v, &bits, sizeof(v));
                t.data[i] = v;
            }
        }
    }

    if (out) *out = std::move(tf);
    return "";
}

std::string encode_tensors(const TensorFile& tf, std::string* out) {
    if (tf.tensors.size() > kMaxTensorCount) return "tensors: too many tensors";

    json::Doc hdr(json_object_new_object());
    uint64_t cursor = 0;
    for (const auto& kv : tf.tensors) {
        const Tensor& t = kv.second;
        if (!valid_name(kv.first) || kv.first == "__metadata__") return "tensors: invalid tensor name '" + kv.first + "'";
        if (t.shape.size() > kMaxTensorRank) return "tensors: rank too high for '" + kv.first + "'";
        for (int64_t dim : t.shape) {
            if (dim < 0) return "tensors: negative dimension in '" + kv.first + "'";
        }
        if (t.data.size() != t.numel()) return "tensors: data size does not match shape for '" + kv.first + "'";

        json_object* spec = json_object_new_object();
        json_object_object_add(spec, "dtype", json_object_new_string(dtype_name(t.dtype)));
        json_object* shape = json_object_new_array();
        for (int64_t dim : t.shape) json_object_array_add(shape, json_object_new_int64(dim));
        json_object_object_add(spec, "shape", shape);
        const uint64_t len = t.numel() * dtype_size(t.dtype);
        json_object* offs = json_object_new_array();
        json_object_array_add(offs, json_object_new_int64((int64_t)cursor));
        json_object_array_add(offs, json_object_new_int64((int64_t)(cursor + len)));
        json_object_object_add(spec, "data_offsets", offs);
        json_object_object_add(hdr.root, kv.first.c_str(), spec);
        cursor += len;
    }
    if (!tf.metadata.empty()) {
        json_object* meta = json_object_new_object();
        for (const auto& kv : tf.metadata) {
            json_object_object_add(meta, kv.first.c_str(), json_object_new_string(kv.second.c_str()));
        }
        json_object_object_add(hdr.root, "__metadata__", meta);
    }

    std::string header = json::canonical(hdr.root);
    while (header.size() % 8 != 0) header.push_back(' ');

    std::string buf;
    buf.reserve(8 + header.size() + (size_t)cursor);
    store_le64(header.size(), &buf);
    buf += header;
    for (const auto& kv : tf.tensors) {
        const Tensor& t = kv.second;
        for (double v : t.data) {
            if (t.dtype == DType::F32) {
                float f = (float)v;
                uint32_t bits;
                std::memcpy(&bits, &f, sizeof(bits));
                store_le32(bits, &buf);
            } else {
                uint64_t bits;
                std::memcpy(&bits, &v, sizeof(bits));
                store_le64(bits, &buf);
            }
        }
    }
    if (out) *out = std::move(buf);
    return "";
}

// ---- capability probe ----

static std::string canned(const std::string& header, const std::string& data) {
    std::string b;
    store_le64(header.size(), &b);
    return b + header + data;
}

static CodecCapability run_probe() {
    CodecCapability cap;

    const uint32_t one = 1;
    unsigned char first;
    std::memcpy(&first, &one, 1);
    if (first != 1) {
        cap.reason = "host is not little-endian";
        return cap;
    }
    if (!std::numeric_limits<float>::is_iec559 || !std::numeric_limits<double>::is_iec559) {
        cap.reason = "host floating point is not IEEE-754";
        return cap;
    }

    // 1.5f, -2.0f as F32 then 0.1 as F64
    const std::string data("\x00\x00\xc0\x3f" "\x00\x00\x00\xc0"
                           "\x9a\x99\x99\x99\x99\x99\xb9\x3f", 16);
    const std::string good =
        R"({"a":{"data_offsets":[0,8],"dtype":"F32","shape":[2]},)"
        R"("b":{"data_offsets":[8,16],"dtype":"F64","shape":[1,1]}})";
    TensorFile tf;
    std::string err = decode_tensors(canned(good, data), &tf);
    if (!err.empty()) {
        cap.reason = "canned container refused: " + err;
        return cap;
    }
    const double expect_b = 0.1;
    if (tf.tensors.size() != 2 || tf.tensors["a"].data.size() != 2 ||
        tf.tensors["a"].data[0] != 1.5 || tf.tensors["a"].data[1] != -2.0 ||
        tf.tensors["b"].data.size() != 1 ||
        std::memcmp(&tf.tensors["b"].data[0], &expect_b, sizeof(double)) != 0) {
        cap.reason = "canned container decoded inexactly";
        return cap;
    }

    struct Hostile { const char* what; std::string blob; };
    const Hostile hostile[] = {
        {"object dtype", canned(R"({"a":{"data_offsets":[0,8],"dtype":{"module":"os","name":"system"},"shape":[2]}})",
                                data.substr(0, 8))},
        {"pickle dtype", canned(R"({"a":{"data_offsets":[0,8],"dtype":"PICKLE","shape":[2]}})", data.substr(0, 8))},
        {"nested header", canned(R"({"a":{"data_offsets":[0,8],"dtype":"F32","shape":[2],"extra":{"x":{}}}})",
                                 data.substr(0, 8))},
        {"overlap", canned(R"({"a":{"data_offsets":[0,8],"dtype":"F32","shape":[2]},)"
                           R"("b":{"data_offsets":[4,12],"dtype":"F32","shape":[2]}})", data.substr(0, 12))},
        {"trailing bytes", canned(R"({"a":{"data_offsets":[0,8],"dtype":"F32","shape":[2]}})", data)},
        {"header overflow", std::string("\xff\xff\xff\xff\xff\xff\xff\xff", 8) + "{}"},
    };
    for (const auto& h : hostile) {
        if (decode_tensors(h.blob, nullptr).empty()) {
            cap.reason = std::string("decoder accepted hostile container: ") + h.what;
            return cap;
        }
    }

    cap.ok = true;
    return cap;
}

const CodecCapability& tensor_codec_probe() {
    static std::once_flag once;
    static CodecCapability cap;
    std::call_once(once, [] { cap = run_probe(); });
    return cap;
}

} // namespace warden
