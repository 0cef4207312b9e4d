#pragma once

// tensor_codec.h
//
// Restricted weight container ("policy.tensors"). The only thing it can
// express is a set of named numeric tensors plus a flat string map:
//
//   u64 LE  header length N
//   N bytes JSON header  { "<name>": {"dtype": "F32"|"F64",
//                                     "shape": [d0, ...],
//                                     "data_offsets": [begin, end]},
//                          "__metadata__": {"k": "v", ...} }
//   data section, raw little-endian values
//
// Offsets are relative to the data section. Decoding rejects unknown keys,
// unknown dtypes, overlapping or out-of-range offsets, gaps and trailing
// bytes. There is no type tag that could name an object to construct.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace warden {

enum class DType { F32, F64 };

const char* dtype_name(DType d);
size_t dtype_size(DType d);

struct Tensor {
    DType dtype{DType::F32};
    std::vector<int64_t> shape;
    std::vector<double> data;   // row-major; F32 values widened exactly

    size_t numel() const;
};

struct TensorFile {
    std::map<std::string, Tensor> tensors;
    std::map<std::string, std::string> metadata;
};

constexpr size_t kMaxTensorHeaderBytes = 1024 * 1024;
constexpr size_t kMaxTensorCount = 256;
constexpr size_t kMaxTensorRank = 4;

// Returns empty string on success, error message otherwise.
std::string decode_tensors(const std::string& bytes, TensorFile* out);

// F32 tensors are narrowed from their double values.
std::string encode_tensors(const TensorFile& tf, std::string* out);

struct CodecCapability {
    bool ok{false};
    std::string reason;
};

// One-time self test of the decoder on this host: little-endian IEEE-754,
// a canned valid container decodes bit-exact, and canned hostile containers
// are all refused. Computed once per process.
const CodecCapability& tensor_codec_probe();

} // namespace warden
