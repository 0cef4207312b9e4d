#pragma once

// documents.h
//
// The two files the evaluation binary leaves in the shared directory:
//   result.json               EVAL mode
//   verification_result.json  VERIFY mode
// Both are produced inside the sandbox and therefore parsed as untrusted.

#include "warden/types.h"

#include <optional>
#include <string>

namespace warden {

constexpr const char* kResultFile = "result.json";
constexpr const char* kVerificationFile = "verification_result.json";
constexpr size_t kMaxDocumentBytes = 1024 * 1024;

struct ResultDoc {
    Uid uid{0};
    bool success{false};
    double t{0.0};
    double e{0.0};
    double score{0.0};
    std::optional<std::string> error;
    bool is_fake_model{false};
    std::string fake_reason;
    std::string inspection_json;   // empty when absent
};

struct VerificationDoc {
    Uid uid{0};
    bool is_fake_model{false};
    std::string fake_reason;
    bool missing_metadata{false};
    std::string rejection_reason;
    std::string inspection_json{"{}"};
};

std::string result_doc_to_json(const ResultDoc& d);
// Empty string on success. Missing required keys or wrong types fail.
std::string result_doc_from_json(const std::string& text, ResultDoc* out);

std::string verification_doc_to_json(const VerificationDoc& d);
std::string verification_doc_from_json(const std::string& text, VerificationDoc* out);

VerificationDoc verification_doc_from_verdict(Uid uid, const VerificationVerdict& v);
VerificationVerdict verdict_from_doc(const VerificationDoc& d);

struct FinalizedResult {
    EvaluationResult result;
    bool adversarial{false};
    std::string reason;
    std::string evidence_json{"{}"};
};

// The one score policy for every evaluation path:
//   fake flag                          -> 0, adversarial
//   non-finite or out-of-range score   -> 0, adversarial
//   error present                      -> 0
//   error-free zero                    -> floor
FinalizedResult finalize_result(const ResultDoc& doc, Uid uid, double floor = 0.01);

} // namespace warden
