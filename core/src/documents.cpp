#include "warden/documents.h"
#include "warden/json_util.h"

#include <cmath>

namespace warden {

static json_object* parse_inspection(const std::string& text) {
    if (text.empty()) return nullptr;
    json::Doc d = json::parse(text, kMaxDocumentBytes, json::DEFAULT_MAX_DEPTH);
    if (!d || !json_object_is_type(d.root, json_type_object)) return nullptr;
    return d.release();
}

static std::string inspection_text(json_object* root) {
    json_object* v = json::get_object(root, "inspection_results");
    return v ? json::canonical(v) : std::string();
}

std::string result_doc_to_json(const ResultDoc& d) {
    json::Doc doc(json_object_new_object());
    json_object* o = doc.root;
    json_object_object_add(o, "uid", json_object_new_int64(d.uid));
    json_object_object_add(o, "success", json_object_new_boolean(d.success));
    json_object_object_add(o, "t", json_object_new_double(std::isfinite(d.t) ? d.t : 0.0));
    json_object_object_add(o, "e", json_object_new_double(std::isfinite(d.e) ? d.e : 0.0));
    json_object_object_add(o, "score", json_object_new_double(std::isfinite(d.score) ? d.score : 0.0));
    if (d.error) json_object_object_add(o, "error", json_object_new_string(d.error->c_str()));
    if (d.is_fake_model) {
        json_object_object_add(o, "is_fake_model", json_object_new_boolean(1));
        json_object_object_add(o, "fake_reason", json_object_new_string(d.fake_reason.c_str()));
    }
    if (json_object* insp = parse_inspection(d.inspection_json)) {
        json_object_object_add(o, "inspection_results", insp);
    }
    return json::to_string(o);
}

std::string result_doc_from_json(const std::string& text, ResultDoc* out) {
    if (!out) return "null output";
    std::string err;
    json::Doc d = json::parse(text, kMaxDocumentBytes, json::DEFAULT_MAX_DEPTH, &err);
    if (!d) return "result document: " + err;
    if (!json_object_is_type(d.root, json_type_object)) return "result document is not an object";

    auto uid = json::get_int(d.root, "uid");
    auto success = json::get_bool(d.root, "success");
    auto t = json::get_number(d.root, "t");
    auto e = json::get_number(d.root, "e");
    auto score = json::get_number(d.root, "score");
    if (!uid || !success || !t || !e || !score) return "result document missing uid/success/t/e/score";

    ResultDoc r;
    r.uid = (Uid)*uid;
    r.success = *success;
    r.t = *t;
    r.e = *e;
    r.score = *score;

    json_object* v = nullptr;
    if (json_object_object_get_ex(d.root, "error", &v) && v && !json_object_is_type(v, json_type_null)) {
        r.error = json_object_is_type(v, json_type_string) ? json_object_get_string(v) : json::to_string(v);
    }
    r.is_fake_model = json::get_bool(d.root, "is_fake_model").value_or(false);
    r.fake_reason = json::get_string(d.root, "fake_reason").value_or("");
    r.inspection_json = inspection_text(d.root);
    *out = std::move(r);
    return "";
}

std::string verification_doc_to_json(const VerificationDoc& d) {
    json::Doc doc(json_object_new_object());
    json_object* o = doc.root;
    json_object_object_add(o, "uid", json_object_new_int64(d.uid));
    json_object_object_add(o, "is_fake_model", json_object_new_boolean(d.is_fake_model));
    json_object_object_add(o, "fake_reason", json_object_new_string(d.fake_reason.c_str()));
    json_object_object_add(o, "missing_metadata", json_object_new_boolean(d.missing_metadata));
    json_object_object_add(o, "rejection_reason", json_object_new_string(d.rejection_reason.c_str()));
    json_object* insp = parse_inspection(d.inspection_json);
    json_object_object_add(o, "inspection_results", insp ? insp : json_object_new_object());
    return json::to_string(o);
}

std::string verification_doc_from_json(const std::string& text, VerificationDoc* out) {
    if (!out) return "null output";
    std::string err;
    json::Doc d = json::parse(text, kMaxDocumentBytes, json::DEFAULT_MAX_DEPTH, &err);
    if (!d) return "verification document: " + err;
    if (!json_object_is_type(d.root, json_type_object)) return "verification document is not an object";

    auto fake = json::get_bool(d.root, "is_fake_model");
    auto missing = json::get_bool(d.root, "missing_metadata");
    if (!fake || !missing) return "verification document missing is_fake_model/missing_metadata";

    VerificationDoc r;
    r.uid = (Uid)json::get_int(d.root, "uid").value_or(0);
    r.is_fake_model = *fake;
    r.missing_metadata = *missing;
    r.fake_reason = json::get_string(d.root, "fake_reason").value_or("");
    r.rejection_reason = json::get_string(d.root, "rejection_reason").value_or("");
    std::string insp = inspection_text(d.root);
    r.inspection_json = insp.empty() ? "{}" : insp;
    *out = std::move(r);
    return "";
}

VerificationDoc verification_doc_from_verdict(Uid uid, const VerificationVerdict& v) {
    VerificationDoc d;
    d.uid = uid;
    d.is_fake_model = v.verdict == Verdict::ADVERSARIAL;
    d.missing_metadata = v.verdict == Verdict::MISSING_METADATA;
    if (d.is_fake_model) d.fake_reason = v.reason;
    if (d.missing_metadata) d.rejection_reason = v.reason;
    d.inspection_json = v.evidence_json;
    return d;
}

VerificationVerdict verdict_from_doc(const VerificationDoc& d) {
    VerificationVerdict v;
    // a document claiming both is treated as adversarial
    if (d.is_fake_model) {
        v.verdict = Verdict::ADVERSARIAL;
        v.reason = d.fake_reason.empty() ? "flagged without reason" : d.fake_reason;
    } else if (d.missing_metadata) {
        v.verdict = Verdict::MISSING_METADATA;
        v.reason = d.rejection_reason.empty() ? "metadata missing" : d.rejection_reason;
    } else {
        v.verdict = Verdict::LEGITIMATE;
        v.reason = "all checks passed";
    }
    v.evidence_json = d.inspection_json;
    return v;
}

FinalizedResult finalize_result(const ResultDoc& doc, Uid uid, double floor) {
    FinalizedResult f;
    f.result = EvaluationResult::zero(uid);
    if (!doc.inspection_json.empty()) f.evidence_json = doc.inspection_json;

    if (doc.is_fake_model) {
        f.adversarial = true;
        f.reason = doc.fake_reason.empty() ? "fake model flagged during evaluation" : doc.fake_reason;
        return f;
    }
    if (!std::isfinite(doc.score) || doc.score < 0.0 || doc.score > 1.0 ||
        !std::isfinite(doc.t) || !std::isfinite(doc.e)) {
        f.adversarial = true;
        f.reason = "score out of range";
        return f;
    }
    if (doc.error) {
        f.reason = *doc.error;
        return f;
    }

    f.result.success = doc.success;
    f.result.time_sec = doc.t;
    f.result.energy = doc.e;
    f.result.score = doc.score > 0.0 ? doc.score : floor;
    return f;
}

} // namespace warden
