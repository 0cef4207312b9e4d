#include "test_common.h"

#include "warden/documents.h"
#include "warden/json_util.h"
#include "warden/replay.h"

#include <limits>

using namespace warden;

static ResultDoc clean(double score) {
    ResultDoc d;
    d.uid = 4;
    d.success = score > 0.0;
    d.t = 12.5;
    d.e = 7.0;
    d.score = score;
    return d;
}

int main() {
    // result documents
    {
        ResultDoc d = clean(0.8);
        d.inspection_json = "{\"behavioural\":{\"probes\":32}}";
        ResultDoc back;
        std::string err = result_doc_from_json(result_doc_to_json(d), &back);
        expect_true(err.empty(), "result doc parse: " + err);
        expect_eq_ll(back.uid, 4, "uid kept");
        expect_true(back.success && !back.error && !back.is_fake_model, "flags kept");
        expect_near(back.score, 0.8, 1e-12, "score kept");
        expect_true(back.inspection_json.find("probes") != std::string::npos, "inspection kept");

        ResultDoc out;
        expect_true(!result_doc_from_json("{\"uid\":1,\"success\":true,\"t\":1}", &out).empty(), "missing fields refused");
        expect_true(!result_doc_from_json("{\"uid\":\"1\",\"success\":true,\"t\":1,\"e\":1,\"score\":1}", &out).empty(),
                    "string uid refused");
        expect_true(!result_doc_from_json("[]", &out).empty(), "array refused");
        expect_true(!result_doc_from_json("{\"uid\":1", &out).empty(), "truncated refused");
        expect_true(!result_doc_from_json(std::string(kMaxDocumentBytes + 1, ' '), &out).empty(), "oversize refused");

        std::string err2 = result_doc_from_json(
            "{\"uid\":1,\"success\":false,\"t\":0,\"e\":0,\"score\":0,\"error\":{\"code\":3}}", &out);
        expect_true(err2.empty(), "non-string error accepted: " + err2);
        expect_true(out.error.has_value(), "non-string error still counts as an error");
    }

    // finalize: floor vs error-zero
    {
        FinalizedResult f = finalize_result(clean(0.0), 4);
        expect_near(f.result.score, 0.01, 0.0, "error-free zero gets the floor");
        expect_true(!f.adversarial, "floor is not adversarial");

        ResultDoc errored = clean(0.0);
        errored.error = "episode crashed";
        f = finalize_result(errored, 4);
        expect_near(f.result.score, 0.0, 0.0, "error means zero");
        expect_true(f.reason == "episode crashed", "error reason carried");

        // an error wins even over a positive score
        errored.score = 0.9;
        f = finalize_result(errored, 4);
        expect_near(f.result.score, 0.0, 0.0, "error zeroes a positive score");

        f = finalize_result(clean(0.7), 4);
        expect_near(f.result.score, 0.7, 0.0, "clean score kept");
        expect_near(f.result.time_sec, 12.5, 0.0, "time kept");

        ResultDoc other = clean(0.7);
        other.uid = 99;
        f = finalize_result(other, 4);
        expect_eq_ll(f.result.uid, 4, "result is attributed to the evaluated uid");

        ResultDoc custom = clean(0.0);
        expect_near(finalize_result(custom, 4, 0.05).result.score, 0.05, 0.0, "custom floor");
    }

    // finalize: adversarial outcomes
    {
        ResultDoc fake = clean(0.9);
        fake.is_fake_model = true;
        fake.fake_reason = "foreign entry 'x.pkl'";
        FinalizedResult f = finalize_result(fake, 4);
        expect_true(f.adversarial && f.result.score == 0.0, "fake model zero and adversarial");
        expect_true(f.reason == "foreign entry 'x.pkl'", "fake reason carried");

        f = finalize_result(clean(1.5), 4);
        expect_true(f.adversarial && f.result.score == 0.0, "score above 1 is adversarial");
        f = finalize_result(clean(-0.1), 4);
        expect_true(f.adversarial && f.result.score == 0.0, "negative score is adversarial");
        ResultDoc inf_t = clean(0.5);
        inf_t.t = std::numeric_limits<double>::infinity();
        expect_true(finalize_result(inf_t, 4).adversarial, "non-finite time is adversarial");
    }

    // reward floor agrees with finalize
    {
        expect_near(reward(false, 30.0, 10.0, 30.0), 0.01, 0.0, "failed run earns the floor");
        expect_near(reward(true, 0.0, 0.0, 30.0), 1.0, 1e-12, "instant free landing earns 1");
        expect_near(reward(true, 15.0, 15.0, 30.0), 0.75, 1e-12, "half time half budget");
        expect_near(reward(true, 60.0, 90.0, 30.0), 0.5, 1e-12, "success never below 0.5");
    }

    // verification documents
    {
        VerificationVerdict v;
        v.verdict = Verdict::MISSING_METADATA;
        v.reason = "safe_policy_meta.json missing";
        v.evidence_json = "{\"structural\":{}}";
        VerificationDoc d = verification_doc_from_verdict(7, v);
        VerificationDoc back;
        std::string err = verification_doc_from_json(verification_doc_to_json(d), &back);
        expect_true(err.empty(), "verification parse: " + err);
        VerificationVerdict again = verdict_from_doc(back);
        expect_true(again.verdict == Verdict::MISSING_METADATA, "missing metadata survives");
        expect_true(again.reason == v.reason, "reason survives");
        expect_true(again.evidence_json == "{\"structural\":{}}", "evidence survives");

        VerificationDoc both;
        both.is_fake_model = true;
        both.missing_metadata = true;
        expect_true(verdict_from_doc(both).verdict == Verdict::ADVERSARIAL, "fake wins over missing metadata");
        expect_true(verdict_from_doc(VerificationDoc{}).verdict == Verdict::LEGITIMATE, "clean document is legitimate");

        VerificationDoc out;
        expect_true(!verification_doc_from_json("{\"uid\":1}", &out).empty(), "flags are required");
    }

    std::cerr << "test_documents: ALL PASSED" << std::endl;
    return 0;
}
