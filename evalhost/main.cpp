#include "warden/config.h"
#include "warden/documents.h"
#include "warden/episode.h"
#include "warden/fsutil.h"
#include "warden/sandbox.h"
#include "warden/task.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace warden;

// Exit codes: 0 document written, 2 usage, 3 bad task, 4 cannot write the
// document, 5 sandbox setup failed, 6 verification aborted.

static bool parse_uid(const char* s, Uid* out) {
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (!end || *end != '\0' || end == s) return false;
    *out = (Uid)v;
    return true;
}

static int write_doc(const std::filesystem::path& out, const std::string& body) {
    std::string err = write_atomic(out, body + "\n");
    if (!err.empty()) {
        std::cerr << "[evalhost] cannot write " << out.string() << ": " << err << "\n";
        return 4;
    }
    return 0;
}

static EvalOptions options_from_env() {
    EvalOptions opt;
    opt.max_entry_bytes = (size_t)getenv_i64("WARDEN_MAX_ENTRY_BYTES", (int64_t)opt.max_entry_bytes);
    opt.replay.stable_landing_sec = getenv_f64("WARDEN_STABLE_LANDING_SEC", opt.replay.stable_landing_sec);
    opt.replay.landing_radius = getenv_f64("WARDEN_LANDING_RADIUS", opt.replay.landing_radius);
    opt.replay.landing_height_tol = getenv_f64("WARDEN_LANDING_HEIGHT_TOL", opt.replay.landing_height_tol);
    opt.reward.energy_budget = getenv_f64("WARDEN_ENERGY_BUDGET", opt.reward.energy_budget);
    return opt;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n"
                     "  warden_evalhost eval <task.json> <uid> <model.zip> <result.json>\n"
                     "  warden_evalhost verify <uid> <model.zip> <verification_result.json>\n";
        return 2;
    }
    const std::string mode = argv[1];

    // Inside a container the filter is installed here; the local host
    // installs it between fork and exec instead.
    if (getenv_bool("WARDEN_EVALHOST_SECCOMP", false)) {
        const SeccompProfile prof =
            getenv_str("WARDEN_SECCOMP_PROFILE", "eval") == "verify" ? SeccompProfile::VERIFY : SeccompProfile::EVAL;
        std::string err = install_seccomp_filter(prof);
        if (!err.empty()) {
            std::cerr << "[evalhost] " << err << "\n";
            return 5;
        }
    }

    const EvalOptions opt = options_from_env();

    if (mode == "eval") {
        if (argc != 6) {
            std::cerr << "[evalhost] eval expects <task.json> <uid> <model.zip> <result.json>\n";
            return 2;
        }
        Uid uid = 0;
        if (!parse_uid(argv[3], &uid)) {
            std::cerr << "[evalhost] bad uid: " << argv[3] << "\n";
            return 2;
        }
        const std::filesystem::path out = argv[5];

        std::string text;
        std::string err = read_file_bounded(argv[2], kMaxDocumentBytes * 16, &text);
        Task task;
        if (err.empty()) err = task_from_json(text, &task);
        if (!err.empty()) {
            std::cerr << "[evalhost] task: " << err << "\n";
            ResultDoc doc;
            doc.uid = uid;
            doc.error = "task: " + err;
            int rc = write_doc(out, result_doc_to_json(doc));
            return rc != 0 ? rc : 3;
        }

        ResultDoc doc;
        try {
            doc = run_evaluation(task, uid, argv[4], opt);
        } catch (const std::exception& e) {
            std::cerr << "[evalhost] evaluation failed: " << e.what() << "\n";
            doc = ResultDoc{};
            doc.uid = uid;
            doc.error = std::string("internal: ") + e.what();
        }
        return write_doc(out, result_doc_to_json(doc));
    }

    if (mode == "verify") {
        if (argc != 5) {
            std::cerr << "[evalhost] verify expects <uid> <model.zip> <verification_result.json>\n";
            return 2;
        }
        Uid uid = 0;
        if (!parse_uid(argv[2], &uid)) {
            std::cerr << "[evalhost] bad uid: " << argv[2] << "\n";
            return 2;
        }
        VerificationDoc doc;
        try {
            doc = run_verification(uid, argv[3], opt);
        } catch (const std::exception& e) {
            // no document: the run gives no verdict
            std::cerr << "[evalhost] verification failed: " << e.what() << "\n";
            return 6;
        }
        std::cerr << "[evalhost] verify uid=" << uid << " fake=" << doc.is_fake_model
                  << " missing_metadata=" << doc.missing_metadata << "\n";
        return write_doc(argv[4], verification_doc_to_json(doc));
    }

    std::cerr << "[evalhost] unknown mode: " << mode << "\n";
    return 2;
}
