#include "warden/round.h"
#include "warden/crypto.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"
#include "warden/log.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <thread>

namespace warden {

// ---- FileWeightSink ----

FileWeightSink::FileWeightSink(std::filesystem::path file) : file_(std::move(file)) {}

std::string FileWeightSink::publish(const std::string& round_id, const WeightVector& w) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "round_id", json_object_new_string(round_id.c_str()));
    json_object_object_add(d.root, "ts", json_object_new_string(iso_now().c_str()));
    json_object* arr = json_object_new_array();
    for (size_t i = 0; i < w.uids.size() && i < w.weights.size(); i++) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "uid", json_object_new_int64(w.uids[i]));
        json_object_object_add(e, "weight", json_object_new_double(w.weights[i]));
        json_object_array_add(arr, e);
    }
    json_object_object_add(d.root, "weights", arr);

    std::error_code ec;
    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path(), ec);
    return write_atomic(file_, json::to_string(d.root) + "\n");
}

// ---- helpers ----

static std::string result_json(const EvaluationResult& r) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "uid", json_object_new_int64(r.uid));
    json_object_object_add(d.root, "success", json_object_new_boolean(r.success));
    json_object_object_add(d.root, "t", json_object_new_double(r.time_sec));
    json_object_object_add(d.root, "e", json_object_new_double(r.energy));
    json_object_object_add(d.root, "score", json_object_new_double(r.score));
    return json::to_string(d.root);
}

static std::string weights_json(const WeightVector& w) {
    json::Doc d(json_object_new_object());
    json_object* uids = json_object_new_array();
    for (Uid u : w.uids) json_object_array_add(uids, json_object_new_int64(u));
    json_object_object_add(d.root, "uids", uids);
    json_object_object_add(d.root, "weights", json::new_number_array(w.weights));
    json_object_object_add(d.root, "sum", json_object_new_double(w.sum()));
    return json::to_string(d.root);
}

static std::string kv_json(std::initializer_list<std::pair<const char*, std::string>> kv, Uid uid) {
    json::Doc d(json_object_new_object());
    json_object_object_add(d.root, "uid", json_object_new_int64(uid));
    for (const auto& p : kv) json_object_object_add(d.root, p.first, json_object_new_string(p.second.c_str()));
    return json::to_string(d.root);
}

// ---- RoundCoordinator ----

RoundCoordinator::RoundCoordinator(const ValidatorConfig& cfg, Transport& transport, FingerprintSet& blacklist,
                                   IntegrityGate& gate, Verifier& verifier, Orchestrator& orch, ScoreBook& book,
                                   WeightSink& sink)
    : cfg_(cfg), transport_(transport), blacklist_(blacklist), gate_(gate), verifier_(verifier),
      orch_(orch), book_(book), sink_(sink) {}

std::string RoundCoordinator::new_round_id() {
    return std::to_string(now_ms_i64()) + "_" + random_tag(6);
}

std::vector<CacheOutcome> RoundCoordinator::acquire(const std::vector<Uid>& uids) {
    std::vector<CacheOutcome> out(uids.size());
    const size_t width = (size_t)std::max(1, cfg_.fetch_batch);

    for (size_t base = 0; base < uids.size(); base += width) {
        const size_t end = std::min(uids.size(), base + width);
        std::vector<std::thread> workers;
        workers.reserve(end - base);
        for (size_t i = base; i < end; i++) {
            // each worker owns one slot and one cache key
            workers.emplace_back([this, &uids, &out, i]() {
                try {
                    out[i] = gate_.refresh(uids[i], transport_);
                } catch (const std::exception& e) {
                    out[i] = CacheOutcome{};
                    out[i].status = CacheOutcome::Status::SKIPPED;
                    out[i].message = std::string("acquire failed: ") + e.what();
                }
            });
        }
        for (auto& t : workers) t.join();
    }
    return out;
}

EvaluationResult RoundCoordinator::score_participant(Uid uid, const CacheOutcome& co, const Task& task,
                                                     RoundSummary* sum, JsonlLogger& log, int64_t* seq) {
    if (co.status == CacheOutcome::Status::SKIPPED) {
        sum->skipped.push_back(uid);
        if (co.admission.reason == RejectReason::BLACKLISTED) {
            log.event((*seq)++, "admission_reject",
                      kv_json({{"reason", reject_reason_name(co.admission.reason)}, {"message", co.message}}, uid));
        }
        return EvaluationResult::zero(uid);
    }
    if (co.status == CacheOutcome::Status::REJECTED) {
        sum->rejected.push_back(uid);
        log.event((*seq)++, "admission_reject",
                  kv_json({{"reason", reject_reason_name(co.admission.reason)}, {"message", co.message}}, uid));
        return EvaluationResult::zero(uid);
    }

    const std::string& fp = co.fingerprint;
    if (verifier_.needs_verification(fp)) {
        std::optional<VerificationVerdict> v = verifier_.verify_if_new(uid, co.path, fp, orch_);
        if (!v) {
            log.event((*seq)++, "verdict", kv_json({{"verdict", "none"}, {"fingerprint", fp}}, uid));
            return EvaluationResult::zero(uid);
        }
        log.event((*seq)++, "verdict",
                  kv_json({{"verdict", verdict_name(v->verdict)}, {"reason", v->reason}, {"fingerprint", fp}}, uid));
        if (v->verdict == Verdict::ADVERSARIAL) sum->adversarial.push_back(uid);
        if (v->verdict != Verdict::LEGITIMATE) return EvaluationResult::zero(uid);
    }
    if (blacklist_.contains(fp)) return EvaluationResult::zero(uid);

    VerificationVerdict flagged;
    EvaluationResult r = orch_.evaluate(task, uid, co.path, &flagged);
    if (flagged.verdict == Verdict::ADVERSARIAL) {
        // retroactive: same handling as a verification verdict
        std::string err = verifier_.apply(uid, fp, co.path, flagged);
        if (!err.empty()) std::cerr << "[round] uid=" << uid << " " << err << "\n";
        sum->adversarial.push_back(uid);
        log.event((*seq)++, "verdict",
                  kv_json({{"verdict", "adversarial"}, {"reason", flagged.reason}, {"fingerprint", fp},
                           {"stage", "evaluation"}}, uid));
        r = EvaluationResult::zero(uid);
    }
    log.event((*seq)++, "evaluation", result_json(r));
    return r;
}

RoundSummary RoundCoordinator::run_round(uint64_t seed, const std::string& round_id) {
    RoundSummary sum;
    sum.round_id = round_id;
    sum.seed = seed;

    std::error_code ec;
    const std::filesystem::path log_dir = std::filesystem::path(cfg_.state_dir) / "logs";
    std::filesystem::create_directories(log_dir, ec);
    sum.log_path = (log_dir / ("round_" + round_id + ".jsonl")).string();

    RoundHeader hdr;
    hdr.round_id = round_id;
    hdr.profile_id = profile_name(detect_profile());
    JsonlLogger log(hdr, sum.log_path);
    int64_t seq = 0;

    TaskGenConfig tg;
    tg.horizon = cfg_.horizon_sec;
    tg.sim_dt = cfg_.sim_dt;
    sum.task = random_task(seed, tg);

    std::vector<Uid> uids;
    try {
        std::string err = blacklist_.load();
        if (!err.empty()) std::cerr << "[warn] blacklist load: " << err << " (keeping previous set)\n";
        uids = transport_.participants();
    } catch (const std::exception& e) {
        sum.error = e.what();
    }

    {
        json::Doc d(json_object_new_object());
        json_object_object_add(d.root, "seed", json_object_new_int64((int64_t)seed));
        json_object_object_add(d.root, "participants", json_object_new_int64((int64_t)uids.size()));
        json_object_object_add(d.root, "blacklist_size", json_object_new_int64((int64_t)blacklist_.size()));
        json_object_object_add(d.root, "goal", json::new_number_array({sum.task.goal[0], sum.task.goal[1], sum.task.goal[2]}));
        json_object_object_add(d.root, "obstacles", json_object_new_int64((int64_t)sum.task.obstacles.size()));
        log.event(seq++, "round_start", json::to_string(d.root));
    }
    std::cerr << "[round] " << round_id << " start: " << uids.size() << " participants, seed " << seed << "\n";

    size_t done = 0;
    try {
        std::vector<CacheOutcome> outcomes = acquire(uids);
        for (; done < uids.size(); done++) {
            sum.results.push_back(score_participant(uids[done], outcomes[done], sum.task, &sum, log, &seq));
        }
    } catch (const std::exception& e) {
        sum.error = e.what();
        std::cerr << "[round] " << round_id << " failed at participant " << done << ": " << e.what() << "\n";
        log.event(seq++, "round_error", kv_json({{"error", e.what()}}, done < uids.size() ? uids[done] : -1));
    }
    for (size_t i = sum.results.size(); i < uids.size(); i++) sum.results.push_back(EvaluationResult::zero(uids[i]));

    BurnConfig burn;
    burn.enabled = cfg_.burn_enabled;
    burn.reserved_uid = cfg_.burn_uid;
    burn.fraction = cfg_.burn_fraction;
    sum.round_weights = aggregate(sum.results, cfg_.beta, burn);

    book_.update(sum.round_weights, cfg_.ema_alpha);
    std::string err = book_.save();
    if (!err.empty()) std::cerr << "[warn] score book: " << err << "\n";
    sum.published = book_.published(burn);

    err = sink_.publish(round_id, sum.published);
    if (!err.empty()) {
        std::cerr << "[round] publish failed: " << err << "\n";
        if (sum.error.empty()) sum.error = "publish: " + err;
    }
    log.event(seq++, "weights", weights_json(sum.published));

    orch_.cleanup();

    {
        json::Doc d(json_object_new_object());
        json_object_object_add(d.root, "evaluated", json_object_new_int64((int64_t)sum.results.size()));
        json_object_object_add(d.root, "rejected", json_object_new_int64((int64_t)sum.rejected.size()));
        json_object_object_add(d.root, "skipped", json_object_new_int64((int64_t)sum.skipped.size()));
        json_object_object_add(d.root, "adversarial", json_object_new_int64((int64_t)sum.adversarial.size()));
        json_object_object_add(d.root, "error", json_object_new_string(sum.error.c_str()));
        log.event(seq++, "round_end", json::to_string(d.root));
    }
    std::cerr << "[round] " << round_id << " end: " << sum.results.size() << " results, "
              << sum.adversarial.size() << " adversarial, chain " << log.chain_head().substr(0, 16) << "\n";
    return sum;
}

int RoundCoordinator::serve(int max_rounds, const std::atomic<bool>* stop) {
    int rounds = 0;
    while (!(stop && stop->load())) {
        const std::string id = new_round_id();
        try {
            (void)run_round(secure_rand64(), id);
        } catch (const std::exception& e) {
            std::cerr << "[round] " << id << " aborted: " << e.what() << "\n";
        }
        rounds++;
        if (max_rounds > 0 && rounds >= max_rounds) break;

        // pacing, interruptible once per second
        for (int64_t left = (int64_t)cfg_.pacing_sec * 1000; left > 0 && !(stop && stop->load()); left -= 1000) {
            sleep_ms(std::min<int64_t>(left, 1000));
        }
    }
    return rounds;
}

} // namespace warden
