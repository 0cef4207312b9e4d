#include "warden/aggregate.h"
#include "warden/fsutil.h"
#include "warden/json_util.h"

#include <algorithm>
#include <cmath>

namespace warden {

std::vector<double> boost(const std::vector<double>& scores, double beta) {
    std::vector<double> out(scores.size(), 0.0);
    if (scores.empty()) return out;

    const double m = *std::max_element(scores.begin(), scores.end());
    double mean = 0.0;
    for (double s : scores) mean += s;
    mean /= (double)scores.size();
    double var = 0.0;
    for (double s : scores) var += (s - mean) * (s - mean);
    const double sigma = std::sqrt(var / (double)scores.size());

    if (!(sigma >= 1e-9)) {
        for (size_t i = 0; i < scores.size(); i++) out[i] = (scores[i] == m) ? 1.0 : 0.0;
        return out;
    }

    for (size_t i = 0; i < scores.size(); i++) out[i] = std::exp(beta * (scores[i] - m) / sigma);
    const double top = *std::max_element(out.begin(), out.end());
    if (top > 0.0) {
        for (double& w : out) w /= top;
    }
    return out;
}

double WeightVector::sum() const {
    double s = 0.0;
    for (double w : weights) s += w;
    return s;
}

void normalize(std::vector<double>* w) {
    if (!w) return;
    double total = 0.0;
    for (double x : *w) total += (std::isfinite(x) && x > 0.0) ? x : 0.0;
    for (double& x : *w) {
        x = (total > 0.0 && std::isfinite(x) && x > 0.0) ? x / total : 0.0;
    }
}

WeightVector apply_burn(const std::vector<Uid>& uids, const std::vector<double>& boosted, const BurnConfig& cfg) {
    WeightVector out;
    const size_t n = std::min(uids.size(), boosted.size());

    if (!cfg.enabled) {
        out.uids.assign(uids.begin(), uids.begin() + (long)n);
        out.weights.assign(boosted.begin(), boosted.begin() + (long)n);
        normalize(&out.weights);
        return out;
    }

    const double keep = 1.0 - cfg.fraction;
    out.uids.push_back(cfg.reserved_uid);
    out.weights.push_back(cfg.fraction);

    double total = 0.0;
    for (size_t i = 0; i < n; i++) {
        if (uids[i] == cfg.reserved_uid) continue;
        out.uids.push_back(uids[i]);
        out.weights.push_back(boosted[i]);
        total += boosted[i];
    }
    for (size_t i = 1; i < out.weights.size(); i++) {
        out.weights[i] = total > 0.0 ? out.weights[i] * keep / total : 0.0;
    }
    return out;
}

WeightVector aggregate(const std::vector<EvaluationResult>& results, double beta, const BurnConfig& cfg) {
    std::vector<Uid> uids;
    std::vector<double> scores;
    uids.reserve(results.size());
    scores.reserve(results.size());
    for (const auto& r : results) {
        uids.push_back(r.uid);
        scores.push_back(std::isfinite(r.score) ? r.score : 0.0);
    }
    return apply_burn(uids, boost(scores, beta), cfg);
}

ScoreBook::ScoreBook(std::filesystem::path file) : file_(std::move(file)) {}

std::string ScoreBook::load() {
    scores_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) return "";

    std::string body;
    std::string err = read_file_bounded(file_, 16 * 1024 * 1024, &body);
    if (!err.empty()) return err;
    json::Doc d = json::parse(body, 16 * 1024 * 1024, 4, &err);
    if (!d) return file_.string() + ": " + err;
    json_object* arr = json::get_array(d.root, "scores");
    if (!arr) return file_.string() + ": missing scores";

    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* e = json_object_array_get_idx(arr, i);
        auto uid = json::get_int(e, "uid");
        auto s = json::get_number(e, "score");
        if (!uid || !s || !std::isfinite(*s) || *s < 0.0) continue;
        scores_[(Uid)*uid] = *s;
    }
    return "";
}

std::string ScoreBook::save() const {
    json::Doc d(json_object_new_object());
    json_object* arr = json_object_new_array();
    for (const auto& kv : scores_) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "uid", json_object_new_int64(kv.first));
        json_object_object_add(e, "score", json_object_new_double(kv.second));
        json_object_array_add(arr, e);
    }
    json_object_object_add(d.root, "scores", arr);
    return write_atomic(file_, json::to_string(d.root) + "\n");
}

void ScoreBook::update(const WeightVector& round, double alpha) {
    const double a = std::clamp(alpha, 0.0, 1.0);
    std::map<Uid, double> w;
    for (size_t i = 0; i < round.uids.size() && i < round.weights.size(); i++) w[round.uids[i]] = round.weights[i];
    for (auto& kv : scores_) {
        if (!w.count(kv.first)) kv.second *= (1.0 - a);
    }
    for (const auto& kv : w) {
        double& s = scores_[kv.first];
        s = a * kv.second + (1.0 - a) * s;
    }
}

double ScoreBook::score(Uid uid) const {
    auto it = scores_.find(uid);
    return it == scores_.end() ? 0.0 : it->second;
}

WeightVector ScoreBook::published(const BurnConfig& burn) const {
    if (scores_.empty()) return WeightVector{};
    std::vector<Uid> uids;
    std::vector<double> w;
    for (const auto& kv : scores_) {
        uids.push_back(kv.first);
        w.push_back(kv.second);
    }
    return apply_burn(uids, w, burn);
}

} // namespace warden
