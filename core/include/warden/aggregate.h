#pragma once

#include "warden/types.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace warden {

// Exponential, spread-normalised gap transform. The best score always maps
// to 1. A field with no spread (sigma < 1e-9) maps scores equal to the max
// to 1 and everything else to 0. Empty in, empty out.
std::vector<double> boost(const std::vector<double>& scores, double beta = 5.0);

struct BurnConfig {
    bool enabled{true};
    Uid reserved_uid{0};
    double fraction{0.90};
};

struct WeightVector {
    std::vector<Uid> uids;
    std::vector<double> weights;

    double sum() const;
};

// With burn enabled: reserved uid first with exactly `fraction`, every other
// boosted weight rescaled to sum to 1 - fraction (all zero when their total
// is zero). A boosted weight for the reserved uid itself is discarded.
// With burn disabled: boosted weights normalised to sum 1.
WeightVector apply_burn(const std::vector<Uid>& uids, const std::vector<double>& boosted, const BurnConfig& cfg);

// boost + apply_burn over one round's results.
WeightVector aggregate(const std::vector<EvaluationResult>& results, double beta, const BurnConfig& cfg);

// Scale to sum 1; an all-zero (or non-finite) vector becomes all zero.
void normalize(std::vector<double>* w);

// Persisted exponential moving average of per-uid weights.
class ScoreBook {
public:
    explicit ScoreBook(std::filesystem::path file);

    // Missing file is an empty book. Empty string on success.
    std::string load();
    std::string save() const;

    // s <- alpha * w + (1 - alpha) * s for every uid in the round. Uids
    // absent from the round decay with w = 0.
    void update(const WeightVector& round, double alpha);

    double score(Uid uid) const;
    // Book sorted by uid, passed through apply_burn: the reserved uid gets
    // exactly burn.fraction whatever its own book entry. Empty book, empty
    // vector.
    WeightVector published(const BurnConfig& burn) const;

private:
    std::filesystem::path file_;
    std::map<Uid, double> scores_;
};

} // namespace warden
