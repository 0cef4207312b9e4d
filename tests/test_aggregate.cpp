#include "test_common.h"

#include "warden/aggregate.h"

#include <cmath>
#include <filesystem>

using namespace warden;

static EvaluationResult scored(Uid uid, double s) {
    EvaluationResult r = EvaluationResult::zero(uid);
    r.score = s;
    return r;
}

int main() {
    namespace fs = std::filesystem;

    // boost: best maps to 1, everything in [0, 1]
    {
        std::vector<double> b = boost({0.2, 0.9, 0.5, 0.01});
        expect_eq_ll((long long)b.size(), 4, "boost size");
        expect_near(b[1], 1.0, 1e-12, "best score boosts to 1");
        for (double w : b) expect_true(w >= 0.0 && w <= 1.0, "boosted weight out of [0,1]");
        expect_true(b[0] < b[2] && b[2] < b[1], "boost keeps order");
        expect_true(b[3] < b[0], "boost keeps order at the bottom");
    }
    // higher beta sharpens the gap
    {
        std::vector<double> soft = boost({0.4, 0.6}, 1.0);
        std::vector<double> sharp = boost({0.4, 0.6}, 10.0);
        expect_true(sharp[0] < soft[0], "beta sharpens");
    }
    // no spread: all equal maximum -> all 1
    {
        std::vector<double> b = boost({0.3, 0.3, 0.3});
        for (double w : b) expect_near(w, 1.0, 0.0, "tie should boost to 1");
    }
    expect_true(boost({}).empty(), "empty in, empty out");
    {
        std::vector<double> b = boost({0.7});
        expect_near(b[0], 1.0, 0.0, "single participant boosts to 1");
    }

    // burn: reserved uid carries exactly the fraction
    {
        BurnConfig cfg;
        std::vector<Uid> uids{3, 5, 8};
        WeightVector w = apply_burn(uids, {1.0, 0.5, 0.5}, cfg);
        expect_eq_ll((long long)w.uids.size(), 4, "burn adds reserved uid");
        expect_eq_ll(w.uids[0], 0, "reserved uid first");
        expect_true(w.weights[0] == 0.90, "reserved uid weight is exactly the fraction");
        expect_near(w.sum(), 1.0, 1e-12, "burned vector sums to 1");
        expect_near(w.weights[1], 0.05, 1e-12, "others rescaled to 1 - fraction");
        expect_near(w.weights[2], 0.025, 1e-12, "others rescaled proportionally");
    }
    // reserved uid among the participants: its boosted weight is discarded
    {
        BurnConfig cfg;
        WeightVector w = apply_burn({0, 4}, {1.0, 0.2}, cfg);
        expect_eq_ll((long long)w.uids.size(), 2, "reserved uid appears once");
        expect_true(w.weights[0] == 0.90, "reserved weight unaffected by its own score");
        expect_near(w.weights[1], 0.10, 1e-12, "remaining participant gets the rest");
    }
    // everyone else zero
    {
        BurnConfig cfg;
        WeightVector w = apply_burn({1, 2}, {0.0, 0.0}, cfg);
        expect_true(w.weights[0] == 0.90, "fraction kept when others are zero");
        expect_true(w.weights[1] == 0.0 && w.weights[2] == 0.0, "others stay zero");
    }
    // burn disabled: plain normalisation
    {
        BurnConfig cfg;
        cfg.enabled = false;
        WeightVector w = apply_burn({1, 2}, {1.0, 3.0}, cfg);
        expect_eq_ll((long long)w.uids.size(), 2, "no reserved entry when disabled");
        expect_near(w.weights[0], 0.25, 1e-12, "normalised weight");
        expect_near(w.sum(), 1.0, 1e-12, "normalised sum");
    }
    // aggregate: non-finite score treated as zero
    {
        BurnConfig cfg;
        WeightVector w = aggregate({scored(1, 0.8), scored(2, std::nan(""))}, 5.0, cfg);
        expect_true(w.weights[0] == 0.90, "aggregate keeps burn invariant");
        expect_true(w.weights[1] > w.weights[2], "finite score wins over nan");
        for (double x : w.weights) expect_true(std::isfinite(x), "aggregate output finite");
    }

    // score book: EMA, persistence, published normalisation
    fs::path dir = fs::temp_directory_path() / "warden_test_aggregate";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    {
        ScoreBook book(dir / "scores.json");
        expect_true(book.load().empty(), "missing book loads empty");
        WeightVector round;
        round.uids = {0, 7};
        round.weights = {0.9, 0.1};
        book.update(round, 0.5);
        expect_near(book.score(0), 0.45, 1e-12, "ema uid 0");
        expect_near(book.score(7), 0.05, 1e-12, "ema uid 7");
        book.update(round, 0.5);
        expect_near(book.score(0), 0.675, 1e-12, "ema converges toward round weight");
        expect_true(book.save().empty(), "book save");

        ScoreBook again(dir / "scores.json");
        expect_true(again.load().empty(), "book reload");
        expect_near(again.score(7), book.score(7), 1e-12, "book round trips");
        WeightVector pub = again.published(BurnConfig{});
        expect_near(pub.sum(), 1.0, 1e-12, "published sums to 1");
        expect_true(pub.uids[0] == 0 && pub.weights[0] == 0.90, "published burn share exact");
        expect_near(again.score(42), 0.0, 0.0, "unknown uid scores 0");

        BurnConfig off;
        off.enabled = false;
        pub = again.published(off);
        expect_near(pub.weights[0], 0.675 / 0.75, 1e-12, "without burn the book is normalised");
    }
    {
        // a participant leaving must not dilute the reserved share
        ScoreBook book(dir / "churn.json");
        WeightVector r1;
        r1.uids = {0, 1, 2};
        r1.weights = {0.9, 0.05, 0.05};
        book.update(r1, 0.1);
        WeightVector r2;
        r2.uids = {0, 1};
        r2.weights = {0.9, 0.1};
        book.update(r2, 0.1);
        expect_near(book.score(2), 0.005 * 0.9, 1e-12, "absent uid decays");
        expect_near(book.score(1), 0.1 * 0.1 + 0.9 * 0.005, 1e-12, "present uid averages");

        WeightVector pub = book.published(BurnConfig{});
        expect_true(pub.uids[0] == 0 && pub.weights[0] == 0.90, "reserved share exact after churn");
        expect_near(pub.sum(), 1.0, 1e-12, "churned book sums to 1");
        expect_true(pub.weights[1] > pub.weights[2], "departed uid fades");

        BurnConfig other;
        other.reserved_uid = 9;
        pub = book.published(other);
        expect_true(pub.uids[0] == 9 && pub.weights[0] == 0.90, "reserved uid published even without a book entry");
    }
    {
        ScoreBook empty(dir / "none.json");
        expect_true(empty.published(BurnConfig{}).uids.empty(), "empty book publishes nothing");
    }

    fs::remove_all(dir, ec);
    std::cerr << "test_aggregate: ALL PASSED" << std::endl;
    return 0;
}
