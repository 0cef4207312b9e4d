#include "test_common.h"

#include "warden/replay.h"
#include "warden/task.h"

using namespace warden;

// Sits on the goal from the first step; optionally reports a contact or
// drifts 5 m off the goal for a single step.
class ScriptedSim : public Simulator {
public:
    int64_t contact_at{-1};
    int64_t away_at{-1};
    Contact contact;

    void reset(const Task& task) override {
        k_ = 0;
        goal_ = task.goal;
        body_.pos = goal_;
    }
    StepOutput step(const RotorCmd&) override {
        k_++;
        body_.pos = goal_;
        if (k_ == away_at) body_.pos[0] += 5.0;
        StepOutput out;
        if (k_ == contact_at) out.contacts.push_back(contact);
        return out;
    }
    BodyState state() const override { return body_; }
    Observation observe() const override { return Observation{}; }

private:
    BodyState body_;
    Vec3 goal_{0.0, 0.0, 0.0};
    int64_t k_{0};
};

static Task flat_task(double horizon) {
    Task t;
    t.start = Vec3{0.0, 0.0, 1.0};
    t.goal = Vec3{3.0, 0.0, 2.0};
    t.horizon = horizon;
    t.sim_dt = 0.02;
    return t;
}

int main() {
    expect_eq_ll(horizon_steps(30.0, 0.02), 1500, "steps over the default horizon");
    expect_eq_ll(horizon_steps(0.98, 0.02), 49, "49 steps");
    expect_eq_ll(horizon_steps(1.0, 0.0), 0, "zero dt gives no steps");

    // command table
    {
        ActionPlan p;
        p.commands.push_back(TimedCommand{0.05, RotorCmd{1, 1, 1, 1}});
        p.commands.push_back(TimedCommand{0.10, RotorCmd{2, 2, 2, 2}});
        p.commands.push_back(TimedCommand{99.0, RotorCmd{3, 3, 3, 3}});
        std::vector<RotorCmd> table = plan_to_table(p, 0.02, 10);
        expect_eq_ll((long long)table.size(), 10, "table length");
        expect_near(table[1][0], 0.0, 0.0, "zero before first command");
        expect_near(table[2][0], 1.0, 0.0, "first command from floor(t/dt)");
        expect_near(table[4][0], 1.0, 0.0, "command held across the gap");
        expect_near(table[5][0], 2.0, 0.0, "second command takes over");
        expect_near(table[9][0], 3.0, 0.0, "late command clamped into range");
    }

    // stability boundary: 1 s of envelope at 50 Hz needs 50 steps
    {
        ScriptedSim sim;
        ReplayOutcome o = replay(flat_task(0.98), ActionPlan{}, sim, ReplayParams{});
        expect_true(!o.success, "49 steps in the envelope is not a landing");
        expect_eq_ll(o.steps, 49, "ran the whole horizon");

        o = replay(flat_task(1.0), ActionPlan{}, sim, ReplayParams{});
        expect_true(o.success, "50 steps in the envelope lands");
        expect_near(o.time_sec, 1.0, 1e-12, "landing time");

        o = replay(flat_task(1.02), ActionPlan{}, sim, ReplayParams{});
        expect_true(o.success, "51-step horizon lands");
        expect_eq_ll(o.steps, 50, "episode ends at the landing");
    }

    // leaving the envelope restarts the streak: 49 steps in, one out, then a
    // full 50-step streak from step 51
    {
        ScriptedSim sim;
        sim.away_at = 50;
        ReplayOutcome o = replay(flat_task(1.02), ActionPlan{}, sim, ReplayParams{});
        expect_true(!o.success, "no landing at the first streak's deadline");
        expect_eq_ll(o.steps, 51, "ran on past the break");

        o = replay(flat_task(1.98), ActionPlan{}, sim, ReplayParams{});
        expect_true(!o.success, "49 steps of the new streak are not enough");
        expect_eq_ll(o.steps, 99, "ran the whole horizon");

        o = replay(flat_task(2.0), ActionPlan{}, sim, ReplayParams{});
        expect_true(o.success, "a full new streak lands");
        expect_eq_ll(o.steps, 100, "landing at the end of the second streak");
        expect_near(o.time_sec, 2.0, 1e-12, "landing time counts the break");
    }

    // contacts
    {
        ScriptedSim sim;
        sim.contact_at = 3;
        sim.contact.kind = ContactKind::OBSTACLE;
        sim.contact.obstacle = 0;
        sim.contact.point = Vec3{10.0, 10.0, 1.0};
        ReplayOutcome o = replay(flat_task(5.0), ActionPlan{}, sim, ReplayParams{});
        expect_true(o.collided && !o.success, "obstacle contact ends in failure");
        expect_eq_ll(o.steps, 3, "episode stops at the contact");

        sim.contact.kind = ContactKind::PLATFORM;
        sim.contact.point = Vec3{3.1, 0.1, 2.0};
        o = replay(flat_task(5.0), ActionPlan{}, sim, ReplayParams{});
        expect_true(!o.collided && o.success, "touchdown on the platform is not a collision");
    }

    // energy integral
    {
        ScriptedSim sim;
        ActionPlan p;
        p.commands.push_back(TimedCommand{0.0, RotorCmd{1000, 1000, 1000, 1000}});
        ReplayParams rp;
        rp.stable_landing_sec = 100.0;
        ReplayOutcome o = replay(flat_task(1.0), p, sim, rp);
        expect_near(o.energy, rp.energy_coeff * 4.0e6 * 0.02 * 50.0, 1e-15, "energy = coeff * sum rpm^2 * dt");
    }

    // tolerances are parameters
    {
        ReplayParams tight;
        tight.landing_radius = 0.0;
        ScriptedSim sim;
        expect_true(!replay(flat_task(2.0), ActionPlan{}, sim, tight).success, "zero radius never lands");
        expect_true(within_landing_envelope(Vec3{3.2, 0.0, 2.05}, Vec3{3.0, 0.0, 2.0}, ReplayParams{}), "inside envelope");
        expect_true(!within_landing_envelope(Vec3{3.0, 0.0, 1.8}, Vec3{3.0, 0.0, 2.0}, ReplayParams{}), "below platform");
    }

    // determinism on the point-mass physics
    {
        Task t = random_task(77, TaskGenConfig{});
        ActionPlan p;
        const double h = hover_rpm();
        p.commands.push_back(TimedCommand{0.0, RotorCmd{h * 1.1, h * 1.1, h * 1.05, h * 1.05}});
        p.commands.push_back(TimedCommand{2.0, RotorCmd{h, h * 0.98, h, h * 0.98}});
        ReplayOutcome a = replay(t, p);
        ReplayOutcome b = replay(t, p);
        expect_true(a.success == b.success && a.collided == b.collided, "same flags");
        expect_eq_ll(a.steps, b.steps, "same step count");
        expect_true(a.energy == b.energy && a.time_sec == b.time_sec, "bitwise identical outcome");
        expect_true(a.steps > 0, "simulation advanced");
    }

    std::cerr << "test_replay: ALL PASSED" << std::endl;
    return 0;
}
