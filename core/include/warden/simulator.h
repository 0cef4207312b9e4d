#pragma once

#include "warden/types.h"

#include <vector>

namespace warden {

constexpr int kObsDim = 9;
constexpr int kActDim = 4;

// Observation layout: goal - pos (3), velocity (3), absolute position (3).
using Observation = std::array<double, kObsDim>;

enum class ContactKind { GROUND, OBSTACLE, PLATFORM };

struct Contact {
    ContactKind kind{ContactKind::GROUND};
    int obstacle{-1};
    Vec3 point{0.0, 0.0, 0.0};
};

struct StepOutput {
    Observation obs{};
    std::vector<Contact> contacts;
};

struct BodyState {
    Vec3 pos{0.0, 0.0, 0.0};
    Vec3 vel{0.0, 0.0, 0.0};
};

// Physics collaborator. Implementations must be deterministic: the same
// task and command sequence always produce the same states.
class Simulator {
public:
    virtual ~Simulator() = default;

    virtual void reset(const Task& task) = 0;
    virtual StepOutput step(const RotorCmd& rpm) = 0;
    virtual BodyState state() const = 0;
    virtual Observation observe() const = 0;
};

// Crazyflie-class rotor constants shared by the stand-in physics and the
// energy integral.
constexpr double kMassKg = 0.027;
constexpr double kGravity = 9.81;
constexpr double kThrustCoeff = 3.16e-10;   // N per rpm^2
constexpr double kPropEfficiency = 0.60;
constexpr double kMaxRpm = 21702.0;

// rpm at which four rotors carry the body weight
double hover_rpm();

// Rigid point-mass stand-in: total thrust from sum of rpm^2, lateral
// acceleration from rotor-pair imbalance, linear drag, box obstacles, ground
// plane and a landing platform whose top face sits at the goal.
class PointMassSimulator : public Simulator {
public:
    struct Params {
        double body_radius{0.05};
        double platform_radius{0.6};
        double platform_thickness{0.1};
        double drag{0.35};
        double tilt_gain{1.0};
    };

    PointMassSimulator();
    explicit PointMassSimulator(const Params& p);

    void reset(const Task& task) override;
    StepOutput step(const RotorCmd& rpm) override;
    BodyState state() const override { return body_; }
    Observation observe() const override;

private:
    Params p_;
    Task task_;
    BodyState body_;
};

} // namespace warden
