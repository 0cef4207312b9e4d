#include "warden/simulator.h"

#include <algorithm>
#include <cmath>

namespace warden {

double hover_rpm() {
    return std::sqrt(kMassKg * kGravity / (4.0 * kThrustCoeff));
}

PointMassSimulator::PointMassSimulator() : PointMassSimulator(Params{}) {}

PointMassSimulator::PointMassSimulator(const Params& p) : p_(p) {}

void PointMassSimulator::reset(const Task& task) {
    task_ = task;
    body_ = BodyState{};
    body_.pos = task.start;
}

Observation PointMassSimulator::observe() const {
    Observation o{};
    for (int i = 0; i < 3; i++) {
        o[i] = task_.goal[i] - body_.pos[i];
        o[3 + i] = body_.vel[i];
        o[6 + i] = body_.pos[i];
    }
    return o;
}

StepOutput PointMassSimulator::step(const RotorCmd& cmd) {
    const double dt = task_.sim_dt;

    // rotor layout (X frame): 0 front-left, 1 front-right, 2 back-right, 3 back-left
    double f[4];
    for (int i = 0; i < 4; i++) {
        const double r = std::clamp(cmd[i], 0.0, kMaxRpm);
        f[i] = kThrustCoeff * r * r;
    }
    const double thrust = f[0] + f[1] + f[2] + f[3];
    const double fx = p_.tilt_gain * ((f[2] + f[3]) - (f[0] + f[1]));
    const double fy = p_.tilt_gain * ((f[0] + f[3]) - (f[1] + f[2]));

    Vec3 acc{
        fx / kMassKg - p_.drag * body_.vel[0],
        fy / kMassKg - p_.drag * body_.vel[1],
        thrust / kMassKg - kGravity - p_.drag * body_.vel[2],
    };

    // semi-implicit Euler
    for (int i = 0; i < 3; i++) {
        body_.vel[i] += acc[i] * dt;
        body_.pos[i] += body_.vel[i] * dt;
    }

    StepOutput out;
    const double r = p_.body_radius;

    // landing platform: disc of platform_radius whose top face is the goal height
    const double dx = body_.pos[0] - task_.goal[0];
    const double dy = body_.pos[1] - task_.goal[1];
    const double top = task_.goal[2];
    if (std::hypot(dx, dy) <= p_.platform_radius + r &&
        body_.pos[2] - r <= top && body_.pos[2] + r >= top - p_.platform_thickness) {
        body_.pos[2] = top + r;
        body_.vel[2] = std::max(0.0, body_.vel[2]);
        body_.vel[0] = 0.0;
        body_.vel[1] = 0.0;
        out.contacts.push_back(Contact{ContactKind::PLATFORM, -1, body_.pos});
    }

    if (body_.pos[2] - r <= 0.0) {
        body_.pos[2] = r;
        body_.vel = Vec3{0.0, 0.0, std::max(0.0, body_.vel[2])};
        out.contacts.push_back(Contact{ContactKind::GROUND, -1, body_.pos});
    }

    for (size_t i = 0; i < task_.obstacles.size(); i++) {
        const Obstacle& ob = task_.obstacles[i];
        bool hit = true;
        for (int a = 0; a < 3; a++) {
            if (std::fabs(body_.pos[a] - ob.center[a]) > ob.half_extents[a] + r) {
                hit = false;
                break;
            }
        }
        if (hit) out.contacts.push_back(Contact{ContactKind::OBSTACLE, (int)i, body_.pos});
    }

    out.obs = observe();
    return out;
}

} // namespace warden
