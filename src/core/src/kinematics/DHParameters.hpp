/**
 * @file DHParameters.hpp
 * @brief Denavit-Hartenberg table for the 6-DOF arm
 *
 * Each joint transform is the standard DH composition
 *
 *   T_i = Rz(q_i + theta_i) * Tz(d_i) * Tx(a_i) * Rx(alpha_i)
 *
 * expanded into closed form. The order is part of the arm geometry and
 * must not be rearranged.
 */

#pragma once

#include "MathTypes.hpp"
#include <string>

namespace arm_kinematics {
namespace kinematics {

// ============================================================================
// Link Lengths
// ============================================================================

using LinkLengths = std::array<double, NUM_JOINTS>;

// ============================================================================
// DH Joint
// ============================================================================

/**
 * Cosine/sine of a fixed angle. Whole quarter turns are returned exactly
 * so that, e.g., a twist of pi/2 gives cos = 0 instead of 6.1e-17.
 */
struct UnitPair {
    double c;
    double s;

    static UnitPair of(double angle) {
        const double quarters = angle / (PI / 2.0);
        const double rounded = std::round(quarters);
        if (std::abs(quarters - rounded) < 1e-12) {
            switch (((static_cast<long>(rounded) % 4) + 4) % 4) {
                case 0: return {1.0, 0.0};
                case 1: return {0.0, 1.0};
                case 2: return {-1.0, 0.0};
                default: return {0.0, -1.0};
            }
        }
        return {std::cos(angle), std::sin(angle)};
    }
};

/**
 * Fixed DH parameters of one revolute joint
 */
struct DHJoint {
    double thetaOffset; // Fixed rotation added to the joint angle (rad)
    double d;           // Link offset along new z
    double a;           // Link length along new x
    double alpha;       // Link twist about new x (rad)
    std::string name;

    // Precomputed
    UnitPair offsetTrig;
    UnitPair twistTrig;

    DHJoint(double thetaOffset_, double d_, double a_, double alpha_, const std::string& name_)
        : thetaOffset(thetaOffset_), d(d_), a(a_), alpha(alpha_), name(name_),
          offsetTrig(UnitPair::of(thetaOffset_)),
          twistTrig(UnitPair::of(alpha_)) {}
};

// ============================================================================
// DH Table
// ============================================================================

/**
 * Closed-form per-joint transforms of the arm, built once from link lengths.
 *
 * Joint layout (l1..l6 are the link lengths):
 *
 *   joint  theta    d        a    alpha
 *     1    0        l1       0    +pi/2
 *     2    0        0        l2   0
 *     3    0        0        l3   -pi/2
 *     4    0        l4       0    -pi/2
 *     5    -pi/2    0        0    -pi/2
 *     6    0        l5+l6    0    0
 */
class DHTable {
public:
    /**
     * @throws std::invalid_argument if a link length is not finite and positive
     */
    explicit DHTable(const LinkLengths& linkLengths);

    /**
     * Homogeneous transform of joint i for joint angle q
     * @throws std::out_of_range if jointIndex is not in [0, 5]
     */
    Matrix4d transform(int jointIndex, double angle) const;

    const DHJoint& joint(int jointIndex) const;
    const LinkLengths& linkLengths() const { return linkLengths_; }

private:
    LinkLengths linkLengths_;
    std::vector<DHJoint> joints_;
};

// ============================================================================
// Implementation
// ============================================================================

inline DHTable::DHTable(const LinkLengths& linkLengths)
    : linkLengths_(linkLengths) {
    for (int i = 0; i < NUM_JOINTS; ++i) {
        if (!std::isfinite(linkLengths[i]) || linkLengths[i] <= 0.0) {
            throw std::invalid_argument("Link length l" + std::to_string(i + 1) +
                                        " must be finite and positive");
        }
    }

    const double l1 = linkLengths[0];
    const double l2 = linkLengths[1];
    const double l3 = linkLengths[2];
    const double l4 = linkLengths[3];
    const double l5 = linkLengths[4];
    const double l6 = linkLengths[5];

    joints_ = {
        DHJoint(0.0,       l1,      0.0, PI / 2.0,  "J1_Base"),
        DHJoint(0.0,       0.0,     l2,  0.0,       "J2_Shoulder"),
        DHJoint(0.0,       0.0,     l3,  -PI / 2.0, "J3_Elbow"),
        DHJoint(0.0,       l4,      0.0, -PI / 2.0, "J4_Wrist1"),
        DHJoint(-PI / 2.0, 0.0,     0.0, -PI / 2.0, "J5_Wrist2"),
        DHJoint(0.0,       l5 + l6, 0.0, 0.0,       "J6_Flange")
    };
}

inline const DHJoint& DHTable::joint(int jointIndex) const {
    if (jointIndex < 0 || jointIndex >= NUM_JOINTS) {
        throw std::out_of_range("Joint index " + std::to_string(jointIndex) + " out of range");
    }
    return joints_[jointIndex];
}

inline Matrix4d DHTable::transform(int jointIndex, double angle) const {
    const auto& dh = joint(jointIndex);

    // cos/sin of (angle + offset) by angle addition against the exact offset pair
    const double cq = std::cos(angle);
    const double sq = std::sin(angle);
    const double ct = cq * dh.offsetTrig.c - sq * dh.offsetTrig.s;
    const double st = sq * dh.offsetTrig.c + cq * dh.offsetTrig.s;
    const double ca = dh.twistTrig.c;
    const double sa = dh.twistTrig.s;

    Matrix4d T;
    T << ct,  -st * ca,  st * sa,  dh.a * ct,
         st,   ct * ca, -ct * sa,  dh.a * st,
         0.0,  sa,       ca,       dh.d,
         0.0,  0.0,      0.0,      1.0;

    return T;
}

} // namespace kinematics
} // namespace arm_kinematics
