/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion/modifiers.hpp"
#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>

using namespace mpe::motion;

namespace {

    constexpr double EPS = 1e-9;
    constexpr double TWO_PI = glm::two_pi<double>();

    void expectVecNear(const Point3D& actual, const Point3D& expected, const double tol = EPS) {
        EXPECT_NEAR(actual.x, expected.x, tol);
        EXPECT_NEAR(actual.y, expected.y, tol);
        EXPECT_NEAR(actual.z, expected.z, tol);
    }

} // namespace

TEST(ModifierParams, NumberLookup) {
    const ModifierParams params{{"a", 2.5}, {"flag", true}, {"name", std::string{"x"}}};
    EXPECT_DOUBLE_EQ(numberParam(params, "a", 0.0), 2.5);
    EXPECT_DOUBLE_EQ(numberParam(params, "missing", 7.0), 7.0);
    EXPECT_DOUBLE_EQ(numberParam(params, "name", 3.0), 3.0);
    EXPECT_DOUBLE_EQ(numberParam(params, "flag", 4.0), 4.0);
}

TEST(ModifierParams, BoolLookupAcceptsNumbers) {
    const ModifierParams params{{"on", true}, {"one", 1.0}, {"zero", 0.0}, {"name", std::string{"yes"}}};
    EXPECT_TRUE(boolParam(params, "on", false));
    EXPECT_TRUE(boolParam(params, "one", false));
    EXPECT_FALSE(boolParam(params, "zero", true));
    EXPECT_TRUE(boolParam(params, "name", true));
    EXPECT_FALSE(boolParam(params, "missing", false));
}

TEST(ModifierType, StringRoundTrip) {
    for (const auto type : {ModifierType::ROTATION, ModifierType::WOBBLE,
                            ModifierType::SCALE_PULSE, ModifierType::LOOK_AT}) {
        EXPECT_EQ(modifierTypeFromString(toString(type)), type);
    }
    EXPECT_EQ(toString(ModifierType::SCALE_PULSE), "scalePulse");
    EXPECT_FALSE(modifierTypeFromString("spin").has_value());
}

TEST(RotationModifier, RevolutionsPerSecond) {
    const MotionState state = applyRotation(defaultMotionState(), 1.0, {{"speedY", 1.0}});
    expectVecNear(state.rotation, {0.0, TWO_PI, 0.0});
}

TEST(RotationModifier, AdditiveAndReplace) {
    MotionState base = defaultMotionState();
    base.rotation = {0.5, 0.0, 0.0};

    const MotionState added = applyRotation(base, 0.25, {{"speedZ", 1.0}});
    expectVecNear(added.rotation, {0.5, 0.0, TWO_PI * 0.25});

    const MotionState replaced = applyRotation(base, 0.25, {{"speedZ", 1.0}, {"additive", false}});
    expectVecNear(replaced.rotation, {0.0, 0.0, TWO_PI * 0.25});
}

TEST(WobbleModifier, OffsetsPosition) {
    MotionState base = defaultMotionState();
    base.position = {1.0, 1.0, 1.0};

    const MotionState state = applyWobble(base, 0.25, {{"amplitudeX", 2.0}, {"frequency", 1.0}});
    expectVecNear(state.position, {3.0, 1.0, 1.0});
}

TEST(WobbleModifier, ZeroAmplitudeIsIdentity) {
    const MotionState state = applyWobble(defaultMotionState(), 0.37, {});
    expectVecNear(state.position, {0.0, 0.0, 0.0});
}

TEST(ScalePulseModifier, UniformRange) {
    const MotionState rest = applyScalePulse(defaultMotionState(), 0.0, {});
    expectVecNear(rest.scale, {1.0, 1.0, 1.0});

    const MotionState peak = applyScalePulse(defaultMotionState(), 0.25, {});
    expectVecNear(peak.scale, {1.1, 1.1, 1.1});

    const MotionState trough = applyScalePulse(defaultMotionState(), 0.75, {});
    expectVecNear(trough.scale, {0.9, 0.9, 0.9});
}

TEST(ScalePulseModifier, NonUniformAxesDiffer) {
    const MotionState state = applyScalePulse(defaultMotionState(), 0.25, {{"uniform", false}});
    EXPECT_NEAR(state.scale.x, 1.1, EPS);
    EXPECT_NE(state.scale.x, state.scale.y);
    EXPECT_NE(state.scale.y, state.scale.z);
    for (int axis = 0; axis < 3; ++axis) {
        EXPECT_GE(state.scale[axis], 0.9 - EPS);
        EXPECT_LE(state.scale[axis], 1.1 + EPS);
    }
}

TEST(LookAtModifier, FacesTarget) {
    const MotionState ahead = applyLookAt(defaultMotionState(), {{"targetZ", 10.0}});
    expectVecNear(ahead.rotation, {0.0, 0.0, 0.0});

    const MotionState side = applyLookAt(defaultMotionState(), {{"targetX", 10.0}});
    expectVecNear(side.rotation, {0.0, glm::half_pi<double>(), 0.0});

    const MotionState above = applyLookAt(defaultMotionState(), {{"targetY", 10.0}});
    EXPECT_NEAR(above.rotation.x, -glm::half_pi<double>(), EPS);
}

TEST(LookAtModifier, FollowPathUsesTangent) {
    MotionState base = defaultMotionState();
    base.tangent = {1.0, 0.0, 0.0};

    const MotionState state = applyLookAt(base, {{"followPath", true}});
    expectVecNear(state.rotation, {0.0, glm::half_pi<double>(), 0.0});
}

TEST(ApplyModifier, DisabledIsSkipped) {
    const ModifierConfig config{ModifierType::WOBBLE, false, {{"amplitudeX", 5.0}}};
    const MotionState state = applyModifier(config, defaultMotionState(), 0.25);
    expectVecNear(state.position, {0.0, 0.0, 0.0});
}

TEST(BuiltinModifier, UsesFrameAndFps) {
    BuiltinModifier modifier(ModifierType::ROTATION, {{"speedX", 1.0}});
    EXPECT_EQ(modifier.type(), ModifierType::ROTATION);

    const MotionState state = modifier.apply(defaultMotionState(), 15.0, 30.0);
    EXPECT_NEAR(state.rotation.x, glm::pi<double>(), EPS);
}

TEST(BuiltinModifier, SetParamsMerges) {
    BuiltinModifier modifier(ModifierType::WOBBLE, {{"amplitudeX", 1.0}});
    modifier.setParams({{"amplitudeY", 2.0}});
    const ModifierParams params = modifier.getParams();
    EXPECT_EQ(params.size(), 2u);
    EXPECT_DOUBLE_EQ(std::get<double>(params.at("amplitudeX")), 1.0);
    EXPECT_DOUBLE_EQ(std::get<double>(params.at("amplitudeY")), 2.0);
}

TEST(ElapsedSeconds, NonPositiveFpsTreatedAsOne) {
    EXPECT_DOUBLE_EQ(elapsedSeconds(60.0, 30.0), 2.0);
    EXPECT_DOUBLE_EQ(elapsedSeconds(60.0, 0.0), 60.0);
    EXPECT_DOUBLE_EQ(elapsedSeconds(60.0, -5.0), 60.0);
}
