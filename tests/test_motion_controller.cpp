/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion/motion_controller.hpp"
#include "motion/path_registry.hpp"
#include "motion/paths/linear_path.hpp"
#include "motion/paths/spline_path.hpp"
#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <type_traits>

using namespace mpe::motion;

namespace {

    constexpr double EPS = 1e-9;

    void expectVecNear(const Point3D& actual, const Point3D& expected, const double tol = EPS) {
        EXPECT_NEAR(actual.x, expected.x, tol);
        EXPECT_NEAR(actual.y, expected.y, tol);
        EXPECT_NEAR(actual.z, expected.z, tol);
    }

    MotionControllerConfig linearConfig() {
        MotionControllerConfig config;
        config.path_type = "linear";
        config.duration = 100.0;
        return config;
    }

} // namespace

// ========== Progress ==========

TEST(CalculateProgress, NoLoopClamps) {
    EXPECT_DOUBLE_EQ(calculateProgress(50.0, 0.0, 100.0, 1.0, 0.0, LoopMode::NONE), 0.5);
    EXPECT_DOUBLE_EQ(calculateProgress(250.0, 0.0, 100.0, 1.0, 0.0, LoopMode::NONE), 1.0);
}

TEST(CalculateProgress, LoopWraps) {
    EXPECT_NEAR(calculateProgress(130.0, 0.0, 100.0, 1.0, 0.0, LoopMode::LOOP), 0.3, EPS);
    EXPECT_DOUBLE_EQ(calculateProgress(100.0, 0.0, 100.0, 1.0, 0.0, LoopMode::LOOP), 0.0);
    EXPECT_NEAR(calculateProgress(10.0, 0.0, 100.0, -1.0, 0.0, LoopMode::LOOP), 0.9, EPS);
}

TEST(CalculateProgress, PingPongMirrors) {
    const double forward = calculateProgress(3.0, 0.0, 10.0, 1.0, 0.0, LoopMode::PING_PONG);
    const double backward = calculateProgress(17.0, 0.0, 10.0, 1.0, 0.0, LoopMode::PING_PONG);
    EXPECT_NEAR(forward, 0.3, EPS);
    EXPECT_NEAR(backward, 0.3, EPS);
    EXPECT_NEAR(calculateProgress(23.0, 0.0, 10.0, 1.0, 0.0, LoopMode::PING_PONG), 0.3, EPS);
}

TEST(CalculateProgress, BeforeStartReturnsOffset) {
    EXPECT_DOUBLE_EQ(calculateProgress(5.0, 10.0, 100.0, 1.0, 0.25, LoopMode::LOOP), 0.25);
}

TEST(CalculateProgress, SpeedAndOffset) {
    EXPECT_NEAR(calculateProgress(25.0, 0.0, 100.0, 2.0, 0.1, LoopMode::NONE), 0.6, EPS);
}

TEST(CalculateProgress, NonPositiveDurationTreatedAsOne) {
    EXPECT_NEAR(calculateProgress(0.5, 0.0, 0.0, 1.0, 0.0, LoopMode::NONE), 0.5, EPS);
    EXPECT_NEAR(calculateProgress(0.25, 0.0, -3.0, 1.0, 0.0, LoopMode::LOOP), 0.25, EPS);
}

TEST(CalculateProgress, NonFiniteSpeedYieldsZero) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_DOUBLE_EQ(calculateProgress(10.0, 0.0, 100.0, inf, 0.0, LoopMode::LOOP), 0.0);
}

TEST(LoopMode, StringRoundTrip) {
    EXPECT_EQ(loopModeFromString("pingpong"), LoopMode::PING_PONG);
    EXPECT_EQ(loopModeFromString("none"), LoopMode::NONE);
    EXPECT_EQ(toString(LoopMode::LOOP), "loop");
    EXPECT_FALSE(loopModeFromString("bounce").has_value());
}

// ========== Controller ==========

TEST(MotionController, DefaultCircularLoopRepeats) {
    MotionControllerConfig config;
    config.duration = 60.0;
    const MotionController controller(config);
    ASSERT_TRUE(controller.hasPath());

    const MotionState first = controller.evaluate(0.0, 30.0);
    const MotionState wrapped = controller.evaluate(60.0, 30.0);
    expectVecNear(first.position, {5.0, 0.0, 0.0});
    expectVecNear(wrapped.position, first.position);
    expectVecNear(wrapped.tangent, first.tangent);
    EXPECT_NEAR(glm::length(first.tangent), 1.0, 1e-6);
    expectVecNear(first.scale, {1.0, 1.0, 1.0});
}

TEST(MotionController, LinearMidpoint) {
    const MotionController controller(linearConfig());
    const MotionState state = controller.evaluate(50.0, 30.0);
    EXPECT_DOUBLE_EQ(state.progress, 0.5);
    expectVecNear(state.position, {5.0, 0.0, 0.0});
    expectVecNear(state.tangent, {1.0, 0.0, 0.0});
}

TEST(MotionController, UnknownPathFallsBackToIdentity) {
    MotionControllerConfig config;
    config.path_type = "helix";
    const MotionController controller(config);
    EXPECT_FALSE(controller.hasPath());

    const MotionState state = controller.evaluate(30.0, 30.0);
    expectVecNear(state.position, {0.0, 0.0, 0.0});
    expectVecNear(state.scale, {1.0, 1.0, 1.0});
    EXPECT_EQ(state.tangent, DEFAULT_TANGENT);
    EXPECT_NEAR(state.progress, 0.1, EPS);
}

TEST(MotionController, PathPointsFromPath) {
    MotionController controller(linearConfig());
    const auto points = controller.getPathPoints(10);
    ASSERT_EQ(points.size(), 11u);
    expectVecNear(points.front(), {0.0, 0.0, 0.0});
    expectVecNear(points.back(), {10.0, 0.0, 0.0});

    MotionControllerConfig missing;
    missing.path_type = "helix";
    MotionController empty(missing);
    EXPECT_TRUE(empty.getPathPoints().empty());
}

TEST(MotionController, ModifiersFoldInOrder) {
    MotionControllerConfig config = linearConfig();
    config.modifiers = {
        {ModifierType::ROTATION, true, {{"speedY", 1.0}}},
        {ModifierType::LOOK_AT, true, {{"targetX", 100.0}}},
    };
    const MotionController controller(config);

    // lookAt runs last and overwrites the accumulated rotation
    const MotionState state = controller.evaluate(15.0, 30.0);
    EXPECT_NEAR(state.rotation.y, glm::half_pi<double>(), EPS);
    EXPECT_NEAR(state.rotation.x, 0.0, EPS);
}

TEST(MotionController, DisabledModifierIgnored) {
    MotionControllerConfig config = linearConfig();
    config.modifiers = {{ModifierType::WOBBLE, false, {{"amplitudeY", 3.0}}}};
    const MotionController controller(config);
    expectVecNear(controller.evaluate(50.0, 30.0).position, {5.0, 0.0, 0.0});
}

TEST(MotionController, AttachedModifiersRunAfterConfig) {
    MotionController controller(linearConfig());
    controller.addModifier(std::make_unique<BuiltinModifier>(ModifierType::SCALE_PULSE,
                                                             ModifierParams{{"minScale", 2.0}, {"maxScale", 2.0}}));
    controller.addModifier(nullptr);
    EXPECT_EQ(controller.attachedModifierCount(), 1u);
    expectVecNear(controller.evaluate(10.0, 30.0).scale, {2.0, 2.0, 2.0});

    EXPECT_FALSE(controller.removeModifier(ModifierType::WOBBLE));
    EXPECT_TRUE(controller.removeModifier(ModifierType::SCALE_PULSE));
    EXPECT_EQ(controller.attachedModifierCount(), 0u);
    expectVecNear(controller.evaluate(10.0, 30.0).scale, {1.0, 1.0, 1.0});
}

TEST(MotionController, ModifierUpdateDropsAttachedModifiers) {
    MotionController controller(linearConfig());
    controller.addModifier(std::make_unique<BuiltinModifier>(ModifierType::SCALE_PULSE,
                                                             ModifierParams{{"minScale", 2.0}, {"maxScale", 2.0}}));

    MotionConfigUpdate speed_only;
    speed_only.speed = 1.0;
    controller.setConfig(speed_only);
    EXPECT_EQ(controller.attachedModifierCount(), 1u);

    MotionConfigUpdate update;
    update.modifiers = std::vector<ModifierConfig>{{ModifierType::WOBBLE, true, {{"amplitudeY", 3.0}}}};
    controller.setConfig(update);
    EXPECT_EQ(controller.attachedModifierCount(), 0u);
    ASSERT_EQ(controller.getConfig().modifiers.size(), 1u);
    expectVecNear(controller.evaluate(10.0, 30.0).scale, {1.0, 1.0, 1.0});
}

TEST(MotionController, SetConfigSwapsPathType) {
    MotionController controller(MotionControllerConfig{});
    ASSERT_EQ(controller.getPath()->getConfig().type, "circular");

    MotionConfigUpdate update;
    update.path_type = "linear";
    update.duration = 100.0;
    controller.setConfig(update);

    EXPECT_EQ(controller.getConfig().path_type, "linear");
    EXPECT_EQ(controller.getPath()->getConfig().type, "linear");
    expectVecNear(controller.evaluate(50.0, 30.0).position, {5.0, 0.0, 0.0});
}

TEST(MotionController, SetConfigUpdatesParamsInPlace) {
    MotionController controller(MotionControllerConfig{});
    const PathGenerator* before = controller.getPath();

    MotionConfigUpdate update;
    update.path_params = ParamMap{{"radiusX", 2.0}};
    controller.setConfig(update);

    EXPECT_EQ(controller.getPath(), before);
    expectVecNear(controller.evaluate(0.0, 30.0).position, {2.0, 0.0, 0.0});

    // Full replacement restores dropped keys to their defaults
    update.path_params = ParamMap{{"radiusY", 1.0}};
    controller.setConfig(update);
    EXPECT_DOUBLE_EQ(controller.getPath()->getParams().at("radiusX"), 5.0);
    EXPECT_DOUBLE_EQ(controller.getPath()->getParams().at("radiusY"), 1.0);
}

TEST(MotionController, SetConfigKeepsUntouchedFields) {
    MotionController controller(linearConfig());
    MotionConfigUpdate update;
    update.speed = 2.0;
    update.loop = LoopMode::NONE;
    controller.setConfig(update);

    EXPECT_EQ(controller.getConfig().path_type, "linear");
    EXPECT_DOUBLE_EQ(controller.getConfig().duration, 100.0);
    EXPECT_DOUBLE_EQ(controller.progressAt(75.0), 1.0);
}

TEST(MotionController, RecoversFromUnknownPathOnUpdate) {
    MotionControllerConfig config;
    config.path_type = "helix";
    MotionController controller(config);
    ASSERT_FALSE(controller.hasPath());

    MotionConfigUpdate update;
    update.path_type = "circular";
    controller.setConfig(update);
    EXPECT_TRUE(controller.hasPath());
}

TEST(MotionController, SplineControlPointsEditableThroughPath) {
    MotionControllerConfig config;
    config.path_type = "spline";
    config.loop = LoopMode::NONE;
    config.duration = 10.0;
    MotionController controller(config);

    auto* spline = dynamic_cast<SplinePath*>(controller.getPath());
    ASSERT_NE(spline, nullptr);
    spline->setControlPoints({{0.0, 0.0, 0.0}, {0.0, 0.0, 4.0}});
    expectVecNear(controller.evaluate(10.0, 30.0).position, {0.0, 0.0, 4.0});
}

TEST(MotionController, IsolatedRegistry) {
    PathRegistry registry(false);
    const MotionController controller(MotionControllerConfig{}, registry);
    EXPECT_FALSE(controller.hasPath());
}

TEST(MotionController, RejectsTemporaryRegistry) {
    static_assert(std::is_constructible_v<MotionController, MotionControllerConfig, const PathRegistry&>);
    static_assert(!std::is_constructible_v<MotionController, MotionControllerConfig, PathRegistry>);
    static_assert(!std::is_constructible_v<MotionController, MotionControllerConfig, const PathRegistry&&>);

    PathRegistry registry(false);
    MotionController controller(MotionControllerConfig{}, registry);
    ASSERT_TRUE(registry.registerPath(makeRegistryEntry<LinearPath>()));

    MotionConfigUpdate update;
    update.path_type = "linear";
    controller.setConfig(update);
    EXPECT_TRUE(controller.hasPath());
}
