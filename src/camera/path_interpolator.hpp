/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera_keyframe.hpp"
#include <optional>
#include <span>
#include <vector>

namespace mpe::camera {

    inline constexpr int DEFAULT_PATH_SAMPLES = 20;
    inline constexpr double DEFAULT_SIMPLIFY_TOLERANCE = 0.1;
    inline constexpr int DEFAULT_SMOOTH_WINDOW = 3;

    // ========== Quaternion helpers ==========

    // Shortest-arc SLERP; nearly parallel inputs fall back to normalized lerp
    [[nodiscard]] glm::dquat slerp(const glm::dquat& q1, const glm::dquat& q2, double t);

    // Zero-length input yields identity
    [[nodiscard]] glm::dquat normalizeQuat(const glm::dquat& q);

    // Euler angles in radians, XYZ order
    [[nodiscard]] glm::dquat eulerToQuat(const glm::dvec3& euler);

    // (roll, pitch, yaw); pitch is clamped to +-pi/2 at the poles
    [[nodiscard]] glm::dvec3 quatToEuler(const glm::dquat& q);

    // Orients a -Z forward, +Y up camera toward target
    [[nodiscard]] glm::dquat lookAtRotation(const glm::dvec3& position, const glm::dvec3& target);

    // ========== Position spline ==========

    [[nodiscard]] glm::dvec3 catmullRom(const glm::dvec3& p0, const glm::dvec3& p1,
                                        const glm::dvec3& p2, const glm::dvec3& p3,
                                        double t, double tension = DEFAULT_TENSION);

    // ========== Keyframe evaluation ==========

    // Keyframes must be sorted by frame
    [[nodiscard]] CameraState interpolateCameraPath(std::span<const CameraKeyframe> keyframes, double frame,
                                                    double default_fov = DEFAULT_FOV,
                                                    double tension = DEFAULT_TENSION);

    [[nodiscard]] std::vector<glm::dvec3> generatePathPoints(std::span<const CameraKeyframe> keyframes,
                                                             int samples_per_segment = DEFAULT_PATH_SAMPLES,
                                                             double tension = DEFAULT_TENSION);

    // nullopt when a path/keyframe descriptor carries no keyframes
    [[nodiscard]] std::optional<CameraState> evaluateCameraPath(const CameraPathDescriptor& descriptor, double frame,
                                                                double tension = DEFAULT_TENSION);

    [[nodiscard]] CameraState orbitCameraState(const OrbitCameraParams& params, double frame, double fps);

    // ========== Keyframe processing ==========

    // Ramer-Douglas-Peucker on positions; endpoints are always kept
    [[nodiscard]] std::vector<CameraKeyframe> simplifyPath(std::span<const CameraKeyframe> keyframes,
                                                           double tolerance = DEFAULT_SIMPLIFY_TOLERANCE);

    [[nodiscard]] std::vector<CameraKeyframe> resampleKeyframes(std::span<const CameraKeyframe> keyframes,
                                                                int interval);

    // Moving average of positions only
    [[nodiscard]] std::vector<CameraKeyframe> smoothKeyframes(std::span<const CameraKeyframe> keyframes,
                                                              int window_size = DEFAULT_SMOOTH_WINDOW);

} // namespace mpe::camera
