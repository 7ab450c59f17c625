/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "path_interpolator.hpp"
#include "core/logger.hpp"
#include "motion/modifiers.hpp"
#include "motion/paths/spline_path.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace mpe::camera {

    namespace {
        constexpr double SLERP_LERP_THRESHOLD = 0.9995;
        constexpr double LOOK_AT_EPSILON = 1e-12;
        constexpr double POLE_THRESHOLD = 1.0 - 1e-9;
        constexpr glm::dvec3 WORLD_UP{0.0, 1.0, 0.0};
        constexpr glm::dvec3 POLE_UP{0.0, 0.0, -1.0};

        [[nodiscard]] double pointSegmentDistance(const glm::dvec3& point,
                                                  const glm::dvec3& start,
                                                  const glm::dvec3& end) {
            const glm::dvec3 chord = end - start;
            const double length_sq = glm::dot(chord, chord);
            if (length_sq == 0.0) {
                return glm::length(point - start);
            }
            const double t = std::clamp(glm::dot(point - start, chord) / length_sq, 0.0, 1.0);
            return glm::length(point - (start + t * chord));
        }

        // Marks the indices in [first, last] that survive simplification
        void simplifyRange(std::span<const CameraKeyframe> keyframes, const size_t first, const size_t last,
                           const double tolerance, std::vector<bool>& keep) {
            if (last <= first + 1) return;

            double max_distance = 0.0;
            size_t max_index = first;
            for (size_t i = first + 1; i < last; ++i) {
                const double distance = pointSegmentDistance(keyframes[i].position,
                                                             keyframes[first].position,
                                                             keyframes[last].position);
                if (distance > max_distance) {
                    max_distance = distance;
                    max_index = i;
                }
            }

            if (max_index != first && max_distance > tolerance) {
                keep[max_index] = true;
                simplifyRange(keyframes, first, max_index, tolerance, keep);
                simplifyRange(keyframes, max_index, last, tolerance, keep);
            }
        }

        [[nodiscard]] CameraState keyframeState(const CameraKeyframe& keyframe, const double default_fov) {
            return {keyframe.position, keyframe.rotation, keyframe.fov.value_or(default_fov)};
        }
    } // namespace

    glm::dquat normalizeQuat(const glm::dquat& q) {
        const double len = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
        if (len == 0.0 || !std::isfinite(len)) {
            return IDENTITY_ROTATION;
        }
        return {q.w / len, q.x / len, q.y / len, q.z / len};
    }

    glm::dquat slerp(const glm::dquat& q1, const glm::dquat& q2, const double t) {
        double dot = glm::dot(q1, q2);
        glm::dquat target = q2;
        if (dot < 0.0) {
            target = -q2;
            dot = -dot;
        }

        if (dot > SLERP_LERP_THRESHOLD) {
            return normalizeQuat(q1 + t * (target - q1));
        }

        const double theta0 = std::acos(std::min(dot, 1.0));
        const double theta = theta0 * t;
        const double sin_theta0 = std::sin(theta0);
        const double s0 = std::cos(theta) - dot * std::sin(theta) / sin_theta0;
        const double s1 = std::sin(theta) / sin_theta0;
        return normalizeQuat(s0 * q1 + s1 * target);
    }

    glm::dquat eulerToQuat(const glm::dvec3& euler) {
        const double c1 = std::cos(euler.x / 2.0);
        const double c2 = std::cos(euler.y / 2.0);
        const double c3 = std::cos(euler.z / 2.0);
        const double s1 = std::sin(euler.x / 2.0);
        const double s2 = std::sin(euler.y / 2.0);
        const double s3 = std::sin(euler.z / 2.0);

        return {c1 * c2 * c3 - s1 * s2 * s3,
                s1 * c2 * c3 + c1 * s2 * s3,
                c1 * s2 * c3 - s1 * c2 * s3,
                c1 * c2 * s3 + s1 * s2 * c3};
    }

    glm::dvec3 quatToEuler(const glm::dquat& q) {
        const double roll = std::atan2(2.0 * (q.w * q.x + q.y * q.z),
                                       1.0 - 2.0 * (q.x * q.x + q.y * q.y));

        const double sinp = 2.0 * (q.w * q.y - q.z * q.x);
        const double pitch = std::abs(sinp) >= 1.0
                                 ? std::copysign(glm::half_pi<double>(), sinp)
                                 : std::asin(sinp);

        const double yaw = std::atan2(2.0 * (q.w * q.z + q.x * q.y),
                                      1.0 - 2.0 * (q.y * q.y + q.z * q.z));
        return {roll, pitch, yaw};
    }

    glm::dquat lookAtRotation(const glm::dvec3& position, const glm::dvec3& target) {
        const glm::dvec3 offset = target - position;
        const double distance = glm::length(offset);
        if (distance < LOOK_AT_EPSILON || !std::isfinite(distance)) {
            return IDENTITY_ROTATION;
        }
        const glm::dvec3 direction = offset / distance;
        const glm::dvec3 up = std::abs(glm::dot(direction, WORLD_UP)) > POLE_THRESHOLD ? POLE_UP : WORLD_UP;
        return normalizeQuat(glm::quatLookAt(direction, up));
    }

    glm::dvec3 catmullRom(const glm::dvec3& p0, const glm::dvec3& p1,
                          const glm::dvec3& p2, const glm::dvec3& p3,
                          const double t, const double tension) {
        return motion::catmullRomPoint(p0, p1, p2, p3, t, tension);
    }

    CameraState interpolateCameraPath(std::span<const CameraKeyframe> keyframes, const double frame,
                                      const double default_fov, const double tension) {
        if (keyframes.empty()) {
            return {FALLBACK_CAMERA_POSITION, IDENTITY_ROTATION, default_fov};
        }
        if (keyframes.size() == 1) {
            return keyframeState(keyframes[0], default_fov);
        }

        // Bracketing segment; frames outside every segment use the last one
        const size_t last = keyframes.size() - 1;
        size_t i1 = last - 1;
        for (size_t i = 0; i < last; ++i) {
            if (frame >= keyframes[i].frame && frame < keyframes[i + 1].frame) {
                i1 = i;
                break;
            }
        }

        const CameraKeyframe& k0 = keyframes[i1 > 0 ? i1 - 1 : 0];
        const CameraKeyframe& k1 = keyframes[i1];
        const CameraKeyframe& k2 = keyframes[std::min(last, i1 + 1)];
        const CameraKeyframe& k3 = keyframes[std::min(last, i1 + 2)];

        double t = 0.0;
        if (k2.frame != k1.frame) {
            t = (frame - k1.frame) / static_cast<double>(k2.frame - k1.frame);
        }
        t = std::isfinite(t) ? std::clamp(t, 0.0, 1.0) : 0.0;

        const double fov1 = k1.fov.value_or(default_fov);
        const double fov2 = k2.fov.value_or(default_fov);

        return {catmullRom(k0.position, k1.position, k2.position, k3.position, t, tension),
                slerp(k1.rotation, k2.rotation, t),
                fov1 + (fov2 - fov1) * t};
    }

    std::vector<glm::dvec3> generatePathPoints(std::span<const CameraKeyframe> keyframes,
                                               const int samples_per_segment, const double tension) {
        if (keyframes.size() < 2) {
            return keyframes.empty() ? std::vector<glm::dvec3>{} : std::vector<glm::dvec3>{keyframes[0].position};
        }

        const int samples = std::max(samples_per_segment, 1);
        const size_t last = keyframes.size() - 1;

        std::vector<glm::dvec3> points;
        points.reserve(last * static_cast<size_t>(samples) + 1);

        for (size_t seg = 0; seg < last; ++seg) {
            const CameraKeyframe& k0 = keyframes[seg > 0 ? seg - 1 : seg];
            const CameraKeyframe& k1 = keyframes[seg];
            const CameraKeyframe& k2 = keyframes[seg + 1];
            const CameraKeyframe& k3 = keyframes[std::min(last, seg + 2)];

            // Closing sample only on the final segment
            const int count = seg + 1 == last ? samples + 1 : samples;
            for (int i = 0; i < count; ++i) {
                const double t = static_cast<double>(i) / static_cast<double>(samples);
                points.push_back(catmullRom(k0.position, k1.position, k2.position, k3.position, t, tension));
            }
        }
        return points;
    }

    std::optional<CameraState> evaluateCameraPath(const CameraPathDescriptor& descriptor, const double frame,
                                                  const double tension) {
        switch (descriptor.type) {
            case CameraPathType::STATIC: {
                const glm::dvec3 position = descriptor.position.value_or(FALLBACK_CAMERA_POSITION);
                const glm::dquat rotation = descriptor.look_at
                                                ? lookAtRotation(position, *descriptor.look_at)
                                                : IDENTITY_ROTATION;
                return CameraState{position, rotation, descriptor.fov};
            }
            case CameraPathType::PATH:
            case CameraPathType::KEYFRAME:
                if (descriptor.keyframes.empty()) {
                    return std::nullopt;
                }
                return interpolateCameraPath(descriptor.keyframes, frame, descriptor.fov, tension);
        }
        LOG_WARN("Unhandled camera path type {}", static_cast<int>(descriptor.type));
        return std::nullopt;
    }

    CameraState orbitCameraState(const OrbitCameraParams& params, const double frame, const double fps) {
        const double time = motion::elapsedSeconds(frame, fps);
        const double angle = time * params.speed * glm::two_pi<double>() + params.offset;
        const double d = params.distance;

        const glm::dvec3 position = params.center + glm::dvec3{std::cos(angle) * d,
                                                               std::sin(params.elevation * glm::pi<double>()) * d,
                                                               std::sin(angle) * d};
        return {position, lookAtRotation(position, params.center), params.fov};
    }

    std::vector<CameraKeyframe> simplifyPath(std::span<const CameraKeyframe> keyframes, const double tolerance) {
        if (keyframes.size() <= 2) {
            return {keyframes.begin(), keyframes.end()};
        }

        std::vector<bool> keep(keyframes.size(), false);
        keep.front() = true;
        keep.back() = true;
        const double clamped_tolerance = std::isnan(tolerance) ? 0.0 : std::max(tolerance, 0.0);
        simplifyRange(keyframes, 0, keyframes.size() - 1, clamped_tolerance, keep);

        std::vector<CameraKeyframe> result;
        for (size_t i = 0; i < keyframes.size(); ++i) {
            if (keep[i]) result.push_back(keyframes[i]);
        }
        LOG_DEBUG("Simplified camera path {} -> {} keyframes", keyframes.size(), result.size());
        return result;
    }

    std::vector<CameraKeyframe> resampleKeyframes(std::span<const CameraKeyframe> keyframes, const int interval) {
        if (keyframes.size() < 2 || interval <= 0) {
            return {keyframes.begin(), keyframes.end()};
        }

        const int start_frame = keyframes.front().frame;
        const int end_frame = keyframes.back().frame;

        std::vector<CameraKeyframe> result;
        for (int64_t frame = start_frame; frame <= end_frame; frame += interval) {
            const CameraState state = interpolateCameraPath(keyframes, static_cast<double>(frame));
            result.push_back({static_cast<int>(frame), state.position, state.rotation, state.fov});
        }
        return result;
    }

    std::vector<CameraKeyframe> smoothKeyframes(std::span<const CameraKeyframe> keyframes, const int window_size) {
        if (window_size <= 0 || keyframes.size() < static_cast<size_t>(window_size)) {
            return {keyframes.begin(), keyframes.end()};
        }

        const size_t half_window = static_cast<size_t>(window_size / 2);
        const size_t last = keyframes.size() - 1;

        std::vector<CameraKeyframe> result;
        result.reserve(keyframes.size());
        for (size_t i = 0; i < keyframes.size(); ++i) {
            const size_t start = i > half_window ? i - half_window : 0;
            const size_t end = std::min(last, i + half_window);

            glm::dvec3 sum{0.0};
            for (size_t j = start; j <= end; ++j) {
                sum += keyframes[j].position;
            }

            CameraKeyframe smoothed = keyframes[i];
            smoothed.position = sum / static_cast<double>(end - start + 1);
            result.push_back(smoothed);
        }
        return result;
    }

} // namespace mpe::camera
