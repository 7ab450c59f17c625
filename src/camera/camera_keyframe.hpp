/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mpe::camera {

    inline constexpr double DEFAULT_FOV = 50.0;
    inline constexpr double DEFAULT_TENSION = 0.5;
    inline constexpr glm::dquat IDENTITY_ROTATION{1, 0, 0, 0};
    inline constexpr glm::dvec3 FALLBACK_CAMERA_POSITION{0.0, 0.0, 10.0};

    struct CameraKeyframe {
        int frame = 0;
        glm::dvec3 position{0.0};
        glm::dquat rotation = IDENTITY_ROTATION;
        std::optional<double> fov; // unset inherits the path default

        [[nodiscard]] bool operator<(const CameraKeyframe& other) const { return frame < other.frame; }
    };

    struct CameraState {
        glm::dvec3 position = FALLBACK_CAMERA_POSITION;
        glm::dquat rotation = IDENTITY_ROTATION;
        double fov = DEFAULT_FOV;
    };

    enum class CameraPathType : uint8_t {
        STATIC,
        PATH,
        KEYFRAME
    };

    [[nodiscard]] std::string_view toString(CameraPathType type);
    [[nodiscard]] std::optional<CameraPathType> cameraPathTypeFromString(std::string_view name);

    // Camera section of a scene
    struct CameraPathDescriptor {
        CameraPathType type = CameraPathType::STATIC;
        double fov = DEFAULT_FOV;
        std::optional<double> near_plane;
        std::optional<double> far_plane;
        std::optional<glm::dvec3> position; // static only
        std::optional<glm::dvec3> look_at;  // static only
        std::vector<CameraKeyframe> keyframes;
    };

    // Procedural preview orbit around a fixed center
    struct OrbitCameraParams {
        glm::dvec3 center{0.0};
        double distance = 10.0;
        double speed = 0.1;     // revolutions per second
        double elevation = 0.3; // fraction of pi
        double offset = 0.0;    // radians
        double fov = DEFAULT_FOV;
    };

} // namespace mpe::camera
