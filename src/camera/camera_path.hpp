/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "camera_keyframe.hpp"
#include "path_interpolator.hpp"
#include <nlohmann/json_fwd.hpp>
#include <span>
#include <string>
#include <vector>

namespace mpe::camera {

    // Vectors are [x,y,z]; quaternions are [x,y,z,w]
    void to_json(nlohmann::json& j, const CameraKeyframe& keyframe);
    void from_json(const nlohmann::json& j, CameraKeyframe& keyframe);
    void to_json(nlohmann::json& j, const CameraPathDescriptor& descriptor);
    void from_json(const nlohmann::json& j, CameraPathDescriptor& descriptor);

    // Editable keyframe track, kept sorted by frame
    class CameraPath {
    public:
        void addKeyframe(const CameraKeyframe& keyframe);
        void removeKeyframe(size_t index);
        void setKeyframeFrame(size_t index, int new_frame, bool sort = true);
        void updateKeyframe(size_t index, const glm::dvec3& position, const glm::dquat& rotation,
                            std::optional<double> fov);
        void sortKeyframes();
        void clear();

        [[nodiscard]] const CameraKeyframe* getKeyframe(size_t index) const;

        [[nodiscard]] bool empty() const { return keyframes_.empty(); }
        [[nodiscard]] size_t size() const { return keyframes_.size(); }
        [[nodiscard]] std::span<const CameraKeyframe> keyframes() const { return keyframes_; }

        [[nodiscard]] int duration() const;
        [[nodiscard]] int startFrame() const;
        [[nodiscard]] int endFrame() const;

        [[nodiscard]] double fov() const { return fov_; }
        void setFov(const double fov) { fov_ = fov; }

        [[nodiscard]] double tension() const { return tension_; }
        void setTension(const double tension) { tension_ = tension; }

        [[nodiscard]] CameraState evaluate(double frame) const;
        [[nodiscard]] std::vector<glm::dvec3> generatePath(int samples_per_segment = DEFAULT_PATH_SAMPLES) const;

        void simplify(double tolerance = DEFAULT_SIMPLIFY_TOLERANCE);
        void resample(int interval);
        void smooth(int window_size = DEFAULT_SMOOTH_WINDOW);

        [[nodiscard]] bool saveToJson(const std::string& path) const;
        [[nodiscard]] bool loadFromJson(const std::string& path);

    private:
        std::vector<CameraKeyframe> keyframes_;
        double fov_ = DEFAULT_FOV;
        double tension_ = DEFAULT_TENSION;
    };

} // namespace mpe::camera
