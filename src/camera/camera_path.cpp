/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "camera_path.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mpe::camera {

    using json = nlohmann::json;

    namespace {
        constexpr int JSON_VERSION = 1;

        json vecToJson(const glm::dvec3& v) {
            return json::array({v.x, v.y, v.z});
        }

        glm::dvec3 vecFromJson(const json& j) {
            return {j.at(0).get<double>(), j.at(1).get<double>(), j.at(2).get<double>()};
        }

        json quatToJson(const glm::dquat& q) {
            return json::array({q.x, q.y, q.z, q.w});
        }

        glm::dquat quatFromJson(const json& j) {
            return normalizeQuat({j.at(3).get<double>(), j.at(0).get<double>(),
                                  j.at(1).get<double>(), j.at(2).get<double>()});
        }
    } // namespace

    std::string_view toString(const CameraPathType type) {
        switch (type) {
            case CameraPathType::STATIC:
                return "static";
            case CameraPathType::PATH:
                return "path";
            case CameraPathType::KEYFRAME:
                return "keyframe";
        }
        return "static";
    }

    std::optional<CameraPathType> cameraPathTypeFromString(const std::string_view name) {
        if (name == "static") return CameraPathType::STATIC;
        if (name == "path") return CameraPathType::PATH;
        if (name == "keyframe") return CameraPathType::KEYFRAME;
        return std::nullopt;
    }

    void to_json(json& j, const CameraKeyframe& keyframe) {
        j = json{{"frame", keyframe.frame},
                 {"position", vecToJson(keyframe.position)},
                 {"rotation", quatToJson(keyframe.rotation)}};
        if (keyframe.fov) {
            j["fov"] = *keyframe.fov;
        }
    }

    void from_json(const json& j, CameraKeyframe& keyframe) {
        keyframe.frame = j.at("frame").get<int>();
        keyframe.position = vecFromJson(j.at("position"));
        keyframe.rotation = j.contains("rotation") ? quatFromJson(j.at("rotation")) : IDENTITY_ROTATION;
        keyframe.fov = j.contains("fov") ? std::optional<double>(j.at("fov").get<double>()) : std::nullopt;
    }

    void to_json(json& j, const CameraPathDescriptor& descriptor) {
        j = json{{"type", std::string(toString(descriptor.type))},
                 {"fov", descriptor.fov}};
        if (descriptor.near_plane) j["near"] = *descriptor.near_plane;
        if (descriptor.far_plane) j["far"] = *descriptor.far_plane;
        if (descriptor.position) j["position"] = vecToJson(*descriptor.position);
        if (descriptor.look_at) j["lookAt"] = vecToJson(*descriptor.look_at);
        if (!descriptor.keyframes.empty()) j["keyframes"] = descriptor.keyframes;
    }

    void from_json(const json& j, CameraPathDescriptor& descriptor) {
        const auto type_name = j.value("type", std::string(toString(CameraPathType::STATIC)));
        if (const auto type = cameraPathTypeFromString(type_name)) {
            descriptor.type = *type;
        } else {
            LOG_WARN("Unknown camera path type '{}', using static", type_name);
            descriptor.type = CameraPathType::STATIC;
        }
        descriptor.fov = j.value("fov", DEFAULT_FOV);
        descriptor.near_plane = j.contains("near") ? std::optional<double>(j.at("near").get<double>()) : std::nullopt;
        descriptor.far_plane = j.contains("far") ? std::optional<double>(j.at("far").get<double>()) : std::nullopt;
        descriptor.position = j.contains("position") ? std::optional<glm::dvec3>(vecFromJson(j.at("position")))
                                                     : std::nullopt;
        descriptor.look_at = j.contains("lookAt") ? std::optional<glm::dvec3>(vecFromJson(j.at("lookAt")))
                                                  : std::nullopt;
        descriptor.keyframes = j.value("keyframes", std::vector<CameraKeyframe>{});
        std::stable_sort(descriptor.keyframes.begin(), descriptor.keyframes.end());
    }

    void CameraPath::addKeyframe(const CameraKeyframe& keyframe) {
        CameraKeyframe stored = keyframe;
        stored.rotation = normalizeQuat(keyframe.rotation);
        keyframes_.push_back(stored);
        sortKeyframes();
    }

    void CameraPath::removeKeyframe(const size_t index) {
        if (index >= keyframes_.size()) return;
        keyframes_.erase(keyframes_.begin() + static_cast<ptrdiff_t>(index));
    }

    void CameraPath::setKeyframeFrame(const size_t index, const int new_frame, const bool sort) {
        if (index >= keyframes_.size()) return;
        keyframes_[index].frame = new_frame;
        if (sort) sortKeyframes();
    }

    void CameraPath::updateKeyframe(const size_t index, const glm::dvec3& position,
                                    const glm::dquat& rotation, const std::optional<double> fov) {
        if (index >= keyframes_.size()) return;
        keyframes_[index].position = position;
        keyframes_[index].rotation = normalizeQuat(rotation);
        keyframes_[index].fov = fov;
    }

    const CameraKeyframe* CameraPath::getKeyframe(const size_t index) const {
        return index < keyframes_.size() ? &keyframes_[index] : nullptr;
    }

    void CameraPath::clear() {
        keyframes_.clear();
    }

    int CameraPath::duration() const {
        return keyframes_.size() < 2 ? 0 : keyframes_.back().frame - keyframes_.front().frame;
    }

    int CameraPath::startFrame() const {
        return keyframes_.empty() ? 0 : keyframes_.front().frame;
    }

    int CameraPath::endFrame() const {
        return keyframes_.empty() ? 0 : keyframes_.back().frame;
    }

    CameraState CameraPath::evaluate(const double frame) const {
        return interpolateCameraPath(keyframes_, frame, fov_, tension_);
    }

    std::vector<glm::dvec3> CameraPath::generatePath(const int samples_per_segment) const {
        return generatePathPoints(keyframes_, samples_per_segment, tension_);
    }

    void CameraPath::simplify(const double tolerance) {
        keyframes_ = simplifyPath(keyframes_, tolerance);
    }

    void CameraPath::resample(const int interval) {
        keyframes_ = resampleKeyframes(keyframes_, interval);
    }

    void CameraPath::smooth(const int window_size) {
        keyframes_ = smoothKeyframes(keyframes_, window_size);
    }

    void CameraPath::sortKeyframes() {
        std::stable_sort(keyframes_.begin(), keyframes_.end());
    }

    bool CameraPath::saveToJson(const std::string& path) const {
        try {
            json j;
            j["version"] = JSON_VERSION;
            j["fov"] = fov_;
            j["tension"] = tension_;
            j["keyframes"] = keyframes_;

            std::ofstream file(path);
            if (!file.is_open()) {
                LOG_ERROR("Failed to open camera path file: {}", path);
                return false;
            }
            file << j.dump(2);
            LOG_INFO("Saved {} camera keyframes to {}", keyframes_.size(), path);
            return true;
        } catch (const json::exception& e) {
            LOG_ERROR("Camera path save failed: {}", e.what());
            return false;
        }
    }

    bool CameraPath::loadFromJson(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                LOG_ERROR("Failed to open camera path file: {}", path);
                return false;
            }

            const auto j = json::parse(file);
            const int version = j.value("version", JSON_VERSION);
            if (version > JSON_VERSION) {
                LOG_WARN("Camera path {} has newer version {} (supported {})", path, version, JSON_VERSION);
            }

            // Parse fully before touching state so a bad file leaves the path intact
            auto keyframes = j.at("keyframes").get<std::vector<CameraKeyframe>>();
            const double fov = j.value("fov", DEFAULT_FOV);
            const double tension = j.value("tension", DEFAULT_TENSION);

            keyframes_ = std::move(keyframes);
            fov_ = fov;
            tension_ = tension;

            sortKeyframes();
            LOG_INFO("Loaded {} camera keyframes from {}", keyframes_.size(), path);
            return true;
        } catch (const json::exception& e) {
            LOG_ERROR("Camera path load failed: {}", e.what());
            return false;
        }
    }

} // namespace mpe::camera
