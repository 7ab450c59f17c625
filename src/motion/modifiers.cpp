/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "modifiers.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    namespace {
        constexpr double TWO_PI = glm::two_pi<double>();

        // Per-axis skew so the three wobble / pulse axes never line up
        constexpr double WOBBLE_Y_RATE = 1.3;
        constexpr double WOBBLE_Y_PHASE = 0.5;
        constexpr double WOBBLE_Z_RATE = 0.7;
        constexpr double WOBBLE_Z_PHASE = 1.0;

        constexpr double PULSE_Y_RATE = 1.1;
        constexpr double PULSE_Y_PHASE = 0.3;
        constexpr double PULSE_Z_RATE = 0.9;
        constexpr double PULSE_Z_PHASE = 0.7;

        constexpr double DEFAULT_MIN_SCALE = 0.9;
        constexpr double DEFAULT_MAX_SCALE = 1.1;

        double wave01(const double angle) {
            return (std::sin(angle) + 1.0) / 2.0;
        }
    } // namespace

    std::string_view toString(const ModifierType type) {
        switch (type) {
            case ModifierType::ROTATION:
                return "rotation";
            case ModifierType::WOBBLE:
                return "wobble";
            case ModifierType::SCALE_PULSE:
                return "scalePulse";
            case ModifierType::LOOK_AT:
                return "lookAt";
        }
        return "rotation";
    }

    std::optional<ModifierType> modifierTypeFromString(const std::string_view name) {
        if (name == "rotation") return ModifierType::ROTATION;
        if (name == "wobble") return ModifierType::WOBBLE;
        if (name == "scalePulse") return ModifierType::SCALE_PULSE;
        if (name == "lookAt") return ModifierType::LOOK_AT;
        return std::nullopt;
    }

    double numberParam(const ModifierParams& params, const std::string& key, const double fallback) {
        const auto it = params.find(key);
        if (it == params.end()) return fallback;
        if (const auto* value = std::get_if<double>(&it->second); value && std::isfinite(*value)) {
            return *value;
        }
        return fallback;
    }

    bool boolParam(const ModifierParams& params, const std::string& key, const bool fallback) {
        const auto it = params.find(key);
        if (it == params.end()) return fallback;
        if (const auto* flag = std::get_if<bool>(&it->second)) {
            return *flag;
        }
        if (const auto* value = std::get_if<double>(&it->second)) {
            return *value != 0.0;
        }
        return fallback;
    }

    double elapsedSeconds(const double frame, const double fps) {
        return frame / (fps > 0.0 ? fps : 1.0);
    }

    MotionState applyRotation(MotionState state, const double time, const ModifierParams& params) {
        const Point3D speed{numberParam(params, "speedX", 0.0),
                            numberParam(params, "speedY", 0.0),
                            numberParam(params, "speedZ", 0.0)};
        const Point3D rotation = speed * (time * TWO_PI);

        if (boolParam(params, "additive", true)) {
            state.rotation += rotation;
        } else {
            state.rotation = rotation;
        }
        return state;
    }

    MotionState applyWobble(MotionState state, const double time, const ModifierParams& params) {
        const double frequency = numberParam(params, "frequency", 1.0);
        const double phase = numberParam(params, "phase", 0.0);
        const double t = time * frequency * TWO_PI + phase;

        state.position += Point3D{
            std::sin(t) * numberParam(params, "amplitudeX", 0.0),
            std::sin(t * WOBBLE_Y_RATE + WOBBLE_Y_PHASE) * numberParam(params, "amplitudeY", 0.0),
            std::sin(t * WOBBLE_Z_RATE + WOBBLE_Z_PHASE) * numberParam(params, "amplitudeZ", 0.0)};
        return state;
    }

    MotionState applyScalePulse(MotionState state, const double time, const ModifierParams& params) {
        const double min_scale = numberParam(params, "minScale", DEFAULT_MIN_SCALE);
        const double max_scale = numberParam(params, "maxScale", DEFAULT_MAX_SCALE);
        const double frequency = numberParam(params, "frequency", 1.0);
        const double phase = numberParam(params, "phase", 0.0);
        const double t = time * frequency * TWO_PI + phase;

        const auto scaleAt = [&](const double angle) {
            return min_scale + wave01(angle) * (max_scale - min_scale);
        };

        const double mult_x = scaleAt(t);
        if (boolParam(params, "uniform", true)) {
            state.scale *= mult_x;
            return state;
        }

        state.scale *= Point3D{mult_x,
                               scaleAt(t * PULSE_Y_RATE + PULSE_Y_PHASE),
                               scaleAt(t * PULSE_Z_RATE + PULSE_Z_PHASE)};
        return state;
    }

    MotionState applyLookAt(MotionState state, const ModifierParams& params) {
        if (boolParam(params, "followPath", false)) {
            const Point3D& tangent = state.tangent;
            const double yaw = std::atan2(tangent.x, tangent.z);
            const double pitch = std::asin(std::clamp(-tangent.y, -1.0, 1.0));
            state.rotation = {pitch, yaw, 0.0};
            return state;
        }

        const Point3D target{numberParam(params, "targetX", 0.0),
                             numberParam(params, "targetY", 0.0),
                             numberParam(params, "targetZ", 0.0)};
        const Point3D d = target - state.position;

        const double yaw = std::atan2(d.x, d.z);
        const double pitch = std::atan2(-d.y, std::sqrt(d.x * d.x + d.z * d.z));
        state.rotation = {pitch, yaw, 0.0};
        return state;
    }

    MotionState applyModifier(const ModifierConfig& config, const MotionState& state, const double time) {
        if (!config.enabled) {
            return state;
        }
        switch (config.type) {
            case ModifierType::ROTATION:
                return applyRotation(state, time, config.params);
            case ModifierType::WOBBLE:
                return applyWobble(state, time, config.params);
            case ModifierType::SCALE_PULSE:
                return applyScalePulse(state, time, config.params);
            case ModifierType::LOOK_AT:
                return applyLookAt(state, config.params);
        }
        return state;
    }

    BuiltinModifier::BuiltinModifier(const ModifierType type, ModifierParams params)
        : type_(type),
          params_(std::move(params)) {}

    MotionState BuiltinModifier::apply(const MotionState& state, const double frame, const double fps) const {
        return applyModifier({type_, true, params_}, state, elapsedSeconds(frame, fps));
    }

    void BuiltinModifier::setParams(const ModifierParams& params) {
        for (const auto& [key, value] : params) {
            params_[key] = value;
        }
    }

    std::unique_ptr<MotionModifier> makeModifier(const ModifierConfig& config) {
        return std::make_unique<BuiltinModifier>(config.type, config.params);
    }

} // namespace mpe::motion
