/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_state.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mpe::motion {

    enum class ModifierType : uint8_t {
        ROTATION,
        WOBBLE,
        SCALE_PULSE,
        LOOK_AT
    };

    [[nodiscard]] std::string_view toString(ModifierType type);
    [[nodiscard]] std::optional<ModifierType> modifierTypeFromString(std::string_view name);

    using ModifierValue = std::variant<double, bool, std::string>;
    using ModifierParams = std::map<std::string, ModifierValue>;

    struct ModifierConfig {
        ModifierType type = ModifierType::ROTATION;
        bool enabled = true;
        ModifierParams params;
    };

    // Numeric lookup; missing keys and non-numeric values yield fallback
    [[nodiscard]] double numberParam(const ModifierParams& params, const std::string& key, double fallback);

    // Booleans, or numbers compared against zero; strings yield fallback
    [[nodiscard]] bool boolParam(const ModifierParams& params, const std::string& key, bool fallback);

    // ========== Built-in modifiers ==========
    // time is elapsed seconds (frame / fps)

    // speedX/Y/Z in revolutions per second, additive (default true)
    [[nodiscard]] MotionState applyRotation(MotionState state, double time, const ModifierParams& params);

    // amplitudeX/Y/Z, frequency (Hz), phase (rad)
    [[nodiscard]] MotionState applyWobble(MotionState state, double time, const ModifierParams& params);

    // minScale, maxScale, frequency, phase, uniform (default true)
    [[nodiscard]] MotionState applyScalePulse(MotionState state, double time, const ModifierParams& params);

    // targetX/Y/Z, or followPath to align with the tangent
    [[nodiscard]] MotionState applyLookAt(MotionState state, const ModifierParams& params);

    [[nodiscard]] MotionState applyModifier(const ModifierConfig& config, const MotionState& state, double time);

    // Runtime-attached modifier; applied after the declarative list
    class MotionModifier {
    public:
        virtual ~MotionModifier() = default;

        [[nodiscard]] virtual ModifierType type() const = 0;

        [[nodiscard]] virtual MotionState apply(const MotionState& state, double frame, double fps) const = 0;

        virtual void setParams(const ModifierParams& params) = 0;

        [[nodiscard]] virtual ModifierParams getParams() const = 0;
    };

    // MotionModifier running one of the built-in modifiers
    class BuiltinModifier final : public MotionModifier {
    public:
        explicit BuiltinModifier(ModifierType type, ModifierParams params = {});

        [[nodiscard]] ModifierType type() const override { return type_; }
        [[nodiscard]] MotionState apply(const MotionState& state, double frame, double fps) const override;
        void setParams(const ModifierParams& params) override;
        [[nodiscard]] ModifierParams getParams() const override { return params_; }

    private:
        ModifierType type_;
        ModifierParams params_;
    };

    [[nodiscard]] std::unique_ptr<MotionModifier> makeModifier(const ModifierConfig& config);

    // frame / fps with non-positive fps treated as 1
    [[nodiscard]] double elapsedSeconds(double frame, double fps);

} // namespace mpe::motion
