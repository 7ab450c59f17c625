/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "modifiers.hpp"
#include "motion_state.hpp"
#include "path_generator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mpe::motion {

    class PathRegistry;

    inline constexpr double DEFAULT_MOTION_DURATION = 300.0;

    // Serializable description of one object's motion
    struct MotionControllerConfig {
        std::string path_type = "circular";
        ParamMap path_params;
        double speed = 1.0;
        double progress_offset = 0.0;
        LoopMode loop = LoopMode::LOOP;
        std::vector<ModifierConfig> modifiers; // applied in order
        double duration = DEFAULT_MOTION_DURATION; // frames
        double start_frame = 0.0;
    };

    // Partial update for MotionController::setConfig; unset fields keep their value
    struct MotionConfigUpdate {
        std::optional<std::string> path_type;
        std::optional<ParamMap> path_params;
        std::optional<double> speed;
        std::optional<double> progress_offset;
        std::optional<LoopMode> loop;
        std::optional<std::vector<ModifierConfig>> modifiers;
        std::optional<double> duration;
        std::optional<double> start_frame;
    };

    class MotionController {
    public:
        explicit MotionController(MotionControllerConfig config);
        // registry must outlive the controller
        MotionController(MotionControllerConfig config, const PathRegistry& registry);
        MotionController(MotionControllerConfig config, const PathRegistry&& registry) = delete;

        [[nodiscard]] MotionState evaluate(double frame, double fps) const;

        [[nodiscard]] double progressAt(double frame) const;

        void addModifier(std::unique_ptr<MotionModifier> modifier);

        // Removes the first attached modifier of this type
        bool removeModifier(ModifierType type);

        [[nodiscard]] size_t attachedModifierCount() const { return attached_.size(); }

        // Re-resolves the path when path_type or path_params change.
        // Setting modifiers also drops every attached modifier.
        void setConfig(const MotionConfigUpdate& update);
        [[nodiscard]] const MotionControllerConfig& getConfig() const { return config_; }

        [[nodiscard]] PathGenerator* getPath() { return path_.get(); }
        [[nodiscard]] const PathGenerator* getPath() const { return path_.get(); }
        [[nodiscard]] bool hasPath() const { return path_ != nullptr; }

        [[nodiscard]] std::vector<Point3D> getPathPoints(int resolution = DEFAULT_PATH_RESOLUTION);

    private:
        void initializePath();

        MotionControllerConfig config_;
        const PathRegistry* registry_;
        std::unique_ptr<PathGenerator> path_;
        std::vector<std::unique_ptr<MotionModifier>> attached_;
    };

} // namespace mpe::motion
