/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_controller.hpp"
#include "core/logger.hpp"
#include "path_registry.hpp"
#include <algorithm>

namespace mpe::motion {

    MotionController::MotionController(MotionControllerConfig config)
        : MotionController(std::move(config), PathRegistry::global()) {}

    MotionController::MotionController(MotionControllerConfig config, const PathRegistry& registry)
        : config_(std::move(config)),
          registry_(&registry) {
        initializePath();
    }

    void MotionController::initializePath() {
        auto result = registry_->create(config_.path_type, config_.path_params);
        if (!result) {
            LOG_WARN("Motion falls back to identity: {}", result.error());
            path_.reset();
            return;
        }
        path_ = std::move(*result);
    }

    double MotionController::progressAt(const double frame) const {
        return calculateProgress(frame, config_.start_frame, config_.duration,
                                 config_.speed, config_.progress_offset, config_.loop);
    }

    MotionState MotionController::evaluate(const double frame, const double fps) const {
        const double progress = progressAt(frame);

        MotionState state = defaultMotionState();
        state.progress = progress;
        if (path_) {
            state.position = path_->getPositionAt(progress);
            state.tangent = path_->getTangentAt(progress);
        }

        const double time = elapsedSeconds(frame, fps);
        for (const auto& modifier : config_.modifiers) {
            state = applyModifier(modifier, state, time);
        }
        for (const auto& modifier : attached_) {
            state = modifier->apply(state, frame, fps);
        }
        return state;
    }

    void MotionController::addModifier(std::unique_ptr<MotionModifier> modifier) {
        if (!modifier) return;
        attached_.push_back(std::move(modifier));
    }

    bool MotionController::removeModifier(const ModifierType type) {
        const auto it = std::ranges::find_if(attached_, [type](const auto& m) { return m->type() == type; });
        if (it == attached_.end()) {
            return false;
        }
        attached_.erase(it);
        return true;
    }

    void MotionController::setConfig(const MotionConfigUpdate& update) {
        const bool path_changed = update.path_type && *update.path_type != config_.path_type;
        const bool params_changed = update.path_params && *update.path_params != config_.path_params;

        if (update.path_type) config_.path_type = *update.path_type;
        if (update.path_params) config_.path_params = *update.path_params;
        if (update.speed) config_.speed = *update.speed;
        if (update.progress_offset) config_.progress_offset = *update.progress_offset;
        if (update.loop) config_.loop = *update.loop;
        if (update.modifiers) {
            // A new modifier list replaces the whole stack, attached ones included
            config_.modifiers = *update.modifiers;
            attached_.clear();
        }
        if (update.duration) config_.duration = *update.duration;
        if (update.start_frame) config_.start_frame = *update.start_frame;

        if (path_changed) {
            initializePath();
        } else if (params_changed) {
            if (path_) {
                // Full replacement: keys dropped from the mapping revert to defaults
                path_->setParams(mergeParams(path_->getConfig().default_params, config_.path_params));
            } else {
                initializePath();
            }
        }
    }

    std::vector<Point3D> MotionController::getPathPoints(const int resolution) {
        if (!path_) return {};
        return path_->precomputePath(resolution);
    }

} // namespace mpe::motion
