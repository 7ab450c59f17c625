/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "path_generator.hpp"
#include <cstdint>
#include <optional>
#include <string_view>

namespace mpe::motion {

    enum class LoopMode : uint8_t {
        NONE,
        LOOP,
        PING_PONG
    };

    [[nodiscard]] std::string_view toString(LoopMode mode);
    [[nodiscard]] std::optional<LoopMode> loopModeFromString(std::string_view name);

    // Transform delta for one frame. rotation is Euler XYZ in radians.
    struct MotionState {
        Point3D position{0.0};
        Point3D rotation{0.0};
        Point3D scale{1.0};
        double progress = 0.0;
        Point3D tangent = DEFAULT_TANGENT;
    };

    [[nodiscard]] inline MotionState defaultMotionState() { return {}; }

    // Maps a frame to path progress; frames before start_frame hold at progress_offset
    [[nodiscard]] double calculateProgress(double frame, double start_frame, double duration,
                                           double speed, double progress_offset, LoopMode loop);

} // namespace mpe::motion
