/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_state.hpp"
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    std::string_view toString(const LoopMode mode) {
        switch (mode) {
            case LoopMode::NONE:
                return "none";
            case LoopMode::LOOP:
                return "loop";
            case LoopMode::PING_PONG:
                return "pingpong";
        }
        return "loop";
    }

    std::optional<LoopMode> loopModeFromString(const std::string_view name) {
        if (name == "none") return LoopMode::NONE;
        if (name == "loop") return LoopMode::LOOP;
        if (name == "pingpong") return LoopMode::PING_PONG;
        return std::nullopt;
    }

    double calculateProgress(const double frame, const double start_frame, const double duration,
                             const double speed, const double progress_offset, const LoopMode loop) {
        const double local_frame = frame - start_frame;
        if (local_frame < 0.0) {
            return progress_offset;
        }

        const double safe_duration = duration > 0.0 ? duration : 1.0;
        const double raw = (local_frame / safe_duration) * speed + progress_offset;
        if (!std::isfinite(raw)) {
            return 0.0;
        }

        switch (loop) {
            case LoopMode::NONE:
                return std::clamp(raw, 0.0, 1.0);

            case LoopMode::LOOP: {
                const double wrapped = raw - std::floor(raw);
                return wrapped < 1.0 ? wrapped : 0.0;
            }

            case LoopMode::PING_PONG: {
                const double cycle = std::floor(raw);
                const double in_cycle = raw - cycle;
                const bool forward = std::fmod(std::abs(cycle), 2.0) == 0.0;
                return forward ? in_cycle : 1.0 - in_cycle;
            }
        }
        return raw;
    }

} // namespace mpe::motion
