/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "lissajous_path.hpp"
#include "core/logger.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    namespace {
        constexpr double TWO_PI = glm::two_pi<double>();
        constexpr double DEFAULT_RESOLUTION = 1000.0;

        PathConfig makeConfig() {
            PathConfig cfg;
            cfg.type = "lissajous";
            cfg.name = "3D Lissajous Curve";
            cfg.description = "Parametric curves that create intricate 3D patterns";
            cfg.default_params = {
                {"amplitudeX", 5.0},
                {"amplitudeY", 5.0},
                {"amplitudeZ", 5.0},
                {"freqX", 3.0},
                {"freqY", 2.0},
                {"freqZ", 1.0},
                {"phaseX", glm::half_pi<double>()},
                {"phaseY", 0.0},
                {"phaseZ", 0.0},
                {"resolution", DEFAULT_RESOLUTION}};
            cfg.parameter_meta = {
                {"amplitudeX", "Amplitude X", 0.1, 20.0, 0.5, 5.0, "Size in X direction"},
                {"amplitudeY", "Amplitude Y", 0.1, 20.0, 0.5, 5.0, "Size in Y direction"},
                {"amplitudeZ", "Amplitude Z", 0.1, 20.0, 0.5, 5.0, "Size in Z direction"},
                {"freqX", "Frequency X", 1.0, 10.0, 1.0, 3.0, "Oscillation frequency in X"},
                {"freqY", "Frequency Y", 1.0, 10.0, 1.0, 2.0, "Oscillation frequency in Y"},
                {"freqZ", "Frequency Z", 1.0, 10.0, 1.0, 1.0, "Oscillation frequency in Z"},
                {"phaseX", "Phase X", 0.0, TWO_PI, 0.1, glm::half_pi<double>(), "Phase offset for X"},
                {"phaseY", "Phase Y", 0.0, TWO_PI, 0.1, 0.0, "Phase offset for Y"},
                {"phaseZ", "Phase Z", 0.0, TWO_PI, 0.1, 0.0, "Phase offset for Z"},
            };
            return cfg;
        }
    } // namespace

    const PathConfig& LissajousPath::config() {
        static const PathConfig cfg = makeConfig();
        return cfg;
    }

    LissajousPath::LissajousPath(const ParamMap& params)
        : params_(mergeParams(config().default_params, params)) {
        computePath();
    }

    void LissajousPath::computePath() {
        LOG_TIMER_DEBUG("Lissajous bake");

        const Point3D amplitude{params_.at("amplitudeX"), params_.at("amplitudeY"), params_.at("amplitudeZ")};
        const Point3D frequency{params_.at("freqX"), params_.at("freqY"), params_.at("freqZ")};
        const Point3D phase{params_.at("phaseX"), params_.at("phaseY"), params_.at("phaseZ")};
        const int resolution = std::max(1, static_cast<int>(std::lround(params_.at("resolution"))));

        std::vector<Point3D> points;
        points.reserve(static_cast<size_t>(resolution) + 1);
        for (int i = 0; i <= resolution; ++i) {
            const double t = (static_cast<double>(i) / static_cast<double>(resolution)) * TWO_PI;
            points.emplace_back(amplitude.x * std::sin(frequency.x * t + phase.x),
                                amplitude.y * std::sin(frequency.y * t + phase.y),
                                amplitude.z * std::sin(frequency.z * t + phase.z));
        }
        setSamples(std::move(points));
    }

    std::vector<Point3D> LissajousPath::precomputePath(const int resolution) {
        setParams({{"resolution", static_cast<double>(std::max(resolution, 1))}});
        const auto baked = samples();
        return {baked.begin(), baked.end()};
    }

    void LissajousPath::setParams(const ParamMap& params) {
        if (!paramsChanged(params_, params)) return;
        params_ = mergeParams(params_, params);
        computePath();
    }

} // namespace mpe::motion
