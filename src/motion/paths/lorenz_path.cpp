/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "lorenz_path.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mpe::motion {

    namespace {
        constexpr Point3D INITIAL_STATE{0.1, 0.0, 0.0};
        constexpr double DEFAULT_BETA = 8.0 / 3.0;

        PathConfig makeConfig() {
            PathConfig cfg;
            cfg.type = "lorenz";
            cfg.name = "Lorenz Attractor";
            cfg.description = "Chaotic butterfly-shaped attractor from the Lorenz system";
            cfg.default_params = {
                {"sigma", 10.0},
                {"rho", 28.0},
                {"beta", DEFAULT_BETA},
                {"scale", 6.0},
                {"dt", 0.005},
                {"steps", 8000.0},
                {"centerAtOrigin", 1.0}};
            cfg.parameter_meta = {
                {"sigma", "Sigma", 0.0, 50.0, 0.5, 10.0, "Rate of rotation in x-y plane"},
                {"rho", "Rho", 0.0, 100.0, 1.0, 28.0, "Controls behavior - chaos above 24.74"},
                {"beta", "Beta", 0.0, 10.0, 0.1, DEFAULT_BETA, "Geometric factor of the system"},
                {"scale", "Scale", 0.1, 20.0, 0.1, 6.0, "Overall size of the attractor"},
                {"dt", "Time Step", 0.001, 0.02, 0.001, 0.005, "Integration time step (smaller = more accurate)"},
                {"steps", "Steps", 1000.0, 20000.0, 500.0, 8000.0, "Number of integration steps"},
            };
            return cfg;
        }

        // Simulation (x, y, z) -> view (x, z, y)
        Point3D toView(const Point3D& s, const double scale) {
            return Point3D{s.x, s.z, s.y} * scale;
        }
    } // namespace

    const PathConfig& LorenzPath::config() {
        static const PathConfig cfg = makeConfig();
        return cfg;
    }

    LorenzPath::LorenzPath(const ParamMap& params)
        : params_(mergeParams(config().default_params, params)) {
        computePath();
    }

    void LorenzPath::computePath() {
        LOG_TIMER_DEBUG("Lorenz integration");

        const double sigma = params_.at("sigma");
        const double rho = params_.at("rho");
        const double beta = params_.at("beta");
        const double scale = params_.at("scale");
        const double dt = params_.at("dt");
        const int steps = std::max(1, static_cast<int>(std::lround(params_.at("steps"))));

        std::vector<Point3D> points;
        points.reserve(static_cast<size_t>(steps) + 1);

        Point3D s = INITIAL_STATE;
        points.push_back(toView(s, scale));
        for (int i = 0; i < steps; ++i) {
            const Point3D d{sigma * (s.y - s.x),
                            s.x * (rho - s.z) - s.y,
                            s.x * s.y - beta * s.z};
            s += d * dt;
            points.push_back(toView(s, scale));
        }

        if (params_.at("centerAtOrigin") != 0.0) {
            Point3D lo{std::numeric_limits<double>::infinity()};
            Point3D hi{-std::numeric_limits<double>::infinity()};
            for (const auto& p : points) {
                lo = glm::min(lo, p);
                hi = glm::max(hi, p);
            }
            const Point3D center = (lo + hi) * 0.5;
            if (std::isfinite(center.x) && std::isfinite(center.y) && std::isfinite(center.z)) {
                for (auto& p : points) {
                    p -= center;
                }
            }
        }

        const bool diverged = std::ranges::any_of(points, [](const Point3D& p) {
            return !std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z);
        });
        if (diverged) {
            LOG_WARN("Lorenz integration diverged (sigma={}, rho={}, beta={}, dt={})", sigma, rho, beta, dt);
        }

        setSamples(std::move(points));
    }

    std::vector<Point3D> LorenzPath::precomputePath(const int resolution) {
        setParams({{"steps", static_cast<double>(std::max(resolution, 1))}});
        return getPoints();
    }

    void LorenzPath::setParams(const ParamMap& params) {
        if (!paramsChanged(params_, params)) return;
        params_ = mergeParams(params_, params);
        computePath();
    }

    std::vector<Point3D> LorenzPath::getPoints() const {
        const auto baked = samples();
        return {baked.begin(), baked.end()};
    }

    std::vector<double> LorenzPath::getArcLengths() const {
        const auto lengths = arcLengths();
        return {lengths.begin(), lengths.end()};
    }

} // namespace mpe::motion
