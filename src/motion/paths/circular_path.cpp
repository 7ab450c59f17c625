/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "circular_path.hpp"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    namespace {
        constexpr double TWO_PI = glm::two_pi<double>();
        constexpr double HALF_PI = glm::half_pi<double>();

        PathConfig makeConfig() {
            PathConfig cfg;
            cfg.type = "circular";
            cfg.name = "Circular Orbit";
            cfg.description = "Circular or elliptical orbital motion";
            cfg.default_params = {
                {"radiusX", 5.0},
                {"radiusY", 5.0},
                {"tiltX", 0.0},
                {"tiltY", 0.0},
                {"centerX", 0.0},
                {"centerY", 0.0},
                {"centerZ", 0.0},
                {"heightAmplitude", 0.0},
                {"heightFrequency", 1.0},
                {"clockwise", 1.0}};
            cfg.parameter_meta = {
                {"radiusX", "Radius X", 0.1, 50.0, 0.5, 5.0, "Radius in X direction (ellipse major/minor)"},
                {"radiusY", "Radius Y", 0.1, 50.0, 0.5, 5.0, "Radius in Z direction (ellipse major/minor)"},
                {"tiltX", "Tilt X", -HALF_PI, HALF_PI, 0.05, 0.0, "Tilt the orbit plane around X axis"},
                {"tiltY", "Tilt Y", -HALF_PI, HALF_PI, 0.05, 0.0, "Tilt the orbit plane around Y axis"},
                {"centerX", "Center X", -50.0, 50.0, 0.5, 0.0, "Orbit center X position"},
                {"centerY", "Center Y", -50.0, 50.0, 0.5, 0.0, "Orbit center Y position"},
                {"centerZ", "Center Z", -50.0, 50.0, 0.5, 0.0, "Orbit center Z position"},
                {"heightAmplitude", "Height Wave", 0.0, 20.0, 0.5, 0.0, "Vertical oscillation amplitude (0 for flat)"},
                {"heightFrequency", "Height Freq", 0.5, 10.0, 0.5, 1.0, "Vertical oscillation frequency"},
                {"clockwise", "Direction", -1.0, 1.0, 2.0, 1.0, "1 = counter-clockwise, -1 = clockwise"},
            };
            return cfg;
        }
    } // namespace

    const PathConfig& CircularPath::config() {
        static const PathConfig cfg = makeConfig();
        return cfg;
    }

    CircularPath::CircularPath(const ParamMap& params)
        : params_(mergeParams(config().default_params, params)) {}

    double CircularPath::direction() const {
        const double clockwise = params_.at("clockwise");
        return clockwise != 0.0 ? clockwise : 1.0;
    }

    Point3D CircularPath::applyTilt(Point3D v) const {
        const double tilt_x = params_.at("tiltX");
        const double tilt_y = params_.at("tiltY");

        if (tilt_x != 0.0) {
            const double c = std::cos(tilt_x);
            const double s = std::sin(tilt_x);
            v = {v.x, v.y * c - v.z * s, v.y * s + v.z * c};
        }
        if (tilt_y != 0.0) {
            const double c = std::cos(tilt_y);
            const double s = std::sin(tilt_y);
            v = {v.x * c + v.z * s, v.y, -v.x * s + v.z * c};
        }
        return v;
    }

    Point3D CircularPath::getPositionAt(const double progress) const {
        const double angle = clampProgress(progress) * TWO_PI * direction();
        const double amplitude = params_.at("heightAmplitude");

        Point3D base{std::cos(angle) * params_.at("radiusX"),
                     0.0,
                     std::sin(angle) * params_.at("radiusY")};
        if (amplitude > 0.0) {
            base.y = std::sin(angle * params_.at("heightFrequency")) * amplitude;
        }

        const Point3D center{params_.at("centerX"), params_.at("centerY"), params_.at("centerZ")};
        return applyTilt(base) + center;
    }

    Point3D CircularPath::getTangentAt(const double progress) const {
        const double dir = direction();
        const double angle = clampProgress(progress) * TWO_PI * dir;
        const double amplitude = params_.at("heightAmplitude");
        const double frequency = params_.at("heightFrequency");

        // d(position)/d(angle), scaled by the traversal direction
        Point3D derivative{-std::sin(angle) * params_.at("radiusX") * dir,
                           0.0,
                           std::cos(angle) * params_.at("radiusY") * dir};
        if (amplitude > 0.0) {
            derivative.y = std::cos(angle * frequency) * frequency * amplitude * dir;
        }

        return normalizeOrDefault(applyTilt(derivative));
    }

    std::vector<Point3D> CircularPath::precomputePath(const int resolution) {
        return sampleByProgress(*this, resolution);
    }

    double CircularPath::getLength() {
        // Ramanujan's second approximation of the ellipse circumference
        const double rx = std::abs(params_.at("radiusX"));
        const double ry = std::abs(params_.at("radiusY"));
        const double a = std::max(rx, ry);
        const double b = std::min(rx, ry);
        if (a + b == 0.0) return 0.0;

        const double h = ((a - b) * (a - b)) / ((a + b) * (a + b));
        return glm::pi<double>() * (a + b) * (1.0 + (3.0 * h) / (10.0 + std::sqrt(4.0 - 3.0 * h)));
    }

    void CircularPath::setParams(const ParamMap& params) {
        if (!paramsChanged(params_, params)) return;
        params_ = mergeParams(params_, params);
    }

} // namespace mpe::motion
