/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "spline_path.hpp"
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    namespace {
        constexpr int LENGTH_RESOLUTION = 100;

        PathConfig makeConfig() {
            PathConfig cfg;
            cfg.type = "spline";
            cfg.name = "Catmull-Rom Spline";
            cfg.description = "Smooth curve through control points";
            cfg.default_params = {{"tension", 0.5}, {"closed", 0.0}};
            cfg.parameter_meta = {
                {"tension", "Tension", 0.0, 1.0, 0.05, 0.5, "Curve tightness (0=loose, 1=tight)"},
                {"closed", "Closed Loop", 0.0, 1.0, 1.0, 0.0, "1 = loop back to start, 0 = open curve"},
            };
            return cfg;
        }

        size_t wrapIndex(const long long i, const size_t n) {
            const auto m = static_cast<long long>(n);
            return static_cast<size_t>(((i % m) + m) % m);
        }
    } // namespace

    Point3D catmullRomPoint(const Point3D& p0, const Point3D& p1,
                            const Point3D& p2, const Point3D& p3,
                            const double t, const double tension) {
        const double t2 = t * t;
        const double t3 = t2 * t;
        const double s = (1.0 - tension) / 2.0;

        const double b0 = -s * t3 + 2.0 * s * t2 - s * t;
        const double b1 = (2.0 - s) * t3 + (s - 3.0) * t2 + 1.0;
        const double b2 = (s - 2.0) * t3 + (3.0 - 2.0 * s) * t2 + s * t;
        const double b3 = s * t3 - s * t2;

        return b0 * p0 + b1 * p1 + b2 * p2 + b3 * p3;
    }

    Point3D catmullRomDerivative(const Point3D& p0, const Point3D& p1,
                                 const Point3D& p2, const Point3D& p3,
                                 const double t, const double tension) {
        const double t2 = t * t;
        const double s = (1.0 - tension) / 2.0;

        const double db0 = -3.0 * s * t2 + 4.0 * s * t - s;
        const double db1 = 3.0 * (2.0 - s) * t2 + 2.0 * (s - 3.0) * t;
        const double db2 = 3.0 * (s - 2.0) * t2 + 2.0 * (3.0 - 2.0 * s) * t + s;
        const double db3 = 3.0 * s * t2 - 2.0 * s * t;

        return db0 * p0 + db1 * p1 + db2 * p2 + db3 * p3;
    }

    const PathConfig& SplinePath::config() {
        static const PathConfig cfg = makeConfig();
        return cfg;
    }

    std::vector<Point3D> SplinePath::defaultControlPoints() {
        return {{-5.0, 0.0, 0.0}, {0.0, 5.0, 0.0}, {5.0, 0.0, 0.0}, {0.0, -5.0, 0.0}};
    }

    SplinePath::SplinePath(const ParamMap& params)
        : SplinePath(defaultControlPoints(), params) {}

    SplinePath::SplinePath(std::vector<Point3D> control_points, const ParamMap& params)
        : params_(mergeParams(config().default_params, params)),
          control_points_(std::move(control_points)) {}

    SplinePath::Segment SplinePath::locate(const double progress) const {
        const size_t n = control_points_.size();
        const bool closed = isClosed();
        const size_t num_segments = closed ? n : n - 1;

        const double scaled = clampProgress(progress) * static_cast<double>(num_segments);
        const size_t segment = std::min(static_cast<size_t>(std::floor(scaled)), num_segments - 1);
        const double t = scaled - static_cast<double>(segment);

        if (closed) {
            const auto i = static_cast<long long>(segment);
            return {control_points_[wrapIndex(i - 1, n)],
                    control_points_[wrapIndex(i, n)],
                    control_points_[wrapIndex(i + 1, n)],
                    control_points_[wrapIndex(i + 2, n)],
                    t};
        }
        return {control_points_[segment > 0 ? segment - 1 : 0],
                control_points_[segment],
                control_points_[std::min(n - 1, segment + 1)],
                control_points_[std::min(n - 1, segment + 2)],
                t};
    }

    Point3D SplinePath::getPositionAt(const double progress) const {
        const size_t n = control_points_.size();
        if (n < 2) {
            return n == 1 ? control_points_.front() : Point3D{0.0};
        }
        const Segment seg = locate(progress);
        return catmullRomPoint(seg.p0, seg.p1, seg.p2, seg.p3, seg.t, params_.at("tension"));
    }

    Point3D SplinePath::getTangentAt(const double progress) const {
        if (control_points_.size() < 2) {
            return DEFAULT_TANGENT;
        }
        const Segment seg = locate(progress);
        return normalizeOrDefault(
            catmullRomDerivative(seg.p0, seg.p1, seg.p2, seg.p3, seg.t, params_.at("tension")));
    }

    std::vector<Point3D> SplinePath::precomputePath(const int resolution) {
        const int steps = std::max(resolution, 1);
        if (!cached_points_.empty() && cache_resolution_ == steps) {
            return cached_points_;
        }

        cached_points_ = sampleByProgress(*this, steps);
        cache_resolution_ = steps;
        total_length_ = polylineLength(cached_points_);
        return cached_points_;
    }

    double SplinePath::getLength() {
        if (cached_points_.empty() && control_points_.size() >= 2) {
            static_cast<void>(precomputePath(LENGTH_RESOLUTION));
        }
        return total_length_;
    }

    void SplinePath::setParams(const ParamMap& params) {
        if (!paramsChanged(params_, params)) return;
        params_ = mergeParams(params_, params);
        invalidateCache();
    }

    void SplinePath::setControlPoints(std::vector<Point3D> points) {
        control_points_ = std::move(points);
        invalidateCache();
    }

    void SplinePath::addControlPoint(const Point3D& point) {
        control_points_.push_back(point);
        invalidateCache();
    }

    void SplinePath::invalidateCache() {
        cached_points_.clear();
        cache_resolution_ = 0;
        total_length_ = 0.0;
    }

} // namespace mpe::motion
