/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion/path_generator.hpp"
#include <span>

namespace mpe::motion {

    // Tensioned Catmull-Rom basis. t in [0,1] runs from p1 to p2.
    [[nodiscard]] Point3D catmullRomPoint(const Point3D& p0, const Point3D& p1,
                                          const Point3D& p2, const Point3D& p3,
                                          double t, double tension);

    // d/dt of catmullRomPoint
    [[nodiscard]] Point3D catmullRomDerivative(const Point3D& p0, const Point3D& p1,
                                               const Point3D& p2, const Point3D& p3,
                                               double t, double tension);

    class SplinePath final : public PathGenerator {
    public:
        explicit SplinePath(const ParamMap& params = {});
        SplinePath(std::vector<Point3D> control_points, const ParamMap& params);

        [[nodiscard]] static const PathConfig& config();
        [[nodiscard]] static std::vector<Point3D> defaultControlPoints();

        [[nodiscard]] Point3D getPositionAt(double progress) const override;
        [[nodiscard]] Point3D getTangentAt(double progress) const override;
        [[nodiscard]] const PathConfig& getConfig() const override { return config(); }
        [[nodiscard]] std::vector<Point3D> precomputePath(int resolution) override;
        [[nodiscard]] double getLength() override;
        void setParams(const ParamMap& params) override;
        [[nodiscard]] ParamMap getParams() const override { return params_; }

        void setControlPoints(std::vector<Point3D> points);
        void addControlPoint(const Point3D& point);
        [[nodiscard]] std::span<const Point3D> getControlPoints() const { return control_points_; }

        [[nodiscard]] bool isClosed() const { return params_.at("closed") == 1.0; }

    private:
        struct Segment {
            const Point3D& p0;
            const Point3D& p1;
            const Point3D& p2;
            const Point3D& p3;
            double t;
        };

        [[nodiscard]] Segment locate(double progress) const;
        void invalidateCache();

        ParamMap params_;
        std::vector<Point3D> control_points_;

        // Polyline cache keyed by resolution; empty means invalid
        std::vector<Point3D> cached_points_;
        int cache_resolution_ = 0;
        double total_length_ = 0.0;
    };

} // namespace mpe::motion
