/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion/path_generator.hpp"
#include <span>
#include <vector>

namespace mpe::motion {

    // Base for paths baked into a polyline at construction / parameter change.
    // Queries interpolate by sample index fraction, so traversal speed follows
    // the sample spacing rather than arc length.
    class SampledPath : public PathGenerator {
    public:
        [[nodiscard]] Point3D getPositionAt(double progress) const override;
        [[nodiscard]] Point3D getTangentAt(double progress) const override;
        [[nodiscard]] double getLength() override { return total_length_; }

        [[nodiscard]] std::span<const Point3D> samples() const { return points_; }
        [[nodiscard]] std::span<const double> arcLengths() const { return arc_lengths_; }

    protected:
        void setSamples(std::vector<Point3D> points);

    private:
        std::vector<Point3D> points_;
        std::vector<double> arc_lengths_;
        double total_length_ = 0.0;
    };

} // namespace mpe::motion
