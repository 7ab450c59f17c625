/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sampled_path.hpp"
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    void SampledPath::setSamples(std::vector<Point3D> points) {
        points_ = std::move(points);
        arc_lengths_.clear();
        arc_lengths_.reserve(points_.size());
        total_length_ = 0.0;

        if (points_.empty()) return;
        arc_lengths_.push_back(0.0);
        for (size_t i = 1; i < points_.size(); ++i) {
            total_length_ += glm::distance(points_[i - 1], points_[i]);
            arc_lengths_.push_back(total_length_);
        }
    }

    Point3D SampledPath::getPositionAt(const double progress) const {
        if (points_.empty()) {
            return Point3D{0.0};
        }

        const double index = clampProgress(progress) * static_cast<double>(points_.size() - 1);
        const auto i0 = static_cast<size_t>(std::floor(index));
        const size_t i1 = std::min(i0 + 1, points_.size() - 1);
        const double t = index - static_cast<double>(i0);

        const Point3D& p0 = points_[i0];
        const Point3D& p1 = points_[i1];
        return p0 + (p1 - p0) * t;
    }

    Point3D SampledPath::getTangentAt(const double progress) const {
        if (points_.size() < 2) {
            return DEFAULT_TANGENT;
        }

        // Central difference over a two-sample window around the query
        const double index = clampProgress(progress) * static_cast<double>(points_.size() - 1);
        const auto floor_index = static_cast<size_t>(std::floor(index));
        const size_t i0 = floor_index > 0 ? floor_index - 1 : 0;
        const size_t i1 = std::min(i0 + 2, points_.size() - 1);

        return normalizeOrDefault(points_[i1] - points_[i0]);
    }

} // namespace mpe::motion
