/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "path_generator.hpp"
#include <algorithm>
#include <cmath>

namespace mpe::motion {

    ParamMap mergeParams(const ParamMap& defaults, const ParamMap& overrides) {
        ParamMap merged = defaults;
        for (const auto& [key, value] : overrides) {
            merged[key] = value;
        }
        return merged;
    }

    bool paramsChanged(const ParamMap& current, const ParamMap& update) {
        return std::ranges::any_of(update, [&current](const auto& entry) {
            const auto it = current.find(entry.first);
            return it == current.end() || it->second != entry.second;
        });
    }

    double paramOr(const ParamMap& params, const std::string& key, const double fallback) {
        const auto it = params.find(key);
        return it != params.end() ? it->second : fallback;
    }

    Point3D normalizeOrDefault(const Point3D& v) {
        const double len = glm::length(v);
        if (len == 0.0 || !std::isfinite(len)) {
            return DEFAULT_TANGENT;
        }
        return v / len;
    }

    double clampProgress(const double progress) {
        if (std::isnan(progress)) return 0.0;
        return std::clamp(progress, 0.0, 1.0);
    }

    double polylineLength(std::span<const Point3D> points) {
        double total = 0.0;
        for (size_t i = 1; i < points.size(); ++i) {
            total += glm::distance(points[i - 1], points[i]);
        }
        return total;
    }

    std::vector<Point3D> sampleByProgress(const PathGenerator& path, const int resolution) {
        const int steps = std::max(resolution, 1);
        std::vector<Point3D> points;
        points.reserve(static_cast<size_t>(steps) + 1);
        for (int i = 0; i <= steps; ++i) {
            points.push_back(path.getPositionAt(static_cast<double>(i) / static_cast<double>(steps)));
        }
        return points;
    }

} // namespace mpe::motion
