/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mpe::motion {

    using Point3D = glm::dvec3;
    using ParamMap = std::map<std::string, double>;

    inline constexpr Point3D DEFAULT_TANGENT{0.0, 0.0, 1.0};
    inline constexpr int DEFAULT_PATH_RESOLUTION = 500;

    // UI / validation metadata for one path parameter
    struct ParameterMeta {
        std::string key;
        std::string label;
        double min = 0.0;
        double max = 1.0;
        double step = 0.1;
        double default_value = 0.0;
        std::optional<std::string> description;
    };

    // Static descriptor shared by every instance of a path type
    struct PathConfig {
        std::string type;
        std::string name;
        std::string description;
        ParamMap default_params;
        std::vector<ParameterMeta> parameter_meta;
    };

    // Maps progress in [0,1] to a point and a unit direction.
    // Queries clamp progress themselves; callers must not rely on extrapolation.
    class PathGenerator {
    public:
        virtual ~PathGenerator() = default;

        [[nodiscard]] virtual Point3D getPositionAt(double progress) const = 0;

        // Unit length, or DEFAULT_TANGENT where the direction is undefined
        [[nodiscard]] virtual Point3D getTangentAt(double progress) const = 0;

        [[nodiscard]] virtual const PathConfig& getConfig() const = 0;

        // resolution + 1 samples evenly spaced in progress
        [[nodiscard]] virtual std::vector<Point3D> precomputePath(int resolution) = 0;

        [[nodiscard]] virtual double getLength() = 0;

        // Merge-update; unknown keys are stored as well
        virtual void setParams(const ParamMap& params) = 0;

        [[nodiscard]] virtual ParamMap getParams() const = 0;
    };

    // ========== Shared helpers ==========

    [[nodiscard]] ParamMap mergeParams(const ParamMap& defaults, const ParamMap& overrides);

    // True when applying `update` over `current` would change any value
    [[nodiscard]] bool paramsChanged(const ParamMap& current, const ParamMap& update);

    [[nodiscard]] double paramOr(const ParamMap& params, const std::string& key, double fallback);

    [[nodiscard]] Point3D normalizeOrDefault(const Point3D& v);

    [[nodiscard]] double clampProgress(double progress);

    [[nodiscard]] double polylineLength(std::span<const Point3D> points);

    [[nodiscard]] std::vector<Point3D> sampleByProgress(const PathGenerator& path, int resolution);

} // namespace mpe::motion
