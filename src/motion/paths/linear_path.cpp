/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "linear_path.hpp"

namespace mpe::motion {

    namespace {
        constexpr double COORD_LIMIT = 100.0;
        constexpr double COORD_STEP = 0.5;

        PathConfig makeConfig() {
            PathConfig cfg;
            cfg.type = "linear";
            cfg.name = "Linear Path";
            cfg.description = "Straight line between two points";
            cfg.default_params = {
                {"startX", 0.0}, {"startY", 0.0}, {"startZ", 0.0},
                {"endX", 10.0}, {"endY", 0.0}, {"endZ", 0.0}};

            const auto coord = [](std::string key, std::string label, double def, std::string desc) {
                return ParameterMeta{std::move(key), std::move(label), -COORD_LIMIT, COORD_LIMIT,
                                     COORD_STEP, def, std::move(desc)};
            };
            cfg.parameter_meta = {
                coord("startX", "Start X", 0.0, "Starting X position"),
                coord("startY", "Start Y", 0.0, "Starting Y position"),
                coord("startZ", "Start Z", 0.0, "Starting Z position"),
                coord("endX", "End X", 10.0, "Ending X position"),
                coord("endY", "End Y", 0.0, "Ending Y position"),
                coord("endZ", "End Z", 0.0, "Ending Z position"),
            };
            return cfg;
        }
    } // namespace

    const PathConfig& LinearPath::config() {
        static const PathConfig cfg = makeConfig();
        return cfg;
    }

    LinearPath::LinearPath(const ParamMap& params)
        : params_(mergeParams(config().default_params, params)) {
        updateFromParams();
    }

    void LinearPath::updateFromParams() {
        start_ = {params_.at("startX"), params_.at("startY"), params_.at("startZ")};
        end_ = {params_.at("endX"), params_.at("endY"), params_.at("endZ")};
        length_ = glm::distance(start_, end_);
        direction_ = length_ > 0.0 ? normalizeOrDefault(end_ - start_) : DEFAULT_TANGENT;
    }

    Point3D LinearPath::getPositionAt(const double progress) const {
        return start_ + (end_ - start_) * clampProgress(progress);
    }

    Point3D LinearPath::getTangentAt(double /*progress*/) const {
        return direction_;
    }

    std::vector<Point3D> LinearPath::precomputePath(const int resolution) {
        return sampleByProgress(*this, resolution);
    }

    void LinearPath::setParams(const ParamMap& params) {
        if (!paramsChanged(params_, params)) return;
        params_ = mergeParams(params_, params);
        updateFromParams();
    }

    void LinearPath::setPoints(const Point3D& start, const Point3D& end) {
        setParams({{"startX", start.x}, {"startY", start.y}, {"startZ", start.z},
                   {"endX", end.x}, {"endY", end.y}, {"endZ", end.z}});
    }

} // namespace mpe::motion
