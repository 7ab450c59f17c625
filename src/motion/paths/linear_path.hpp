/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion/path_generator.hpp"

namespace mpe::motion {

    // Straight segment between (startX,startY,startZ) and (endX,endY,endZ)
    class LinearPath final : public PathGenerator {
    public:
        explicit LinearPath(const ParamMap& params = {});

        [[nodiscard]] static const PathConfig& config();

        [[nodiscard]] Point3D getPositionAt(double progress) const override;
        [[nodiscard]] Point3D getTangentAt(double progress) const override;
        [[nodiscard]] const PathConfig& getConfig() const override { return config(); }
        [[nodiscard]] std::vector<Point3D> precomputePath(int resolution) override;
        [[nodiscard]] double getLength() override { return length_; }
        void setParams(const ParamMap& params) override;
        [[nodiscard]] ParamMap getParams() const override { return params_; }

        void setPoints(const Point3D& start, const Point3D& end);

    private:
        void updateFromParams();

        ParamMap params_;
        Point3D start_{0.0};
        Point3D end_{10.0, 0.0, 0.0};
        Point3D direction_{1.0, 0.0, 0.0};
        double length_ = 10.0;
    };

} // namespace mpe::motion
