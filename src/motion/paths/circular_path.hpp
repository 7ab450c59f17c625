/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion/path_generator.hpp"

namespace mpe::motion {

    // Elliptical orbit in the XZ plane with optional vertical wave,
    // tilted about X then Y and offset to a center. progress 1 = one orbit.
    class CircularPath final : public PathGenerator {
    public:
        explicit CircularPath(const ParamMap& params = {});

        [[nodiscard]] static const PathConfig& config();

        [[nodiscard]] Point3D getPositionAt(double progress) const override;
        [[nodiscard]] Point3D getTangentAt(double progress) const override;
        [[nodiscard]] const PathConfig& getConfig() const override { return config(); }
        [[nodiscard]] std::vector<Point3D> precomputePath(int resolution) override;
        [[nodiscard]] double getLength() override;
        void setParams(const ParamMap& params) override;
        [[nodiscard]] ParamMap getParams() const override { return params_; }

    private:
        [[nodiscard]] double direction() const;
        [[nodiscard]] Point3D applyTilt(Point3D v) const;

        ParamMap params_;
    };

} // namespace mpe::motion
