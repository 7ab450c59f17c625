/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "sampled_path.hpp"

namespace mpe::motion {

    // Lorenz attractor integrated with forward Euler:
    //   dx/dt = sigma (y - x)
    //   dy/dt = x (rho - z) - y
    //   dz/dt = x y - beta z
    // Simulation y/z are swapped so the butterfly stands upright.
    class LorenzPath final : public SampledPath {
    public:
        explicit LorenzPath(const ParamMap& params = {});

        [[nodiscard]] static const PathConfig& config();

        [[nodiscard]] const PathConfig& getConfig() const override { return config(); }

        // resolution is the number of integration steps; re-integrates when it changes
        [[nodiscard]] std::vector<Point3D> precomputePath(int resolution) override;

        void setParams(const ParamMap& params) override;
        [[nodiscard]] ParamMap getParams() const override { return params_; }

        [[nodiscard]] std::vector<Point3D> getPoints() const;
        [[nodiscard]] std::vector<double> getArcLengths() const;

    private:
        void computePath();

        ParamMap params_;
    };

} // namespace mpe::motion
