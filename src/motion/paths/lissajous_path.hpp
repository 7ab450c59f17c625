/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "sampled_path.hpp"

namespace mpe::motion {

    // x = Ax sin(fx t + px), y = Ay sin(fy t + py), z = Az sin(fz t + pz), t in [0, 2pi]
    class LissajousPath final : public SampledPath {
    public:
        explicit LissajousPath(const ParamMap& params = {});

        [[nodiscard]] static const PathConfig& config();

        [[nodiscard]] const PathConfig& getConfig() const override { return config(); }

        // Re-bakes when resolution differs from the current one
        [[nodiscard]] std::vector<Point3D> precomputePath(int resolution) override;

        void setParams(const ParamMap& params) override;
        [[nodiscard]] ParamMap getParams() const override { return params_; }

    private:
        void computePath();

        ParamMap params_;
    };

} // namespace mpe::motion
