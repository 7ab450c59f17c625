/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion/path_registry.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace mpe::motion;

namespace {

    // Constant-position path used to exercise custom registration
    class FixedPath final : public PathGenerator {
    public:
        explicit FixedPath(const ParamMap& params = {})
            : params_(mergeParams(config().default_params, params)) {}

        static const PathConfig& config() {
            static const PathConfig cfg{"fixed", "Fixed Point", "Stays at one position",
                                        {{"x", 1.0}}, {{"x", "X", -10.0, 10.0, 1.0, 1.0, std::nullopt}}};
            return cfg;
        }

        Point3D getPositionAt(double /*progress*/) const override { return {params_.at("x"), 0.0, 0.0}; }
        Point3D getTangentAt(double /*progress*/) const override { return DEFAULT_TANGENT; }
        const PathConfig& getConfig() const override { return config(); }
        std::vector<Point3D> precomputePath(const int resolution) override { return sampleByProgress(*this, resolution); }
        double getLength() override { return 0.0; }
        void setParams(const ParamMap& params) override { params_ = mergeParams(params_, params); }
        ParamMap getParams() const override { return params_; }

    private:
        ParamMap params_;
    };

} // namespace

TEST(PathRegistry, BuiltinsInRegistrationOrder) {
    const PathRegistry registry;
    const std::vector<std::string> expected{"lorenz", "lissajous", "circular", "spline", "linear"};
    EXPECT_EQ(registry.getTypes(), expected);

    const auto configs = registry.getAllConfigs();
    ASSERT_EQ(configs.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(configs[i].type, expected[i]);
    }
}

TEST(PathRegistry, CreateMergesDefaults) {
    const PathRegistry registry;
    auto path = registry.create("circular", {{"radiusX", 3.0}});
    ASSERT_TRUE(path.has_value()) << path.error();

    const ParamMap params = (*path)->getParams();
    EXPECT_DOUBLE_EQ(params.at("radiusX"), 3.0);
    EXPECT_DOUBLE_EQ(params.at("radiusY"), 5.0);
    EXPECT_EQ((*path)->getConfig().type, "circular");
}

TEST(PathRegistry, UnknownTypeListsAvailable) {
    const PathRegistry registry;
    auto path = registry.create("helix");
    ASSERT_FALSE(path.has_value());
    EXPECT_NE(path.error().find("helix"), std::string::npos);
    EXPECT_NE(path.error().find("lorenz, lissajous, circular, spline, linear"), std::string::npos);
}

TEST(PathRegistry, GetConfigForUnknownTypeIsEmpty) {
    const PathRegistry registry;
    EXPECT_FALSE(registry.getConfig("helix").has_value());
    ASSERT_TRUE(registry.getConfig("linear").has_value());
    EXPECT_EQ(registry.getConfig("linear")->name, "Linear Path");
}

TEST(PathRegistry, CustomRegistration) {
    PathRegistry registry(false);
    EXPECT_TRUE(registry.getTypes().empty());

    EXPECT_TRUE(registry.registerPath(makeRegistryEntry<FixedPath>()));
    EXPECT_TRUE(registry.has("fixed"));

    auto path = registry.create("fixed", {{"x", 4.0}});
    ASSERT_TRUE(path.has_value());
    EXPECT_DOUBLE_EQ((*path)->getPositionAt(0.5).x, 4.0);
}

TEST(PathRegistry, DuplicateRegistrationRejected) {
    PathRegistry registry;
    ASSERT_TRUE(registry.registerPath(makeRegistryEntry<FixedPath>()));
    EXPECT_FALSE(registry.registerPath(makeRegistryEntry<FixedPath>()));

    auto replacement = makeRegistryEntry<FixedPath>();
    replacement.type = "circular";
    EXPECT_FALSE(registry.registerPath(std::move(replacement)));
    EXPECT_EQ(registry.getTypes().size(), 6u);
}

TEST(PathRegistry, IncompleteEntryRejected) {
    PathRegistry registry(false);
    EXPECT_FALSE(registry.registerPath(PathRegistryEntry{"broken", nullptr, &FixedPath::config}));
    EXPECT_FALSE(registry.registerPath(PathRegistryEntry{"", makeRegistryEntry<FixedPath>().factory, &FixedPath::config}));
    EXPECT_FALSE(registry.has("broken"));
}

TEST(PathRegistry, UnregisterRemovesType) {
    PathRegistry registry;
    EXPECT_TRUE(registry.unregisterPath("lorenz"));
    EXPECT_FALSE(registry.has("lorenz"));
    EXPECT_FALSE(registry.unregisterPath("lorenz"));

    const auto types = registry.getTypes();
    EXPECT_EQ(std::find(types.begin(), types.end(), "lorenz"), types.end());
    EXPECT_FALSE(registry.create("lorenz").has_value());
}

TEST(PathRegistry, InstancesAreIsolated) {
    PathRegistry local(false);
    ASSERT_TRUE(local.registerPath(makeRegistryEntry<FixedPath>()));
    EXPECT_FALSE(PathRegistry::global().has("fixed"));
    EXPECT_TRUE(PathRegistry::global().has("circular"));
}
