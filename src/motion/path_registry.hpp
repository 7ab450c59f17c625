/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "path_generator.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mpe::motion {

    using PathFactory = std::function<std::unique_ptr<PathGenerator>(const ParamMap&)>;

    struct PathRegistryEntry {
        std::string type;
        PathFactory factory;
        std::function<const PathConfig&()> config;
    };

    // Type id -> path factory. Construct one per isolated context, or use
    // global() for the process-wide instance holding the built-in types.
    class PathRegistry {
    public:
        explicit PathRegistry(bool with_builtins = true);

        static PathRegistry& global();

        bool registerPath(PathRegistryEntry entry);
        bool unregisterPath(const std::string& type);

        [[nodiscard]] bool has(const std::string& type) const;

        // Error carries a diagnostic listing the available types
        [[nodiscard]] std::expected<std::unique_ptr<PathGenerator>, std::string>
        create(const std::string& type, const ParamMap& params = {}) const;

        [[nodiscard]] std::optional<PathConfig> getConfig(const std::string& type) const;

        // Registration order
        [[nodiscard]] std::vector<std::string> getTypes() const;
        [[nodiscard]] std::vector<PathConfig> getAllConfigs() const;

    private:
        void registerBuiltins();

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, PathRegistryEntry> registry_;
        std::vector<std::string> order_;
    };

    // Registers a PathGenerator subclass exposing static config() and a ParamMap constructor
    template <typename Path>
    PathRegistryEntry makeRegistryEntry() {
        return PathRegistryEntry{
            Path::config().type,
            [](const ParamMap& params) -> std::unique_ptr<PathGenerator> {
                return std::make_unique<Path>(params);
            },
            &Path::config};
    }

} // namespace mpe::motion
