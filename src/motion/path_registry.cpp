/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "path_registry.hpp"
#include "core/logger.hpp"
#include "paths/circular_path.hpp"
#include "paths/linear_path.hpp"
#include "paths/lissajous_path.hpp"
#include "paths/lorenz_path.hpp"
#include "paths/spline_path.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace mpe::motion {

    PathRegistry& PathRegistry::global() {
        static PathRegistry registry;
        return registry;
    }

    PathRegistry::PathRegistry(const bool with_builtins) {
        if (with_builtins) {
            registerBuiltins();
        }
    }

    void PathRegistry::registerBuiltins() {
        for (auto entry : {makeRegistryEntry<LorenzPath>(),
                           makeRegistryEntry<LissajousPath>(),
                           makeRegistryEntry<CircularPath>(),
                           makeRegistryEntry<SplinePath>(),
                           makeRegistryEntry<LinearPath>()}) {
            order_.push_back(entry.type);
            registry_.emplace(entry.type, std::move(entry));
        }
    }

    bool PathRegistry::registerPath(PathRegistryEntry entry) {
        if (entry.type.empty() || !entry.factory || !entry.config) {
            LOG_WARN("Rejected incomplete path registration '{}'", entry.type);
            return false;
        }

        std::unique_lock lock(mutex_);
        if (registry_.contains(entry.type)) {
            LOG_WARN("Path type '{}' already registered", entry.type);
            return false;
        }
        LOG_DEBUG("Registered path type: {}", entry.type);
        order_.push_back(entry.type);
        auto type = entry.type;
        registry_.emplace(std::move(type), std::move(entry));
        return true;
    }

    bool PathRegistry::unregisterPath(const std::string& type) {
        std::unique_lock lock(mutex_);
        if (registry_.erase(type) == 0) {
            return false;
        }
        std::erase(order_, type);
        return true;
    }

    bool PathRegistry::has(const std::string& type) const {
        std::shared_lock lock(mutex_);
        return registry_.contains(type);
    }

    std::expected<std::unique_ptr<PathGenerator>, std::string>
    PathRegistry::create(const std::string& type, const ParamMap& params) const {
        std::shared_lock lock(mutex_);
        const auto it = registry_.find(type);
        if (it == registry_.end()) {
            std::string available;
            for (const auto& name : order_) {
                if (!available.empty()) {
                    available += ", ";
                }
                available += name;
            }
            return std::unexpected(
                std::format("Unknown path type: '{}'. Available: {}", type, available));
        }
        return it->second.factory(params);
    }

    std::optional<PathConfig> PathRegistry::getConfig(const std::string& type) const {
        std::shared_lock lock(mutex_);
        const auto it = registry_.find(type);
        if (it == registry_.end()) {
            return std::nullopt;
        }
        return it->second.config();
    }

    std::vector<std::string> PathRegistry::getTypes() const {
        std::shared_lock lock(mutex_);
        return order_;
    }

    std::vector<PathConfig> PathRegistry::getAllConfigs() const {
        std::shared_lock lock(mutex_);
        std::vector<PathConfig> configs;
        configs.reserve(order_.size());
        for (const auto& type : order_) {
            configs.push_back(registry_.at(type).config());
        }
        return configs;
    }

} // namespace mpe::motion
