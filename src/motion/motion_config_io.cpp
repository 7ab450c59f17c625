/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_config_io.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mpe::motion {

    using json = nlohmann::json;

    namespace {
        constexpr int JSON_INDENT = 2;

        json modifierValueToJson(const ModifierValue& value) {
            return std::visit([](const auto& v) { return json(v); }, value);
        }

        std::expected<ModifierValue, std::string> modifierValueFromJson(const json& j) {
            if (j.is_boolean()) return ModifierValue{j.get<bool>()};
            if (j.is_number()) return ModifierValue{j.get<double>()};
            if (j.is_string()) return ModifierValue{j.get<std::string>()};
            return std::unexpected(std::format("unsupported modifier parameter value: {}", j.dump()));
        }
    } // namespace

    void to_json(json& j, const ParameterMeta& meta) {
        j = json{{"key", meta.key},
                 {"label", meta.label},
                 {"min", meta.min},
                 {"max", meta.max},
                 {"step", meta.step},
                 {"default", meta.default_value}};
        if (meta.description) {
            j["description"] = *meta.description;
        }
    }

    void to_json(json& j, const PathConfig& config) {
        j = json{{"type", config.type},
                 {"name", config.name},
                 {"description", config.description},
                 {"defaultParams", config.default_params},
                 {"parameterMeta", config.parameter_meta}};
    }

    void to_json(json& j, const ModifierConfig& config) {
        json params = json::object();
        for (const auto& [key, value] : config.params) {
            params[key] = modifierValueToJson(value);
        }
        j = json{{"type", std::string(toString(config.type))},
                 {"enabled", config.enabled},
                 {"params", std::move(params)}};
    }

    void to_json(json& j, const MotionControllerConfig& config) {
        j = json{{"pathType", config.path_type},
                 {"pathParams", config.path_params},
                 {"speed", config.speed},
                 {"progressOffset", config.progress_offset},
                 {"loop", std::string(toString(config.loop))},
                 {"modifiers", config.modifiers},
                 {"duration", config.duration},
                 {"startFrame", config.start_frame}};
    }

    std::expected<ModifierConfig, std::string> modifierFromJson(const json& j) {
        if (!j.is_object()) {
            return std::unexpected("modifier entry is not an object");
        }
        const auto type_name = j.value("type", std::string{});
        const auto type = modifierTypeFromString(type_name);
        if (!type) {
            return std::unexpected(std::format("unknown modifier type '{}'", type_name));
        }

        ModifierConfig config;
        config.type = *type;
        config.enabled = j.value("enabled", true);
        if (const auto it = j.find("params"); it != j.end() && it->is_object()) {
            for (const auto& [key, value] : it->items()) {
                auto parsed = modifierValueFromJson(value);
                if (!parsed) {
                    return std::unexpected(std::format("modifier '{}' param '{}': {}", type_name, key, parsed.error()));
                }
                config.params.emplace(key, std::move(*parsed));
            }
        }
        return config;
    }

    void from_json(const json& j, MotionControllerConfig& config) {
        const MotionControllerConfig defaults;
        config.path_type = j.at("pathType").get<std::string>();
        config.path_params = j.value("pathParams", ParamMap{});
        config.speed = j.value("speed", defaults.speed);
        config.progress_offset = j.value("progressOffset", defaults.progress_offset);
        config.duration = j.value("duration", defaults.duration);
        config.start_frame = j.value("startFrame", defaults.start_frame);

        const auto loop_name = j.value("loop", std::string(toString(defaults.loop)));
        if (const auto loop = loopModeFromString(loop_name)) {
            config.loop = *loop;
        } else {
            LOG_WARN("Unknown loop mode '{}', using '{}'", loop_name, toString(defaults.loop));
            config.loop = defaults.loop;
        }

        config.modifiers.clear();
        if (const auto it = j.find("modifiers"); it != j.end() && it->is_array()) {
            for (const auto& entry : *it) {
                auto modifier = modifierFromJson(entry);
                if (!modifier) {
                    LOG_WARN("Skipping modifier: {}", modifier.error());
                    continue;
                }
                config.modifiers.push_back(std::move(*modifier));
            }
        }
    }

    std::expected<MotionControllerConfig, std::string> parseMotionConfig(const std::string_view text) {
        try {
            return json::parse(text).get<MotionControllerConfig>();
        } catch (const json::exception& e) {
            return std::unexpected(std::format("Invalid motion config: {}", e.what()));
        }
    }

    std::expected<MotionControllerConfig, std::string> readMotionConfig(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(std::format("Failed to open motion config: {}", path.string()));
        }
        try {
            auto config = json::parse(file).get<MotionControllerConfig>();
            LOG_DEBUG("Loaded motion config '{}' from {}", config.path_type, path.string());
            return config;
        } catch (const json::exception& e) {
            return std::unexpected(std::format("Invalid motion config {}: {}", path.string(), e.what()));
        }
    }

    std::expected<void, std::string> writeMotionConfig(const MotionControllerConfig& config,
                                                       const std::filesystem::path& path) {
        std::ofstream file(path);
        if (!file.is_open()) {
            return std::unexpected(std::format("Failed to open motion config for writing: {}", path.string()));
        }
        file << json(config).dump(JSON_INDENT);
        if (!file) {
            return std::unexpected(std::format("Failed to write motion config: {}", path.string()));
        }
        return {};
    }

} // namespace mpe::motion
