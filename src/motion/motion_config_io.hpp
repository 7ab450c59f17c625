/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_controller.hpp"
#include "path_generator.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace mpe::motion {

    // nlohmann ADL hooks. Unknown loop modes fall back to "loop";
    // unknown modifier types are dropped with a warning.
    void to_json(nlohmann::json& j, const ParameterMeta& meta);
    void to_json(nlohmann::json& j, const PathConfig& config);
    void to_json(nlohmann::json& j, const ModifierConfig& config);
    void to_json(nlohmann::json& j, const MotionControllerConfig& config);
    void from_json(const nlohmann::json& j, MotionControllerConfig& config);

    [[nodiscard]] std::expected<ModifierConfig, std::string> modifierFromJson(const nlohmann::json& j);

    [[nodiscard]] std::expected<MotionControllerConfig, std::string> parseMotionConfig(std::string_view text);

    [[nodiscard]] std::expected<MotionControllerConfig, std::string> readMotionConfig(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, std::string> writeMotionConfig(const MotionControllerConfig& config,
                                                                     const std::filesystem::path& path);

} // namespace mpe::motion
