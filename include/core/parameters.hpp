/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace adocam::core::param {

    struct EditorParameters {
        size_t export_samples = 60;        // Cache length written with each MoveCamera
        size_t preview_samples = 100;      // Cache length used while editing
        int64_t duplicate_offset_ms = 250; // Time offset of a duplicated keyframe
        double select_radius = 0.5;        // Tile units
        int64_t path_step_ms = 16;         // Sampling step of the preview path

        [[nodiscard]] nlohmann::json to_json() const;
        // Missing keys keep their defaults; present keys must be valid
        [[nodiscard]] static std::expected<EditorParameters, std::string> from_json(const nlohmann::json& j);
    };

    // Read editor parameters from a JSON file
    std::expected<EditorParameters, std::string> read_editor_params_from_json(const std::filesystem::path& path);

    // Save editor parameters to a JSON file
    std::expected<void, std::string> save_editor_params_to_json(const EditorParameters& params,
                                                                const std::filesystem::path& path);

} // namespace adocam::core::param
