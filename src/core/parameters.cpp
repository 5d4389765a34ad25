/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"

#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace adocam::core::param {

    namespace {
        constexpr size_t MIN_SAMPLE_COUNT = 2;

        std::expected<void, std::string> read_sample_count(const nlohmann::json& j, const char* key, size_t& out) {
            if (!j.contains(key)) return {};
            const auto& v = j[key];
            if (!v.is_number_integer() || v.get<int64_t>() < static_cast<int64_t>(MIN_SAMPLE_COUNT)) {
                return std::unexpected(std::format("'{}' must be an integer >= {}", key, MIN_SAMPLE_COUNT));
            }
            out = static_cast<size_t>(v.get<int64_t>());
            return {};
        }
    } // namespace

    nlohmann::json EditorParameters::to_json() const {
        nlohmann::json j;
        j["export_samples"] = export_samples;
        j["preview_samples"] = preview_samples;
        j["duplicate_offset_ms"] = duplicate_offset_ms;
        j["select_radius"] = select_radius;
        j["path_step_ms"] = path_step_ms;
        return j;
    }

    std::expected<EditorParameters, std::string> EditorParameters::from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return std::unexpected("Editor parameters must be a JSON object");
        }

        EditorParameters params;
        if (auto r = read_sample_count(j, "export_samples", params.export_samples); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_sample_count(j, "preview_samples", params.preview_samples); !r) {
            return std::unexpected(r.error());
        }

        if (j.contains("duplicate_offset_ms")) {
            if (!j["duplicate_offset_ms"].is_number_integer()) {
                return std::unexpected("'duplicate_offset_ms' must be an integer");
            }
            params.duplicate_offset_ms = j["duplicate_offset_ms"].get<int64_t>();
        }

        if (j.contains("select_radius")) {
            if (!j["select_radius"].is_number() || j["select_radius"].get<double>() <= 0.0) {
                return std::unexpected("'select_radius' must be a positive number");
            }
            params.select_radius = j["select_radius"].get<double>();
        }

        if (j.contains("path_step_ms")) {
            if (!j["path_step_ms"].is_number_integer() || j["path_step_ms"].get<int64_t>() <= 0) {
                return std::unexpected("'path_step_ms' must be a positive integer");
            }
            params.path_step_ms = j["path_step_ms"].get<int64_t>();
        }

        for (const auto& [key, value] : j.items()) {
            if (key != "export_samples" && key != "preview_samples" && key != "duplicate_offset_ms" &&
                key != "select_radius" && key != "path_step_ms") {
                LOG_WARN("Unknown editor parameter '{}' ignored", key);
            }
        }
        return params;
    }

    std::expected<EditorParameters, std::string> read_editor_params_from_json(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            std::string error_msg = std::format("Parameter file does not exist: {}", path.string());
            LOG_ERROR("{}", error_msg);
            return std::unexpected(error_msg);
        }

        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                std::string error_msg = std::format("Cannot open parameter file: {}", path.string());
                LOG_ERROR("{}", error_msg);
                return std::unexpected(error_msg);
            }

            nlohmann::json j;
            file >> j;

            auto params = EditorParameters::from_json(j);
            if (!params) {
                LOG_ERROR("Invalid parameters in {}: {}", path.string(), params.error());
                return std::unexpected(std::format("{}: {}", path.string(), params.error()));
            }
            LOG_DEBUG("Loaded editor parameters from {}", path.string());
            return params;
        } catch (const nlohmann::json::exception& e) {
            std::string error_msg = std::format("Failed to parse parameter file {}: {}", path.string(), e.what());
            LOG_ERROR("{}", error_msg);
            return std::unexpected(error_msg);
        }
    }

    std::expected<void, std::string> save_editor_params_to_json(const EditorParameters& params,
                                                                const std::filesystem::path& path) {
        std::ofstream file(path);
        if (!file.is_open()) {
            std::string error_msg = std::format("Failed to open parameter file for writing: {}", path.string());
            LOG_ERROR("{}", error_msg);
            return std::unexpected(error_msg);
        }
        file << params.to_json().dump(4);
        if (!file) {
            return std::unexpected(std::format("Failed to write parameter file: {}", path.string()));
        }
        return {};
    }

} // namespace adocam::core::param
