/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace adocam::core::args {

    enum class Command : uint8_t {
        NONE,
        INFO,
        SAMPLE,
        EXPORT,
        CURVE
    };

    struct AppParameters {
        Command command = Command::NONE;
        bool show_help = false;

        std::filesystem::path level_path;
        std::filesystem::path output_path;
        std::string ease_name;

        std::optional<double> time_ms;
        std::optional<double> end_ms;
        std::optional<double> step_ms;
        std::optional<size_t> curve_samples;

        std::filesystem::path config_path;
        LogLevel log_level = LogLevel::Info;
        std::filesystem::path log_file;

        param::EditorParameters editor;
    };

    [[nodiscard]] std::string usage();

    [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

    // Command line only: no logger setup and no config file access
    std::expected<AppParameters, std::string> parse_args(std::span<const std::string_view> args);

    // Parses argv, initializes the logger and loads the --config file
    std::expected<AppParameters, std::string> parse_args_and_params(int argc, const char* const argv[]);

} // namespace adocam::core::args
