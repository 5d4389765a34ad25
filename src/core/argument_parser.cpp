/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace adocam::core::args {

    namespace {
        [[nodiscard]] std::optional<Command> parse_command(const std::string_view name) {
            if (name == "info") return Command::INFO;
            if (name == "sample") return Command::SAMPLE;
            if (name == "export") return Command::EXPORT;
            if (name == "curve") return Command::CURVE;
            return std::nullopt;
        }

        template <typename T>
        std::expected<T, std::string> parse_number(const std::string_view option, const std::string_view text) {
            T value{};
            const auto* const end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc{} || ptr != end) {
                return std::unexpected(std::format("Invalid value '{}' for {}", text, option));
            }
            return value;
        }

        std::expected<void, std::string> validate(const AppParameters& params) {
            if (params.show_help) return {};

            switch (params.command) {
            case Command::NONE:
                return std::unexpected("Missing command (info, sample, export, curve)");
            case Command::INFO:
            case Command::SAMPLE:
            case Command::EXPORT:
                if (params.level_path.empty()) {
                    return std::unexpected("Missing level file");
                }
                break;
            case Command::CURVE:
                if (params.ease_name.empty()) {
                    return std::unexpected("Missing ease name");
                }
                break;
            }

            if (params.command == Command::SAMPLE) {
                if (!params.time_ms) {
                    return std::unexpected("sample requires --time");
                }
                if (params.end_ms && *params.end_ms < *params.time_ms) {
                    return std::unexpected("--end must not be before --time");
                }
            }
            if (params.step_ms && *params.step_ms <= 0.0) {
                return std::unexpected("--step must be positive");
            }
            if (params.command == Command::EXPORT && params.output_path.empty()) {
                return std::unexpected("export requires --output");
            }
            if (params.curve_samples && *params.curve_samples < 2) {
                return std::unexpected("--samples must be at least 2");
            }
            return {};
        }
    } // namespace

    std::string usage() {
        return "Usage: adocam <command> [options]\n"
               "\n"
               "Commands:\n"
               "  info <level>                          Tile count, camera events and duration\n"
               "  sample <level> --time <ms>            Camera state at a time\n"
               "         [--end <ms>] [--step <ms>]     ...or over a range\n"
               "  export <level> --output <path>        Rewrite camera events with fresh sample caches\n"
               "  curve <ease> [--samples <n>]          Print a sampled easing curve\n"
               "\n"
               "Options:\n"
               "  --config <json>       Editor parameter file\n"
               "  --log-level <level>   trace, debug, info, perf, warn, error, critical, off\n"
               "  --log-file <path>     Also write the log to a file\n"
               "  -h, --help            Show this help\n";
    }

    std::optional<LogLevel> parse_log_level(const std::string_view name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "perf" || name == "performance") return LogLevel::Performance;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return std::nullopt;
    }

    std::expected<AppParameters, std::string> parse_args(const std::span<const std::string_view> args) {
        AppParameters params;
        std::vector<std::string_view> positional;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string_view arg = args[i];

            if (arg == "-h" || arg == "--help") {
                params.show_help = true;
                continue;
            }
            if (!arg.starts_with("--")) {
                positional.push_back(arg);
                continue;
            }
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Option {} requires a value", arg));
            }
            const std::string_view value = args[++i];

            if (arg == "--config") {
                params.config_path = value;
            } else if (arg == "--log-level") {
                const auto level = parse_log_level(value);
                if (!level) {
                    return std::unexpected(std::format("Unknown log level '{}'", value));
                }
                params.log_level = *level;
            } else if (arg == "--log-file") {
                params.log_file = value;
            } else if (arg == "--output") {
                params.output_path = value;
            } else if (arg == "--time" || arg == "--end" || arg == "--step") {
                auto number = parse_number<double>(arg, value);
                if (!number) return std::unexpected(number.error());
                auto& slot = arg == "--time" ? params.time_ms : arg == "--end" ? params.end_ms : params.step_ms;
                slot = *number;
            } else if (arg == "--samples") {
                auto number = parse_number<size_t>(arg, value);
                if (!number) return std::unexpected(number.error());
                params.curve_samples = *number;
            } else {
                return std::unexpected(std::format("Unknown option {}", arg));
            }
        }

        if (!positional.empty()) {
            const auto command = parse_command(positional.front());
            if (!command) {
                return std::unexpected(std::format("Unknown command '{}'", positional.front()));
            }
            params.command = *command;
        }
        if (positional.size() > 2) {
            return std::unexpected(std::format("Unexpected argument '{}'", positional[2]));
        }
        if (positional.size() == 2) {
            if (params.command == Command::CURVE) {
                params.ease_name = positional[1];
            } else {
                params.level_path = positional[1];
            }
        }

        if (auto valid = validate(params); !valid) {
            return std::unexpected(valid.error());
        }
        return params;
    }

    std::expected<AppParameters, std::string> parse_args_and_params(const int argc, const char* const argv[]) {
        std::vector<std::string_view> args;
        args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        auto params = parse_args(args);

        // Errors are reported through the logger, so it must exist either way
        Logger::get().init(params ? params->log_level : LogLevel::Info,
                           params ? params->log_file.string() : std::string{});
        if (!params) {
            return std::unexpected(params.error());
        }

        if (!params->config_path.empty()) {
            auto editor = param::read_editor_params_from_json(params->config_path);
            if (!editor) {
                return std::unexpected(editor.error());
            }
            params->editor = *editor;
        }
        return params;
    }

} // namespace adocam::core::args
