/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace adocam::io {

    // Levels keep their key order so written files diff cleanly against the input
    using Json = nlohmann::ordered_json;

    inline constexpr double MIDSPIN_ANGLE = 999.0;
    inline constexpr double DEFAULT_BPM = 100.0;
    inline constexpr std::string_view MOVE_CAMERA_EVENT = "MoveCamera";

    // Strips a UTF-8 BOM and the trailing commas the game writes before '}' and ']'
    [[nodiscard]] std::string sanitizeLevelText(std::string_view text);

    // Absolute path letters to angles in degrees; '!' is a midspin
    [[nodiscard]] std::expected<std::vector<double>, std::string> decodePathData(std::string_view path_data);

    // An .adofai level: settings, actions and the tile path
    class Level {
    public:
        Level() = default;
        explicit Level(Json data, std::filesystem::path path = {});

        [[nodiscard]] static std::expected<Level, std::string> load(const std::filesystem::path& path);
        [[nodiscard]] static std::expected<Level, std::string> parse(std::string_view text);

        [[nodiscard]] std::expected<void, std::string> write(const std::filesystem::path& path) const;
        // Writes back to the path the level was loaded from
        [[nodiscard]] std::expected<void, std::string> write() const;

        [[nodiscard]] const Json& data() const { return data_; }
        [[nodiscard]] const std::filesystem::path& path() const { return path_; }

        [[nodiscard]] Json& settings();
        [[nodiscard]] const Json& settings() const;
        [[nodiscard]] Json& actions();
        [[nodiscard]] const Json& actions() const;

        [[nodiscard]] double bpm() const;

        // From "angleData", falling back to decoded "pathData"
        [[nodiscard]] std::expected<std::vector<double>, std::string> angles() const;

        [[nodiscard]] std::vector<Json> actionsOfType(std::string_view event_type) const;
        size_t removeActions(std::string_view event_type);
        void addAction(Json action);

    private:
        Json data_ = Json::object();
        std::filesystem::path path_;
    };

} // namespace adocam::io
