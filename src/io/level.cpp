/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/level.hpp"
#include "core/logger.hpp"
#include <cctype>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace adocam::io {

    namespace {
        constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

        [[nodiscard]] std::optional<double> pathLetterAngle(const char c) {
            switch (c) {
                case 'R': return 0.0;
                case 'p': return 15.0;
                case 'J': return 30.0;
                case 'E': return 45.0;
                case 'T': return 60.0;
                case 'o': return 75.0;
                case 'U': return 90.0;
                case 'q': return 105.0;
                case 'G': return 120.0;
                case 'Q': return 135.0;
                case 'H': return 150.0;
                case 'W': return 165.0;
                case 'L': return 180.0;
                case 'x': return 195.0;
                case 'N': return 210.0;
                case 'Z': return 225.0;
                case 'F': return 240.0;
                case 'V': return 255.0;
                case 'D': return 270.0;
                case 'Y': return 285.0;
                case 'B': return 300.0;
                case 'C': return 315.0;
                case 'M': return 330.0;
                case 'A': return 345.0;
                case '!': return MIDSPIN_ANGLE;
                default: return std::nullopt;
            }
        }

        [[nodiscard]] const Json& emptyArray() {
            static const Json empty = Json::array();
            return empty;
        }

        [[nodiscard]] const Json& emptyObject() {
            static const Json empty = Json::object();
            return empty;
        }
    } // namespace

    std::string sanitizeLevelText(std::string_view text) {
        if (text.starts_with(UTF8_BOM)) {
            text.remove_prefix(UTF8_BOM.size());
        }

        std::string out;
        out.reserve(text.size());

        bool in_string = false;
        bool escaped = false;
        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (in_string) {
                out.push_back(c);
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            if (c == '"') {
                in_string = true;
            } else if (c == ',') {
                size_t j = i + 1;
                while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
                if (j < text.size() && (text[j] == '}' || text[j] == ']')) {
                    continue;
                }
            }
            out.push_back(c);
        }
        return out;
    }

    std::expected<std::vector<double>, std::string> decodePathData(const std::string_view path_data) {
        std::vector<double> angles;
        angles.reserve(path_data.size());
        for (size_t i = 0; i < path_data.size(); ++i) {
            const auto angle = pathLetterAngle(path_data[i]);
            if (!angle) {
                return std::unexpected(std::format("Unsupported pathData letter '{}' at index {}", path_data[i], i));
            }
            angles.push_back(*angle);
        }
        return angles;
    }

    Level::Level(Json data, std::filesystem::path path)
        : data_(std::move(data)),
          path_(std::move(path)) {}

    std::expected<Level, std::string> Level::load(const std::filesystem::path& path) {
        LOG_TIMER_DEBUG("Level loading");

        if (!std::filesystem::is_regular_file(path)) {
            std::string error_msg = std::format("Level file does not exist: {}", path.string());
            LOG_ERROR("{}", error_msg);
            return std::unexpected(error_msg);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::string error_msg = std::format("Cannot open level for reading: {}", path.string());
            LOG_ERROR("{}", error_msg);
            return std::unexpected(error_msg);
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto level = parse(buffer.str());
        if (!level) {
            LOG_ERROR("Failed to parse level {}: {}", path.string(), level.error());
            return std::unexpected(level.error());
        }
        level->path_ = path;

        LOG_INFO("Loaded level {} ({} actions)", path.filename().string(), std::as_const(*level).actions().size());
        return level;
    }

    std::expected<Level, std::string> Level::parse(const std::string_view text) {
        try {
            auto data = Json::parse(sanitizeLevelText(text));
            if (!data.is_object()) {
                return std::unexpected("Level root is not a JSON object");
            }
            return Level(std::move(data));
        } catch (const Json::exception& e) {
            return std::unexpected(std::format("Invalid level JSON: {}", e.what()));
        }
    }

    std::expected<void, std::string> Level::write(const std::filesystem::path& path) const {
        try {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                std::string error_msg = std::format("Failed to open level file for writing: {}", path.string());
                LOG_ERROR("{}", error_msg);
                return std::unexpected(error_msg);
            }
            file << data_.dump(2, ' ', false, Json::error_handler_t::replace);
            if (!file) {
                std::string error_msg = std::format("Failed to write level file: {}", path.string());
                LOG_ERROR("{}", error_msg);
                return std::unexpected(error_msg);
            }
            LOG_INFO("Wrote level {}", path.string());
            return {};
        } catch (const std::exception& e) {
            LOG_ERROR("Level write failed: {}", e.what());
            return std::unexpected(std::format("Level write failed: {}", e.what()));
        }
    }

    std::expected<void, std::string> Level::write() const {
        if (path_.empty()) {
            return std::unexpected("No filename supplied for level write");
        }
        return write(path_);
    }

    Json& Level::settings() {
        if (!data_.contains("settings") || !data_["settings"].is_object()) {
            data_["settings"] = Json::object();
        }
        return data_["settings"];
    }

    const Json& Level::settings() const {
        const auto it = data_.find("settings");
        return (it != data_.end() && it->is_object()) ? *it : emptyObject();
    }

    Json& Level::actions() {
        if (!data_.contains("actions") || !data_["actions"].is_array()) {
            data_["actions"] = Json::array();
        }
        return data_["actions"];
    }

    const Json& Level::actions() const {
        const auto it = data_.find("actions");
        return (it != data_.end() && it->is_array()) ? *it : emptyArray();
    }

    double Level::bpm() const {
        const auto& s = settings();
        const auto it = s.find("bpm");
        if (it != s.end() && it->is_number() && it->get<double>() > 0.0) {
            return it->get<double>();
        }
        return DEFAULT_BPM;
    }

    std::expected<std::vector<double>, std::string> Level::angles() const {
        if (const auto it = data_.find("angleData"); it != data_.end()) {
            if (!it->is_array()) {
                return std::unexpected("angleData is not an array");
            }
            std::vector<double> result;
            result.reserve(it->size());
            for (const auto& a : *it) {
                if (!a.is_number()) {
                    return std::unexpected(std::format("angleData entry {} is not a number", result.size()));
                }
                result.push_back(a.get<double>());
            }
            return result;
        }
        if (const auto it = data_.find("pathData"); it != data_.end() && it->is_string()) {
            return decodePathData(it->get<std::string>());
        }
        return std::unexpected("Level has neither angleData nor pathData");
    }

    std::vector<Json> Level::actionsOfType(const std::string_view event_type) const {
        std::vector<Json> result;
        for (const auto& action : actions()) {
            const auto it = action.find("eventType");
            if (it != action.end() && it->is_string() && it->get<std::string>() == event_type) {
                result.push_back(action);
            }
        }
        return result;
    }

    size_t Level::removeActions(const std::string_view event_type) {
        auto& list = actions();
        const size_t before = list.size();
        Json kept = Json::array();
        for (auto& action : list) {
            const auto it = action.find("eventType");
            const bool matches = it != action.end() && it->is_string() && it->get<std::string>() == event_type;
            if (!matches) {
                kept.push_back(std::move(action));
            }
        }
        list = std::move(kept);
        return before - list.size();
    }

    void Level::addAction(Json action) {
        actions().push_back(std::move(action));
    }

} // namespace adocam::io
