/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "editor/camera_editor.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <format>

namespace adocam::editor {

    using sequencer::KeyframeId;

    CameraEditor::CameraEditor(core::param::EditorParameters params)
        : params_(std::move(params)) {}

    std::expected<void, std::string> CameraEditor::open(const std::filesystem::path& path) {
        auto level = io::Level::load(path);
        if (!level) {
            return std::unexpected(level.error());
        }
        return openLevel(std::move(*level));
    }

    std::expected<void, std::string> CameraEditor::openLevel(io::Level level) {
        LOG_TIMER_DEBUG("CameraEditor::openLevel");

        auto timing = io::TileTiming::fromLevel(level);
        if (!timing) {
            LOG_ERROR("Cannot compute tile timing: {}", timing.error());
            return std::unexpected(timing.error());
        }
        auto angles = level.angles();
        if (!angles) {
            return std::unexpected(angles.error());
        }

        sequencer::CameraTrack track;
        std::unordered_map<KeyframeId, io::Json> passthrough;

        size_t skipped = 0;
        for (const auto& action : level.actionsOfType(io::MOVE_CAMERA_EVENT)) {
            auto event = io::parseCameraEvent(action);
            if (!event) {
                LOG_WARN("Skipping camera event: {}", event.error());
                ++skipped;
                continue;
            }
            if (event->floor >= timing->floorCount()) {
                LOG_WARN("Camera event on floor {} is past the last floor {}", event->floor,
                         timing->floorCount() - 1);
            }

            const auto time = static_cast<int64_t>(std::llround(timing->timeOf(event->floor)));
            const KeyframeId id = track.addKeyframe(io::toKeyframe(*event, time));
            passthrough.emplace(id, std::move(event->passthrough));
        }
        track.deselect();

        level_ = std::move(level);
        timing_ = std::move(*timing);
        tile_positions_ = io::tilePositions(*angles);
        track_ = std::move(track);
        passthrough_ = std::move(passthrough);
        open_ = true;

        LOG_INFO("Opened {} camera keyframes over {} floors ({} skipped)",
                 track_.size(), timing_.floorCount(), skipped);
        return {};
    }

    io::Json CameraEditor::buildCameraActions() const {
        io::Json actions = io::Json::array();
        for (const auto& keyframe : track_.keyframes()) {
            const size_t floor = timing_.floorForTime(static_cast<double>(keyframe.time));
            const auto event = io::fromKeyframe(keyframe, floor, params_.export_samples,
                                                passthroughOf(keyframe.id));
            actions.push_back(io::toJson(event));
        }
        return actions;
    }

    std::expected<void, std::string> CameraEditor::save(const std::filesystem::path& path) {
        if (!open_) {
            return std::unexpected("No level is open");
        }

        const size_t removed = level_.removeActions(io::MOVE_CAMERA_EVENT);
        for (auto& action : buildCameraActions()) {
            level_.addAction(std::move(action));
        }
        LOG_DEBUG("Replaced {} camera events with {}", removed, track_.size());

        return level_.write(path);
    }

    std::expected<void, std::string> CameraEditor::save() {
        if (level_.path().empty()) {
            return std::unexpected("Level has no file to save to");
        }
        return save(level_.path());
    }

    size_t CameraEditor::cameraEventCount() const {
        return level_.actionsOfType(io::MOVE_CAMERA_EVENT).size();
    }

    const io::Json& CameraEditor::passthroughOf(const KeyframeId id) const {
        static const io::Json empty = io::Json::object();
        const auto it = passthrough_.find(id);
        return it != passthrough_.end() ? it->second : empty;
    }

    bool CameraEditor::selectAt(const glm::dvec2& point) {
        return track_.selectByPosition(point, params_.select_radius);
    }

    std::optional<KeyframeId> CameraEditor::duplicateSelected() {
        const auto source = track_.selectedId();
        if (!source) return std::nullopt;

        const auto copy = track_.duplicateSelected(params_.duplicate_offset_ms);
        if (copy) {
            passthrough_[*copy] = passthroughOf(*source);
        }
        return copy;
    }

    void CameraEditor::deleteSelected() {
        if (const auto id = track_.selectedId()) {
            passthrough_.erase(*id);
            track_.deleteSelected();
        }
    }

    void CameraEditor::refreshPreview() {
        track_.regenerateSamples(params_.preview_samples);
    }

    std::vector<sequencer::CameraState> CameraEditor::previewPath() const {
        return track_.samplePath(params_.path_step_ms);
    }

} // namespace adocam::editor
