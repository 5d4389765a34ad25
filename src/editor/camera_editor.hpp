/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "io/camera_events.hpp"
#include "io/level.hpp"
#include "io/tile_timing.hpp"
#include "sequencer/camera_track.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace adocam::editor {

    // Owns one open level and the camera track built from its MoveCamera actions.
    // Keys of those actions that the track does not model are kept per keyframe
    // and written back on save.
    class CameraEditor {
    public:
        explicit CameraEditor(core::param::EditorParameters params = {});

        std::expected<void, std::string> open(const std::filesystem::path& path);
        std::expected<void, std::string> openLevel(io::Level level);

        std::expected<void, std::string> save(const std::filesystem::path& path);
        // Back to the file the level was opened from
        std::expected<void, std::string> save();

        // MoveCamera actions for the current track, in track order
        [[nodiscard]] io::Json buildCameraActions() const;

        [[nodiscard]] sequencer::CameraTrack& track() { return track_; }
        [[nodiscard]] const sequencer::CameraTrack& track() const { return track_; }
        [[nodiscard]] const io::TileTiming& timing() const { return timing_; }
        [[nodiscard]] const io::Level& level() const { return level_; }
        [[nodiscard]] const std::vector<glm::dvec2>& tilePositions() const { return tile_positions_; }
        [[nodiscard]] const core::param::EditorParameters& params() const { return params_; }

        // MoveCamera actions currently stored in the level
        [[nodiscard]] size_t cameraEventCount() const;

        [[nodiscard]] bool isOpen() const { return open_; }

        [[nodiscard]] const io::Json& passthroughOf(sequencer::KeyframeId id) const;

        bool selectAt(const glm::dvec2& point);
        std::optional<sequencer::KeyframeId> duplicateSelected();
        void deleteSelected();

        // Rebuilds every keyframe's sample cache at the preview resolution
        void refreshPreview();
        [[nodiscard]] std::vector<sequencer::CameraState> previewPath() const;

    private:
        core::param::EditorParameters params_;
        io::Level level_;
        io::TileTiming timing_;
        std::vector<glm::dvec2> tile_positions_;
        sequencer::CameraTrack track_;
        std::unordered_map<sequencer::KeyframeId, io::Json> passthrough_;
        bool open_ = false;
    };

} // namespace adocam::editor
