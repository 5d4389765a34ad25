/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "keyframe.hpp"
#include <optional>
#include <span>
#include <vector>

namespace adocam::sequencer {

    inline constexpr int64_t DEFAULT_PATH_STEP_MS = 16;

    // Camera keyframes ordered by time. Keyframes with equal times keep their
    // insertion order. The selection is held by id, so it follows the same
    // keyframe through every re-sort.
    class CameraTrack {
    public:
        // Inserts and selects the new keyframe
        KeyframeId addKeyframe(int64_t time, double x, double y, double zoom, double angle,
                               EasingCurve ease = {});
        // Any id on the keyframe is replaced by a fresh one
        KeyframeId addKeyframe(Keyframe keyframe);

        void clear();

        [[nodiscard]] bool empty() const { return keyframes_.empty(); }
        [[nodiscard]] size_t size() const { return keyframes_.size(); }
        [[nodiscard]] std::span<const Keyframe> keyframes() const { return keyframes_; }

        [[nodiscard]] const Keyframe* find(KeyframeId id) const;
        [[nodiscard]] std::optional<size_t> indexOf(KeyframeId id) const;

        [[nodiscard]] int64_t startTime() const;
        [[nodiscard]] int64_t endTime() const;
        [[nodiscard]] int64_t duration() const;

        // (0, 0, 100, 0) on an empty track
        [[nodiscard]] CameraState stateAt(double time) const;
        [[nodiscard]] std::vector<CameraState> samplePath(int64_t step_ms = DEFAULT_PATH_STEP_MS) const;

        // Selection
        void select(KeyframeId id);
        void selectIndex(size_t index);
        void deselect() { selected_ = std::nullopt; }
        // First keyframe in track order within radius of point; clears the selection otherwise
        bool selectByPosition(const glm::dvec2& point, double radius);
        void selectNext();
        void selectPrev();

        [[nodiscard]] bool hasSelection() const { return selected_.has_value(); }
        [[nodiscard]] std::optional<KeyframeId> selectedId() const { return selected_; }
        [[nodiscard]] std::optional<size_t> selectedIndex() const;
        [[nodiscard]] const Keyframe* selected() const;

        // Edits of the selected keyframe; no-ops without a selection
        void moveSelected(double dx, double dy);
        void moveTimeSelected(int64_t dt);
        void setSelectedState(const CameraState& state);
        void deleteSelected();
        std::optional<KeyframeId> duplicateSelected(int64_t offset_ms);
        void cycleEase(int direction);
        void setSelectedEase(const EasingCurve& ease);
        // Mutable access to the selected keyframe's easing for parameter edits
        [[nodiscard]] EasingCurve* selectedEase();

        void regenerateSamples(size_t count = EXPORT_SAMPLE_COUNT);

    private:
        void sortKeyframes();
        [[nodiscard]] Keyframe* selectedMutable();

        std::vector<Keyframe> keyframes_;  // Always sorted by time
        std::optional<KeyframeId> selected_;
        KeyframeId next_id_ = INVALID_KEYFRAME_ID + 1;
    };

} // namespace adocam::sequencer
