/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "keyframe.hpp"
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace adocam::sequencer {

    // First adjacent pair (a, a + 1) in track order with a.time <= time <= b.time.
    // Empty when time lies outside the keyframe range or fewer than two keyframes exist.
    [[nodiscard]] std::optional<std::pair<size_t, size_t>> findBracket(
        std::span<const Keyframe> keyframes,
        double time);

    [[nodiscard]] CameraState blend(const Keyframe& a, const Keyframe& b, double eased);

    // Camera state at time; clamps outside the keyframe range
    [[nodiscard]] CameraState interpolate(
        std::span<const Keyframe> keyframes,
        double time);

    // States every step_ms from the first to the last keyframe, for preview
    [[nodiscard]] std::vector<CameraState> generatePath(
        std::span<const Keyframe> keyframes,
        int64_t step_ms);

} // namespace adocam::sequencer
