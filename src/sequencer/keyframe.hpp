/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "easing_curve.hpp"
#include <glm/glm.hpp>
#include <cstdint>

namespace adocam::sequencer {

    inline constexpr double DEFAULT_ZOOM = 100.0;

    using KeyframeId = uint64_t;
    inline constexpr KeyframeId INVALID_KEYFRAME_ID = 0;

    struct Keyframe {
        KeyframeId id = INVALID_KEYFRAME_ID;  // Assigned by the owning track
        int64_t time = 0;                     // Milliseconds
        glm::dvec2 position{0.0};
        double zoom = DEFAULT_ZOOM;
        double angle = 0.0;                   // Degrees
        EasingCurve ease;                     // Incoming segment, from the previous keyframe

        [[nodiscard]] bool operator<(const Keyframe& other) const { return time < other.time; }
    };

    struct CameraState {
        glm::dvec2 position{0.0};
        double zoom = DEFAULT_ZOOM;
        double angle = 0.0;

        [[nodiscard]] bool operator==(const CameraState&) const = default;
    };

    [[nodiscard]] inline CameraState stateOf(const Keyframe& keyframe) {
        return {keyframe.position, keyframe.zoom, keyframe.angle};
    }

} // namespace adocam::sequencer
