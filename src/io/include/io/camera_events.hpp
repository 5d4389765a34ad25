/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/level.hpp"
#include "sequencer/keyframe.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace adocam::io {

    // One MoveCamera action as stored in the level
    struct CameraEvent {
        size_t floor = 0;
        glm::dvec2 position{0.0};
        double zoom = sequencer::DEFAULT_ZOOM;
        double angle = 0.0;
        std::string ease = "Linear";
        std::optional<sequencer::ElasticParams> elastic;
        std::optional<sequencer::BackParams> back;
        std::optional<sequencer::BounceParams> bounce;
        std::optional<sequencer::BezierParams> bezier;
        std::vector<double> samples;
        // Keys this editor does not model (relativeTo, duration, eventTag, ...)
        Json passthrough = Json::object();
    };

    [[nodiscard]] std::expected<CameraEvent, std::string> parseCameraEvent(const Json& action);
    [[nodiscard]] Json toJson(const CameraEvent& event);

    // Time resolution from the floor is the caller's job
    [[nodiscard]] sequencer::Keyframe toKeyframe(const CameraEvent& event, int64_t time_ms);

    // Always regenerates the sample cache rather than trusting the keyframe's
    [[nodiscard]] CameraEvent fromKeyframe(const sequencer::Keyframe& keyframe,
                                           size_t floor,
                                           size_t sample_count,
                                           Json passthrough = Json::object());

} // namespace adocam::io
