/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"
#include <algorithm>

namespace adocam::sequencer {

    std::optional<std::pair<size_t, size_t>> findBracket(
        std::span<const Keyframe> keyframes, const double time) {
        if (keyframes.size() < 2) {
            return std::nullopt;
        }
        for (size_t i = 0; i + 1 < keyframes.size(); ++i) {
            const auto a_time = static_cast<double>(keyframes[i].time);
            const auto b_time = static_cast<double>(keyframes[i + 1].time);
            if (a_time <= time && time <= b_time) {
                return std::pair{i, i + 1};
            }
        }
        return std::nullopt;
    }

    CameraState blend(const Keyframe& a, const Keyframe& b, const double eased) {
        const double inv = 1.0 - eased;
        return {
            a.position * inv + b.position * eased,
            a.zoom * inv + b.zoom * eased,
            a.angle * inv + b.angle * eased
        };
    }

    CameraState interpolate(std::span<const Keyframe> keyframes, const double time) {
        if (keyframes.empty()) {
            return {};
        }
        if (time <= static_cast<double>(keyframes.front().time)) {
            return stateOf(keyframes.front());
        }
        if (time >= static_cast<double>(keyframes.back().time)) {
            // Earliest-inserted of the keyframes sharing the last time
            const auto last = std::lower_bound(
                keyframes.begin(), keyframes.end(), keyframes.back().time,
                [](const Keyframe& kf, const int64_t t) { return kf.time < t; });
            return stateOf(*last);
        }

        const auto bracket = findBracket(keyframes, time);
        if (!bracket) {
            return stateOf(keyframes.back());
        }

        const Keyframe& a = keyframes[bracket->first];
        const Keyframe& b = keyframes[bracket->second];

        // Zero-length segment between keyframes sharing a time
        if (a.time == b.time) {
            return stateOf(b);
        }

        const double alpha = (time - static_cast<double>(a.time)) /
                             static_cast<double>(b.time - a.time);
        return blend(a, b, b.ease.evaluateCached(alpha));
    }

    std::vector<CameraState> generatePath(std::span<const Keyframe> keyframes, const int64_t step_ms) {
        if (keyframes.size() < 2 || step_ms <= 0) {
            return keyframes.empty() ? std::vector<CameraState>{} : std::vector<CameraState>{stateOf(keyframes.front())};
        }

        const int64_t start = keyframes.front().time;
        const int64_t end = keyframes.back().time;

        std::vector<CameraState> points;
        points.reserve(static_cast<size_t>((end - start) / step_ms) + 2);
        for (int64_t t = start; t < end; t += step_ms) {
            points.push_back(interpolate(keyframes, static_cast<double>(t)));
        }
        points.push_back(stateOf(keyframes.back()));
        return points;
    }

} // namespace adocam::sequencer
