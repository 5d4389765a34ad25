/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "io/level.hpp"
#include <glm/glm.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace adocam::io {

    // Tile centres in tile units; floor 0 sits at the origin and each
    // non-midspin angle advances one unit in its direction.
    [[nodiscard]] std::vector<glm::dvec2> tilePositions(std::span<const double> angles);

    struct SpeedChange {
        size_t floor = 0;
        bool multiplier = false;  // value multiplies the current BPM instead of replacing it
        double value = DEFAULT_BPM;
    };

    // Floor index <-> millisecond table. Floor 0 is at 0 ms and times never decrease.
    class TileTiming {
    public:
        TileTiming() = default;
        explicit TileTiming(std::vector<double> tile_times_ms);

        [[nodiscard]] static TileTiming fromAngles(std::span<const double> angles,
                                                   double bpm,
                                                   std::span<const SpeedChange> speed_changes = {},
                                                   std::span<const size_t> twirl_floors = {});
        [[nodiscard]] static std::expected<TileTiming, std::string> fromLevel(const Level& level);

        [[nodiscard]] size_t floorCount() const { return times_.size(); }
        [[nodiscard]] bool empty() const { return times_.empty(); }
        [[nodiscard]] std::span<const double> times() const { return times_; }

        // Floors past the end clamp to the last floor
        [[nodiscard]] double timeOf(size_t floor) const;
        // Smallest floor whose time is >= time_ms - 0.5, or the last floor if none is.
        // Inverts timeOf() rounded to the nearest millisecond.
        [[nodiscard]] size_t floorForTime(double time_ms) const;

        [[nodiscard]] double duration() const { return times_.empty() ? 0.0 : times_.back(); }

    private:
        std::vector<double> times_;
    };

} // namespace adocam::io
