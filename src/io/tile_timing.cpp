/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/tile_timing.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <optional>

namespace adocam::io {

    namespace {
        constexpr double MS_PER_MINUTE = 60000.0;
        constexpr double HALF_TURN = 180.0;
        constexpr double FULL_TURN = 360.0;
        constexpr double ANGLE_EPSILON = 1e-9;
        // Keyframes store floor times rounded to whole milliseconds
        constexpr double FLOOR_TIME_TOLERANCE_MS = 0.5;

        [[nodiscard]] bool isMidspin(const double angle) {
            return std::abs(angle - MIDSPIN_ANGLE) < ANGLE_EPSILON;
        }

        // Clockwise travel around the pivot from the incoming side to the outgoing angle, in (0, 360]
        [[nodiscard]] double travelAngle(const double incoming, const double outgoing, const bool twirled) {
            double rel = std::fmod(HALF_TURN + incoming - outgoing, FULL_TURN);
            if (rel < 0.0) rel += FULL_TURN;
            if (twirled) rel = FULL_TURN - rel;
            if (rel < ANGLE_EPSILON || rel > FULL_TURN - ANGLE_EPSILON) rel = FULL_TURN;
            return rel;
        }

        [[nodiscard]] std::optional<size_t> floorOf(const Json& action) {
            const auto it = action.find("floor");
            if (it == action.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
                return std::nullopt;
            }
            return static_cast<size_t>(it->get<int64_t>());
        }
    } // namespace

    std::vector<glm::dvec2> tilePositions(std::span<const double> angles) {
        std::vector<glm::dvec2> positions;
        positions.reserve(angles.size() + 1);

        glm::dvec2 current{0.0};
        positions.push_back(current);
        for (const double angle : angles) {
            if (!isMidspin(angle)) {
                const double rad = glm::radians(angle);
                current += glm::dvec2{std::cos(rad), std::sin(rad)};
            }
            positions.push_back(current);
        }
        return positions;
    }

    TileTiming::TileTiming(std::vector<double> tile_times_ms)
        : times_(std::move(tile_times_ms)) {}

    TileTiming TileTiming::fromAngles(std::span<const double> angles,
                                      const double bpm,
                                      std::span<const SpeedChange> speed_changes,
                                      std::span<const size_t> twirl_floors) {
        std::vector<double> times;
        times.reserve(angles.size() + 1);
        times.push_back(0.0);

        double current_bpm = bpm > 0.0 ? bpm : DEFAULT_BPM;
        double incoming = 0.0;
        bool twirled = false;

        for (size_t floor = 0; floor < angles.size(); ++floor) {
            for (const auto& change : speed_changes) {
                if (change.floor != floor) continue;
                const double next = change.multiplier ? current_bpm * change.value : change.value;
                if (next > 0.0) {
                    current_bpm = next;
                } else {
                    LOG_WARN("Ignoring non-positive BPM {} on floor {}", next, floor);
                }
            }
            twirled ^= (std::count(twirl_floors.begin(), twirl_floors.end(), floor) % 2) == 1;

            const double angle = angles[floor];
            if (isMidspin(angle)) {
                times.push_back(times.back());
                incoming += HALF_TURN;
                continue;
            }

            const double beats = travelAngle(incoming, angle, twirled) / HALF_TURN;
            times.push_back(times.back() + beats * MS_PER_MINUTE / current_bpm);
            incoming = angle;
        }
        return TileTiming(std::move(times));
    }

    std::expected<TileTiming, std::string> TileTiming::fromLevel(const Level& level) {
        auto angles = level.angles();
        if (!angles) {
            return std::unexpected(angles.error());
        }

        std::vector<SpeedChange> speed_changes;
        std::vector<size_t> twirls;
        try {
            for (const auto& action : level.actions()) {
                if (!action.is_object()) continue;
                const auto floor = floorOf(action);
                if (!floor) continue;

                const std::string event = action.value("eventType", "");
                if (event == "SetSpeed") {
                    SpeedChange change{.floor = *floor};
                    change.multiplier = action.value("speedType", "Bpm") == "Multiplier";
                    change.value = change.multiplier ? action.value("bpmMultiplier", 1.0)
                                                     : action.value("beatsPerMinute", DEFAULT_BPM);
                    speed_changes.push_back(change);
                } else if (event == "Twirl") {
                    twirls.push_back(*floor);
                }
            }
        } catch (const Json::exception& e) {
            return std::unexpected(std::format("Malformed timing event: {}", e.what()));
        }

        auto timing = fromAngles(*angles, level.bpm(), speed_changes, twirls);
        LOG_DEBUG("Tile timing: {} floors over {:.1f}ms at {} BPM",
                  timing.floorCount(), timing.duration(), level.bpm());
        return timing;
    }

    double TileTiming::timeOf(const size_t floor) const {
        if (times_.empty()) return 0.0;
        return times_[std::min(floor, times_.size() - 1)];
    }

    size_t TileTiming::floorForTime(const double time_ms) const {
        if (times_.empty()) return 0;
        const auto it = std::lower_bound(times_.begin(), times_.end(), time_ms - FLOOR_TIME_TOLERANCE_MS);
        if (it == times_.end()) {
            return times_.size() - 1;
        }
        return static_cast<size_t>(it - times_.begin());
    }

} // namespace adocam::io
