/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "io/camera_events.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <array>
#include <format>

namespace adocam::io {

    using sequencer::BackParams;
    using sequencer::BezierParams;
    using sequencer::BounceParams;
    using sequencer::EasingCurve;
    using sequencer::ElasticParams;
    using sequencer::Keyframe;

    namespace {
        constexpr std::array<std::string_view, 11> MODELED_KEYS{
            "floor", "eventType", "position", "rotation", "zoom", "ease",
            "elastic", "back", "bounce", "bezier", "easeSamples"};

        [[nodiscard]] bool isModeled(const std::string& key) {
            for (const auto k : MODELED_KEYS) {
                if (k == key) return true;
            }
            return false;
        }

        [[nodiscard]] std::optional<double> numberAt(const Json& obj, const char* key) {
            const auto it = obj.find(key);
            if (it == obj.end() || !it->is_number()) return std::nullopt;
            return it->get<double>();
        }

        // A present-but-malformed record still yields defaults, as a missing one would
        [[nodiscard]] std::optional<ElasticParams> parseElastic(const Json& action, const size_t floor) {
            const auto it = action.find("elastic");
            if (it == action.end()) return std::nullopt;

            ElasticParams params;
            if (!it->is_object()) {
                LOG_WARN("Floor {}: elastic parameters are not an object, using defaults", floor);
                return params;
            }
            const auto osc = it->find("oscillations");
            if (osc != it->end() && osc->is_number_integer() && osc->get<int64_t>() > 0) {
                params.oscillations = static_cast<int>(osc->get<int64_t>());
            } else {
                LOG_WARN("Floor {}: invalid elastic oscillations, using {}", floor, params.oscillations);
            }
            if (const auto decay = numberAt(*it, "decay"); decay && *decay > 0.0) {
                params.decay = *decay;
            } else {
                LOG_WARN("Floor {}: invalid elastic decay, using {}", floor, params.decay);
            }
            return params;
        }

        [[nodiscard]] std::optional<BackParams> parseBack(const Json& action, const size_t floor) {
            const auto it = action.find("back");
            if (it == action.end()) return std::nullopt;

            BackParams params;
            if (const auto overshoot = it->is_object() ? numberAt(*it, "overshoot") : std::nullopt) {
                params.overshoot = *overshoot;
            } else {
                LOG_WARN("Floor {}: invalid back parameters, using overshoot {}", floor, params.overshoot);
            }
            return params;
        }

        [[nodiscard]] std::optional<BounceParams> parseBounce(const Json& action, const size_t floor) {
            const auto it = action.find("bounce");
            if (it == action.end()) return std::nullopt;

            BounceParams params;
            const auto n1 = it->is_object() ? numberAt(*it, "n1") : std::nullopt;
            const auto d1 = it->is_object() ? numberAt(*it, "d1") : std::nullopt;
            if (n1 && d1 && *d1 > 0.0) {
                params.n1 = *n1;
                params.d1 = *d1;
            } else {
                LOG_WARN("Floor {}: invalid bounce parameters, using n1={} d1={}", floor, params.n1, params.d1);
            }
            return params;
        }

        [[nodiscard]] std::optional<BezierParams> parseBezier(const Json& action, const size_t floor) {
            const auto it = action.find("bezier");
            if (it == action.end()) return std::nullopt;

            BezierParams params;
            const bool valid = it->is_array() && it->size() == 4 &&
                               std::all_of(it->begin(), it->end(), [](const Json& v) { return v.is_number(); });
            if (!valid) {
                LOG_WARN("Floor {}: bezier control points must be [p1x, p1y, p2x, p2y], using defaults", floor);
                return params;
            }
            params.p1 = glm::clamp(glm::dvec2{(*it)[0].get<double>(), (*it)[1].get<double>()}, 0.0, 1.0);
            params.p2 = glm::clamp(glm::dvec2{(*it)[2].get<double>(), (*it)[3].get<double>()}, 0.0, 1.0);
            return params;
        }

        [[nodiscard]] std::vector<double> parseSamples(const Json& action, const size_t floor) {
            const auto it = action.find("easeSamples");
            if (it == action.end()) return {};

            if (!it->is_array()) {
                LOG_WARN("Floor {}: easeSamples is not an array, ignoring", floor);
                return {};
            }
            std::vector<double> samples;
            samples.reserve(it->size());
            for (const auto& v : *it) {
                if (!v.is_number()) {
                    LOG_WARN("Floor {}: easeSamples contains a non-number, ignoring cache", floor);
                    return {};
                }
                samples.push_back(v.get<double>());
            }
            return samples;
        }
    } // namespace

    std::expected<CameraEvent, std::string> parseCameraEvent(const Json& action) {
        if (!action.is_object()) {
            return std::unexpected("Camera action is not an object");
        }
        const auto type = action.find("eventType");
        if (type == action.end() || !type->is_string() || type->get<std::string>() != MOVE_CAMERA_EVENT) {
            return std::unexpected("Action is not a MoveCamera event");
        }
        const auto floor_it = action.find("floor");
        if (floor_it == action.end() || !floor_it->is_number_integer() || floor_it->get<int64_t>() < 0) {
            return std::unexpected("MoveCamera event has no valid floor");
        }

        CameraEvent event;
        event.floor = static_cast<size_t>(floor_it->get<int64_t>());

        // Null components mean "unchanged" to the game; the editor treats them as 0
        if (const auto pos = action.find("position"); pos != action.end()) {
            if (pos->is_array() && pos->size() == 2) {
                event.position = {
                    (*pos)[0].is_number() ? (*pos)[0].get<double>() : 0.0,
                    (*pos)[1].is_number() ? (*pos)[1].get<double>() : 0.0};
            } else {
                LOG_WARN("Floor {}: malformed position, using (0, 0)", event.floor);
            }
        }

        event.zoom = numberAt(action, "zoom").value_or(sequencer::DEFAULT_ZOOM);
        event.angle = numberAt(action, "rotation").value_or(0.0);

        if (const auto ease = action.find("ease"); ease != action.end() && ease->is_string()) {
            event.ease = ease->get<std::string>();
        }

        event.elastic = parseElastic(action, event.floor);
        event.back = parseBack(action, event.floor);
        event.bounce = parseBounce(action, event.floor);
        event.bezier = parseBezier(action, event.floor);
        event.samples = parseSamples(action, event.floor);

        for (const auto& [key, value] : action.items()) {
            if (!isModeled(key)) {
                event.passthrough[key] = value;
            }
        }
        return event;
    }

    Json toJson(const CameraEvent& event) {
        Json action = Json::object();
        action["floor"] = event.floor;
        action["eventType"] = MOVE_CAMERA_EVENT;
        for (const auto& [key, value] : event.passthrough.items()) {
            if (!isModeled(key)) {
                action[key] = value;
            }
        }
        action["position"] = {event.position.x, event.position.y};
        action["rotation"] = event.angle;
        action["zoom"] = event.zoom;
        action["ease"] = event.ease;

        if (event.elastic) {
            action["elastic"] = {{"oscillations", event.elastic->oscillations},
                                 {"decay", event.elastic->decay}};
        }
        if (event.back) {
            action["back"] = {{"overshoot", event.back->overshoot}};
        }
        if (event.bounce) {
            action["bounce"] = {{"n1", event.bounce->n1}, {"d1", event.bounce->d1}};
        }
        if (event.bezier) {
            action["bezier"] = {event.bezier->p1.x, event.bezier->p1.y,
                                event.bezier->p2.x, event.bezier->p2.y};
        }
        if (!event.samples.empty()) {
            action["easeSamples"] = event.samples;
        }
        return action;
    }

    Keyframe toKeyframe(const CameraEvent& event, const int64_t time_ms) {
        Keyframe kf;
        kf.time = time_ms;
        kf.position = event.position;
        kf.zoom = event.zoom;
        kf.angle = event.angle;
        kf.ease = EasingCurve::fromName(event.ease);

        const auto params = sequencer::defaultParams(kf.ease.type());
        if (std::holds_alternative<ElasticParams>(params) && event.elastic) {
            kf.ease.setParams(*event.elastic);
        } else if (std::holds_alternative<BackParams>(params) && event.back) {
            kf.ease.setParams(*event.back);
        } else if (std::holds_alternative<BounceParams>(params) && event.bounce) {
            kf.ease.setParams(*event.bounce);
        } else if (std::holds_alternative<BezierParams>(params) && event.bezier) {
            kf.ease.setParams(*event.bezier);
        }

        if (event.samples.size() >= 2) {
            kf.ease.setSamples(event.samples);
        } else if (!event.samples.empty()) {
            LOG_WARN("Floor {}: sample cache of length {} ignored", event.floor, event.samples.size());
        }
        return kf;
    }

    CameraEvent fromKeyframe(const Keyframe& keyframe, const size_t floor,
                             const size_t sample_count, Json passthrough) {
        EasingCurve curve = keyframe.ease;
        curve.regenerateSamples(sample_count);

        CameraEvent event;
        event.floor = floor;
        event.position = keyframe.position;
        event.zoom = keyframe.zoom;
        event.angle = keyframe.angle;
        event.ease = std::string(curve.name());
        if (const auto* p = curve.elastic()) event.elastic = *p;
        if (const auto* p = curve.back()) event.back = *p;
        if (const auto* p = curve.bounce()) event.bounce = *p;
        if (const auto* p = curve.bezier()) event.bezier = *p;
        event.samples = curve.samples();
        event.passthrough = std::move(passthrough);
        return event;
    }

} // namespace adocam::io
