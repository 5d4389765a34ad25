/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace adocam::sequencer {

    // Declaration order is the order cycleEase() walks through.
    enum class EasingType : uint8_t {
        LINEAR,
        EASE_IN_QUAD,
        EASE_OUT_QUAD,
        EASE_IN_OUT_QUAD,
        EASE_IN_CUBIC,
        EASE_OUT_CUBIC,
        EASE_IN_OUT_CUBIC,
        EASE_IN_QUART,
        EASE_OUT_QUART,
        EASE_IN_OUT_QUART,
        EASE_IN_QUINT,
        EASE_OUT_QUINT,
        EASE_IN_OUT_QUINT,
        EASE_IN_SINE,
        EASE_OUT_SINE,
        EASE_IN_OUT_SINE,
        EASE_IN_EXPO,
        EASE_OUT_EXPO,
        EASE_IN_OUT_EXPO,
        EASE_IN_CIRC,
        EASE_OUT_CIRC,
        EASE_IN_OUT_CIRC,
        EASE_IN_BACK,
        EASE_OUT_BACK,
        EASE_IN_OUT_BACK,
        EASE_IN_BOUNCE,
        EASE_OUT_BOUNCE,
        EASE_IN_OUT_BOUNCE,
        ELASTIC,
        BEZIER
    };

    inline constexpr size_t EASING_TYPE_COUNT = static_cast<size_t>(EasingType::BEZIER) + 1;

    struct ElasticParams {
        int oscillations = 3;
        double decay = 3.0;

        [[nodiscard]] bool operator==(const ElasticParams&) const = default;
    };

    struct BackParams {
        double overshoot = 1.70158;

        [[nodiscard]] bool operator==(const BackParams&) const = default;
    };

    struct BounceParams {
        double n1 = 7.5625;
        double d1 = 2.75;

        [[nodiscard]] bool operator==(const BounceParams&) const = default;
    };

    // Endpoints are fixed at (0,0) and (1,1)
    struct BezierParams {
        glm::dvec2 p1{0.25, 0.1};
        glm::dvec2 p2{0.25, 1.0};

        [[nodiscard]] bool operator==(const BezierParams&) const = default;
    };

    using EasingParams = std::variant<std::monostate, ElasticParams, BackParams, BounceParams, BezierParams>;

    // Individual curves. Inputs are expected in [0,1].
    [[nodiscard]] double linear(double t);
    [[nodiscard]] double easeInPoly(double t, int power);
    [[nodiscard]] double easeOutPoly(double t, int power);
    [[nodiscard]] double easeInOutPoly(double t, int power);
    [[nodiscard]] double easeInSine(double t);
    [[nodiscard]] double easeOutSine(double t);
    [[nodiscard]] double easeInOutSine(double t);
    [[nodiscard]] double easeInExpo(double t);
    [[nodiscard]] double easeOutExpo(double t);
    [[nodiscard]] double easeInOutExpo(double t);
    [[nodiscard]] double easeInCirc(double t);
    [[nodiscard]] double easeOutCirc(double t);
    [[nodiscard]] double easeInOutCirc(double t);
    [[nodiscard]] double easeInBack(double t, const BackParams& params = {});
    [[nodiscard]] double easeOutBack(double t, const BackParams& params = {});
    [[nodiscard]] double easeInOutBack(double t, const BackParams& params = {});
    [[nodiscard]] double easeInBounce(double t, const BounceParams& params = {});
    [[nodiscard]] double easeOutBounce(double t, const BounceParams& params = {});
    [[nodiscard]] double easeInOutBounce(double t, const BounceParams& params = {});
    [[nodiscard]] double elastic(double t, const ElasticParams& params = {});
    [[nodiscard]] double cubicBezier(double t, const BezierParams& params = {});

    // Map t in [0,1] to eased t. t is clamped, and 0 and 1 map to exactly 0 and 1.
    // Params that do not match the type are ignored in favour of the type's defaults.
    [[nodiscard]] double applyEasing(double t, EasingType type, const EasingParams& params = {});

    [[nodiscard]] bool isParameterized(EasingType type);
    [[nodiscard]] EasingParams defaultParams(EasingType type);
    [[nodiscard]] bool paramsMatch(EasingType type, const EasingParams& params);

    [[nodiscard]] std::string_view easingName(EasingType type);
    // Canonical names ("EaseInQuad") and the game's short names ("InQuad")
    [[nodiscard]] std::optional<EasingType> easingFromName(std::string_view name);
    // Unknown names resolve to LINEAR
    [[nodiscard]] EasingType resolveEasing(std::string_view name);

    [[nodiscard]] std::span<const EasingType> allEasingTypes();
    [[nodiscard]] EasingType cycleEasing(EasingType type, int direction);

    // count values of the curve at i / (count - 1)
    [[nodiscard]] std::vector<double> sampleEasing(EasingType type, const EasingParams& params, size_t count);

} // namespace adocam::sequencer
