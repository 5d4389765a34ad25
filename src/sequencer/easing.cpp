/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "easing.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace adocam::sequencer {

    namespace {
        constexpr double PI = std::numbers::pi;
        constexpr int BEZIER_ITERATIONS = 5;

        struct EasingEntry {
            EasingType type;
            std::string_view name;
            std::string_view alias;
        };

        constexpr std::array<EasingEntry, EASING_TYPE_COUNT> EASINGS{{
            {EasingType::LINEAR, "Linear", ""},
            {EasingType::EASE_IN_QUAD, "EaseInQuad", "InQuad"},
            {EasingType::EASE_OUT_QUAD, "EaseOutQuad", "OutQuad"},
            {EasingType::EASE_IN_OUT_QUAD, "EaseInOutQuad", "InOutQuad"},
            {EasingType::EASE_IN_CUBIC, "EaseInCubic", "InCubic"},
            {EasingType::EASE_OUT_CUBIC, "EaseOutCubic", "OutCubic"},
            {EasingType::EASE_IN_OUT_CUBIC, "EaseInOutCubic", "InOutCubic"},
            {EasingType::EASE_IN_QUART, "EaseInQuart", "InQuart"},
            {EasingType::EASE_OUT_QUART, "EaseOutQuart", "OutQuart"},
            {EasingType::EASE_IN_OUT_QUART, "EaseInOutQuart", "InOutQuart"},
            {EasingType::EASE_IN_QUINT, "EaseInQuint", "InQuint"},
            {EasingType::EASE_OUT_QUINT, "EaseOutQuint", "OutQuint"},
            {EasingType::EASE_IN_OUT_QUINT, "EaseInOutQuint", "InOutQuint"},
            {EasingType::EASE_IN_SINE, "EaseInSine", "InSine"},
            {EasingType::EASE_OUT_SINE, "EaseOutSine", "OutSine"},
            {EasingType::EASE_IN_OUT_SINE, "EaseInOutSine", "InOutSine"},
            {EasingType::EASE_IN_EXPO, "EaseInExpo", "InExpo"},
            {EasingType::EASE_OUT_EXPO, "EaseOutExpo", "OutExpo"},
            {EasingType::EASE_IN_OUT_EXPO, "EaseInOutExpo", "InOutExpo"},
            {EasingType::EASE_IN_CIRC, "EaseInCirc", "InCirc"},
            {EasingType::EASE_OUT_CIRC, "EaseOutCirc", "OutCirc"},
            {EasingType::EASE_IN_OUT_CIRC, "EaseInOutCirc", "InOutCirc"},
            {EasingType::EASE_IN_BACK, "EaseInBack", "InBack"},
            {EasingType::EASE_OUT_BACK, "EaseOutBack", "OutBack"},
            {EasingType::EASE_IN_OUT_BACK, "EaseInOutBack", "InOutBack"},
            {EasingType::EASE_IN_BOUNCE, "EaseInBounce", "InBounce"},
            {EasingType::EASE_OUT_BOUNCE, "EaseOutBounce", "OutBounce"},
            {EasingType::EASE_IN_OUT_BOUNCE, "EaseInOutBounce", "InOutBounce"},
            {EasingType::ELASTIC, "Elastic", "OutElastic"},
            {EasingType::BEZIER, "Bezier", ""},
        }};

        constexpr std::array<EasingType, EASING_TYPE_COUNT> makeCycleOrder() {
            std::array<EasingType, EASING_TYPE_COUNT> order{};
            for (size_t i = 0; i < EASING_TYPE_COUNT; ++i) {
                order[i] = static_cast<EasingType>(i);
            }
            return order;
        }

        constexpr auto CYCLE_ORDER = makeCycleOrder();

        [[nodiscard]] double bezierComponent(const double u, const double c1, const double c2) {
            const double inv = 1.0 - u;
            return 3.0 * inv * inv * u * c1 + 3.0 * inv * u * u * c2 + u * u * u;
        }

        [[nodiscard]] double bezierSlope(const double u, const double c1, const double c2) {
            const double inv = 1.0 - u;
            return 3.0 * inv * inv * c1 + 6.0 * inv * u * (c2 - c1) + 3.0 * u * u * (1.0 - c2);
        }

        template <typename P>
        [[nodiscard]] P paramsOr(const EasingParams& params) {
            if (const auto* p = std::get_if<P>(&params)) {
                return *p;
            }
            return P{};
        }
    } // namespace

    double linear(const double t) {
        return t;
    }

    double easeInPoly(const double t, const int power) {
        return std::pow(t, power);
    }

    double easeOutPoly(const double t, const int power) {
        return 1.0 - std::pow(1.0 - t, power);
    }

    double easeInOutPoly(const double t, const int power) {
        if (t < 0.5) {
            return std::pow(2.0, power - 1) * std::pow(t, power);
        }
        return 1.0 - std::pow(-2.0 * t + 2.0, power) / 2.0;
    }

    double easeInSine(const double t) {
        return 1.0 - std::cos(t * PI / 2.0);
    }

    double easeOutSine(const double t) {
        return std::sin(t * PI / 2.0);
    }

    double easeInOutSine(const double t) {
        return -(std::cos(PI * t) - 1.0) / 2.0;
    }

    double easeInExpo(const double t) {
        return t == 0.0 ? 0.0 : std::pow(2.0, 10.0 * t - 10.0);
    }

    double easeOutExpo(const double t) {
        return t == 1.0 ? 1.0 : 1.0 - std::pow(2.0, -10.0 * t);
    }

    double easeInOutExpo(const double t) {
        if (t == 0.0 || t == 1.0) {
            return t;
        }
        if (t < 0.5) {
            return std::pow(2.0, 20.0 * t - 10.0) / 2.0;
        }
        return (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;
    }

    double easeInCirc(const double t) {
        return 1.0 - std::sqrt(1.0 - t * t);
    }

    double easeOutCirc(const double t) {
        return std::sqrt(1.0 - (t - 1.0) * (t - 1.0));
    }

    double easeInOutCirc(const double t) {
        if (t < 0.5) {
            return (1.0 - std::sqrt(1.0 - (2.0 * t) * (2.0 * t))) / 2.0;
        }
        const double u = -2.0 * t + 2.0;
        return (std::sqrt(1.0 - u * u) + 1.0) / 2.0;
    }

    double easeInBack(const double t, const BackParams& params) {
        const double c1 = params.overshoot;
        const double c3 = c1 + 1.0;
        return c3 * t * t * t - c1 * t * t;
    }

    double easeOutBack(const double t, const BackParams& params) {
        const double c1 = params.overshoot;
        const double c3 = c1 + 1.0;
        const double u = t - 1.0;
        return 1.0 + c3 * u * u * u + c1 * u * u;
    }

    double easeInOutBack(const double t, const BackParams& params) {
        const double c2 = params.overshoot * 1.525;
        if (t < 0.5) {
            const double u = 2.0 * t;
            return (u * u * ((c2 + 1.0) * u - c2)) / 2.0;
        }
        const double u = 2.0 * t - 2.0;
        return (u * u * ((c2 + 1.0) * u + c2) + 2.0) / 2.0;
    }

    double easeOutBounce(double t, const BounceParams& params) {
        const double n1 = params.n1;
        const double d1 = params.d1;

        if (t < 1.0 / d1) {
            return n1 * t * t;
        }
        if (t < 2.0 / d1) {
            t -= 1.5 / d1;
            return n1 * t * t + 0.75;
        }
        if (t < 2.5 / d1) {
            t -= 2.25 / d1;
            return n1 * t * t + 0.9375;
        }
        t -= 2.625 / d1;
        return n1 * t * t + 0.984375;
    }

    double easeInBounce(const double t, const BounceParams& params) {
        return 1.0 - easeOutBounce(1.0 - t, params);
    }

    double easeInOutBounce(const double t, const BounceParams& params) {
        if (t < 0.5) {
            return (1.0 - easeOutBounce(1.0 - 2.0 * t, params)) / 2.0;
        }
        return (1.0 + easeOutBounce(2.0 * t - 1.0, params)) / 2.0;
    }

    double elastic(const double t, const ElasticParams& params) {
        // The general formula evaluates to 1 at t == 0
        if (t == 0.0 || t == 1.0) {
            return t;
        }
        const double sin_term = std::sin(params.oscillations * 2.0 * PI * t);
        const double decay_term = std::exp(-params.decay * t);
        return 1.0 - sin_term * decay_term;
    }

    double cubicBezier(const double t, const BezierParams& params) {
        // Newton-Raphson for u with x(u) == t. The iteration count is fixed so
        // exported curves stay bit-identical.
        double u = t;
        for (int i = 0; i < BEZIER_ITERATIONS; ++i) {
            const double dx = bezierSlope(u, params.p1.x, params.p2.x);
            if (dx == 0.0) {
                continue;
            }
            const double x = bezierComponent(u, params.p1.x, params.p2.x);
            u = std::clamp(u - (x - t) / dx, 0.0, 1.0);
        }
        return bezierComponent(u, params.p1.y, params.p2.y);
    }

    double applyEasing(const double t, const EasingType type, const EasingParams& params) {
        const double clamped = std::clamp(t, 0.0, 1.0);
        if (clamped == 0.0 || clamped == 1.0) {
            return clamped;
        }
        switch (type) {
            case EasingType::LINEAR: return linear(clamped);
            case EasingType::EASE_IN_QUAD: return easeInPoly(clamped, 2);
            case EasingType::EASE_OUT_QUAD: return easeOutPoly(clamped, 2);
            case EasingType::EASE_IN_OUT_QUAD: return easeInOutPoly(clamped, 2);
            case EasingType::EASE_IN_CUBIC: return easeInPoly(clamped, 3);
            case EasingType::EASE_OUT_CUBIC: return easeOutPoly(clamped, 3);
            case EasingType::EASE_IN_OUT_CUBIC: return easeInOutPoly(clamped, 3);
            case EasingType::EASE_IN_QUART: return easeInPoly(clamped, 4);
            case EasingType::EASE_OUT_QUART: return easeOutPoly(clamped, 4);
            case EasingType::EASE_IN_OUT_QUART: return easeInOutPoly(clamped, 4);
            case EasingType::EASE_IN_QUINT: return easeInPoly(clamped, 5);
            case EasingType::EASE_OUT_QUINT: return easeOutPoly(clamped, 5);
            case EasingType::EASE_IN_OUT_QUINT: return easeInOutPoly(clamped, 5);
            case EasingType::EASE_IN_SINE: return easeInSine(clamped);
            case EasingType::EASE_OUT_SINE: return easeOutSine(clamped);
            case EasingType::EASE_IN_OUT_SINE: return easeInOutSine(clamped);
            case EasingType::EASE_IN_EXPO: return easeInExpo(clamped);
            case EasingType::EASE_OUT_EXPO: return easeOutExpo(clamped);
            case EasingType::EASE_IN_OUT_EXPO: return easeInOutExpo(clamped);
            case EasingType::EASE_IN_CIRC: return easeInCirc(clamped);
            case EasingType::EASE_OUT_CIRC: return easeOutCirc(clamped);
            case EasingType::EASE_IN_OUT_CIRC: return easeInOutCirc(clamped);
            case EasingType::EASE_IN_BACK: return easeInBack(clamped, paramsOr<BackParams>(params));
            case EasingType::EASE_OUT_BACK: return easeOutBack(clamped, paramsOr<BackParams>(params));
            case EasingType::EASE_IN_OUT_BACK: return easeInOutBack(clamped, paramsOr<BackParams>(params));
            case EasingType::EASE_IN_BOUNCE: return easeInBounce(clamped, paramsOr<BounceParams>(params));
            case EasingType::EASE_OUT_BOUNCE: return easeOutBounce(clamped, paramsOr<BounceParams>(params));
            case EasingType::EASE_IN_OUT_BOUNCE: return easeInOutBounce(clamped, paramsOr<BounceParams>(params));
            case EasingType::ELASTIC: return elastic(clamped, paramsOr<ElasticParams>(params));
            case EasingType::BEZIER: return cubicBezier(clamped, paramsOr<BezierParams>(params));
        }
        return clamped;
    }

    bool isParameterized(const EasingType type) {
        return !std::holds_alternative<std::monostate>(defaultParams(type));
    }

    EasingParams defaultParams(const EasingType type) {
        switch (type) {
            case EasingType::EASE_IN_BACK:
            case EasingType::EASE_OUT_BACK:
            case EasingType::EASE_IN_OUT_BACK:
                return BackParams{};
            case EasingType::EASE_IN_BOUNCE:
            case EasingType::EASE_OUT_BOUNCE:
            case EasingType::EASE_IN_OUT_BOUNCE:
                return BounceParams{};
            case EasingType::ELASTIC:
                return ElasticParams{};
            case EasingType::BEZIER:
                return BezierParams{};
            default:
                return std::monostate{};
        }
    }

    bool paramsMatch(const EasingType type, const EasingParams& params) {
        return defaultParams(type).index() == params.index();
    }

    std::string_view easingName(const EasingType type) {
        const auto idx = static_cast<size_t>(type);
        return idx < EASINGS.size() ? EASINGS[idx].name : EASINGS.front().name;
    }

    std::optional<EasingType> easingFromName(const std::string_view name) {
        for (const auto& entry : EASINGS) {
            if (entry.name == name || (!entry.alias.empty() && entry.alias == name)) {
                return entry.type;
            }
        }
        return std::nullopt;
    }

    EasingType resolveEasing(const std::string_view name) {
        return easingFromName(name).value_or(EasingType::LINEAR);
    }

    std::span<const EasingType> allEasingTypes() {
        return CYCLE_ORDER;
    }

    EasingType cycleEasing(const EasingType type, const int direction) {
        const auto count = static_cast<int>(EASING_TYPE_COUNT);
        const int next = ((static_cast<int>(type) + direction) % count + count) % count;
        return static_cast<EasingType>(next);
    }

    std::vector<double> sampleEasing(const EasingType type, const EasingParams& params, const size_t count) {
        if (count == 0) {
            return {};
        }
        if (count == 1) {
            return {applyEasing(1.0, type, params)};
        }

        std::vector<double> samples;
        samples.reserve(count);
        const auto last = static_cast<double>(count - 1);
        for (size_t i = 0; i < count; ++i) {
            samples.push_back(applyEasing(static_cast<double>(i) / last, type, params));
        }
        return samples;
    }

} // namespace adocam::sequencer
