/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "easing_curve.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace adocam::sequencer {

    namespace {
        constexpr int MIN_OSCILLATIONS = 1;
        constexpr double MIN_DECAY = 1e-6;
        constexpr double MIN_BOUNCE_DIVISOR = 1e-6;
    } // namespace

    EasingCurve::EasingCurve(const EasingType type)
        : type_(type),
          params_(defaultParams(type)) {}

    EasingCurve::EasingCurve(const EasingType type, EasingParams params)
        : type_(type),
          params_(defaultParams(type)) {
        setParams(params);
    }

    EasingCurve EasingCurve::fromName(const std::string_view name) {
        if (const auto type = easingFromName(name)) {
            return EasingCurve(*type);
        }
        LOG_WARN("Unrecognized easing '{}', evaluating as Linear", name);
        EasingCurve curve;
        curve.source_name_ = std::string(name);
        return curve;
    }

    std::string_view EasingCurve::name() const {
        return source_name_.empty() ? easingName(type_) : std::string_view(source_name_);
    }

    void EasingCurve::setType(const EasingType type) {
        type_ = type;
        params_ = defaultParams(type);
        invalidate();
    }

    void EasingCurve::cycle(const int direction) {
        setType(cycleEasing(type_, direction));
    }

    bool EasingCurve::setParams(const EasingParams& params) {
        if (!paramsMatch(type_, params)) {
            return false;
        }
        params_ = params;
        invalidate();
        return true;
    }

    bool EasingCurve::setOscillations(const int oscillations) {
        auto* p = std::get_if<ElasticParams>(&params_);
        if (!p) return false;
        p->oscillations = std::max(oscillations, MIN_OSCILLATIONS);
        invalidate();
        return true;
    }

    bool EasingCurve::setDecay(const double decay) {
        auto* p = std::get_if<ElasticParams>(&params_);
        if (!p) return false;
        p->decay = std::max(decay, MIN_DECAY);
        invalidate();
        return true;
    }

    bool EasingCurve::setOvershoot(const double overshoot) {
        auto* p = std::get_if<BackParams>(&params_);
        if (!p) return false;
        p->overshoot = overshoot;
        invalidate();
        return true;
    }

    bool EasingCurve::setBounceScale(const double n1) {
        auto* p = std::get_if<BounceParams>(&params_);
        if (!p) return false;
        p->n1 = n1;
        invalidate();
        return true;
    }

    bool EasingCurve::setBounceDivisor(const double d1) {
        auto* p = std::get_if<BounceParams>(&params_);
        if (!p) return false;
        p->d1 = std::max(d1, MIN_BOUNCE_DIVISOR);
        invalidate();
        return true;
    }

    bool EasingCurve::setControlPoints(const glm::dvec2& p1, const glm::dvec2& p2) {
        auto* p = std::get_if<BezierParams>(&params_);
        if (!p) return false;
        p->p1 = glm::clamp(p1, 0.0, 1.0);
        p->p2 = glm::clamp(p2, 0.0, 1.0);
        invalidate();
        return true;
    }

    double EasingCurve::evaluate(const double t) const {
        return applyEasing(t, type_, params_);
    }

    double EasingCurve::evaluateCached(const double alpha) const {
        if (samples_.empty()) {
            return evaluate(alpha);
        }
        const size_t last = samples_.size() - 1;
        const double clamped = std::clamp(alpha, 0.0, 1.0);
        const auto idx = std::min(static_cast<size_t>(std::floor(clamped * static_cast<double>(last))), last);
        return samples_[idx];
    }

    void EasingCurve::setSamples(std::vector<double> samples) {
        samples_ = std::move(samples);
    }

    void EasingCurve::regenerateSamples(const size_t count) {
        samples_ = sampleEasing(type_, params_, count);
    }

    void EasingCurve::invalidate() {
        samples_.clear();
        source_name_.clear();
    }

} // namespace adocam::sequencer
