/* SPDX-FileCopyrightText: 2025 adocam Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "easing.hpp"
#include <string>
#include <vector>

namespace adocam::sequencer {

    inline constexpr size_t EXPORT_SAMPLE_COUNT = 60;
    inline constexpr size_t PREVIEW_SAMPLE_COUNT = 100;

    // Easing of one keyframe's incoming segment: the curve kind, its parameters
    // and an optional pre-rendered sample cache. Every mutator that changes the
    // shape of the curve drops the cache.
    class EasingCurve {
    public:
        EasingCurve() = default;
        explicit EasingCurve(EasingType type);
        EasingCurve(EasingType type, EasingParams params);

        // Unknown names evaluate as LINEAR but keep the literal name for write-back
        [[nodiscard]] static EasingCurve fromName(std::string_view name);

        [[nodiscard]] EasingType type() const { return type_; }
        [[nodiscard]] const EasingParams& params() const { return params_; }

        // Name to persist: the preserved source name if the kind was not recognized
        [[nodiscard]] std::string_view name() const;
        [[nodiscard]] const std::string& sourceName() const { return source_name_; }
        [[nodiscard]] bool isUnrecognized() const { return !source_name_.empty(); }

        // Resets params to the new type's defaults
        void setType(EasingType type);
        void cycle(int direction);

        // Ignored unless params hold the alternative the current type expects
        bool setParams(const EasingParams& params);

        [[nodiscard]] const ElasticParams* elastic() const { return std::get_if<ElasticParams>(&params_); }
        [[nodiscard]] const BackParams* back() const { return std::get_if<BackParams>(&params_); }
        [[nodiscard]] const BounceParams* bounce() const { return std::get_if<BounceParams>(&params_); }
        [[nodiscard]] const BezierParams* bezier() const { return std::get_if<BezierParams>(&params_); }

        // Typed mutators; each returns false when the current type has no such parameter
        bool setOscillations(int oscillations);
        bool setDecay(double decay);
        bool setOvershoot(double overshoot);
        bool setBounceScale(double n1);
        bool setBounceDivisor(double d1);
        bool setControlPoints(const glm::dvec2& p1, const glm::dvec2& p2);

        // Live evaluation, ignoring the cache
        [[nodiscard]] double evaluate(double t) const;
        // Cache lookup at floor(alpha * (len - 1)) when present, live evaluation otherwise
        [[nodiscard]] double evaluateCached(double alpha) const;

        [[nodiscard]] bool hasSamples() const { return !samples_.empty(); }
        [[nodiscard]] const std::vector<double>& samples() const { return samples_; }
        void setSamples(std::vector<double> samples);
        void regenerateSamples(size_t count);
        void clearSamples() { samples_.clear(); }

        [[nodiscard]] bool operator==(const EasingCurve&) const = default;

    private:
        void invalidate();

        EasingType type_ = EasingType::LINEAR;
        EasingParams params_;
        std::vector<double> samples_;
        std::string source_name_;
    };

} // namespace adocam::sequencer
