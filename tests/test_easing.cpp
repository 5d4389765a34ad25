/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>
#include <cmath>
#include <set>

#include "sequencer/easing.hpp"
#include "sequencer/easing_curve.hpp"

using namespace adocam::sequencer;

namespace {

    constexpr double TOLERANCE = 1e-9;

} // namespace

TEST(EasingTest, EveryKindHitsZeroAndOne) {
    for (const EasingType type : allEasingTypes()) {
        EXPECT_NEAR(applyEasing(0.0, type), 0.0, TOLERANCE) << easingName(type);
        EXPECT_NEAR(applyEasing(1.0, type), 1.0, TOLERANCE) << easingName(type);
    }
}

TEST(EasingTest, EveryKindClampsOutOfRangeInput) {
    for (const EasingType type : allEasingTypes()) {
        EXPECT_NEAR(applyEasing(-0.5, type), 0.0, TOLERANCE) << easingName(type);
        EXPECT_NEAR(applyEasing(1.5, type), 1.0, TOLERANCE) << easingName(type);
    }
}

TEST(EasingTest, EveryNameRoundTrips) {
    for (const EasingType type : allEasingTypes()) {
        const auto parsed = easingFromName(easingName(type));
        ASSERT_TRUE(parsed.has_value()) << easingName(type);
        EXPECT_EQ(*parsed, type);
    }
}

TEST(EasingTest, EndpointsHoldWithCustomParams) {
    EXPECT_NEAR(applyEasing(1.0, EasingType::ELASTIC, ElasticParams{7, 0.5}), 1.0, TOLERANCE);
    EXPECT_NEAR(applyEasing(0.0, EasingType::ELASTIC, ElasticParams{7, 0.5}), 0.0, TOLERANCE);

    const BezierParams steep{{0.9, 0.0}, {0.1, 1.0}};
    EXPECT_NEAR(applyEasing(0.0, EasingType::BEZIER, steep), 0.0, TOLERANCE);
    EXPECT_NEAR(applyEasing(1.0, EasingType::BEZIER, steep), 1.0, TOLERANCE);

    EXPECT_NEAR(applyEasing(1.0, EasingType::EASE_IN_OUT_BACK, BackParams{3.0}), 1.0, TOLERANCE);
}

TEST(EasingTest, BounceInMirrorsBounceOut) {
    for (int i = 0; i <= 200; ++i) {
        const double t = i / 200.0;
        EXPECT_NEAR(easeInBounce(t), 1.0 - easeOutBounce(1.0 - t), TOLERANCE) << "t=" << t;
    }
}

TEST(EasingTest, PolynomialsMatchClosedForm) {
    EXPECT_NEAR(applyEasing(0.5, EasingType::EASE_IN_QUAD), 0.25, TOLERANCE);
    EXPECT_NEAR(applyEasing(0.5, EasingType::EASE_OUT_QUAD), 0.75, TOLERANCE);
    EXPECT_NEAR(applyEasing(0.5, EasingType::EASE_IN_CUBIC), 0.125, TOLERANCE);
    EXPECT_NEAR(applyEasing(0.5, EasingType::EASE_IN_OUT_QUINT), 0.5, TOLERANCE);
    EXPECT_NEAR(applyEasing(0.3, EasingType::LINEAR), 0.3, TOLERANCE);
}

TEST(EasingTest, BackOvershootsBelowZero) {
    EXPECT_LT(applyEasing(0.2, EasingType::EASE_IN_BACK), 0.0);
    EXPECT_GT(applyEasing(0.8, EasingType::EASE_OUT_BACK), 1.0);
}

TEST(EasingTest, LinearBezierIsIdentity) {
    const BezierParams straight{{0.25, 0.25}, {0.75, 0.75}};
    for (int i = 0; i <= 10; ++i) {
        const double t = i / 10.0;
        EXPECT_NEAR(cubicBezier(t, straight), t, 1e-6);
    }
}

TEST(EasingTest, MismatchedParamsFallBackToDefaults) {
    EXPECT_DOUBLE_EQ(applyEasing(0.4, EasingType::EASE_IN_BACK, BezierParams{}),
                     applyEasing(0.4, EasingType::EASE_IN_BACK, BackParams{}));
}

TEST(EasingTest, CycleVisitsEveryKindOnce) {
    const auto kinds = allEasingTypes();
    std::set<EasingType> seen;
    EasingType type = EasingType::LINEAR;
    for (size_t i = 0; i < kinds.size(); ++i) {
        seen.insert(type);
        type = cycleEasing(type, 1);
    }
    EXPECT_EQ(type, EasingType::LINEAR);
    EXPECT_EQ(seen.size(), kinds.size());

    EXPECT_EQ(cycleEasing(EasingType::LINEAR, -1), EasingType::BEZIER);
    EXPECT_EQ(cycleEasing(EasingType::BEZIER, 1), EasingType::LINEAR);
}

TEST(EasingTest, AliasesResolve) {
    EXPECT_EQ(easingFromName("InQuad"), EasingType::EASE_IN_QUAD);
    EXPECT_EQ(easingFromName("InOutBounce"), EasingType::EASE_IN_OUT_BOUNCE);
    EXPECT_EQ(easingFromName("OutElastic"), EasingType::ELASTIC);
    EXPECT_FALSE(easingFromName("Wobble").has_value());
    EXPECT_EQ(resolveEasing("Wobble"), EasingType::LINEAR);
}

TEST(EasingTest, ParameterizedKindsHaveParams) {
    for (const EasingType type : allEasingTypes()) {
        const bool has_params = !std::holds_alternative<std::monostate>(defaultParams(type));
        EXPECT_EQ(isParameterized(type), has_params) << easingName(type);
    }
    EXPECT_TRUE(isParameterized(EasingType::ELASTIC));
    EXPECT_TRUE(isParameterized(EasingType::BEZIER));
    EXPECT_TRUE(isParameterized(EasingType::EASE_OUT_BACK));
    EXPECT_TRUE(isParameterized(EasingType::EASE_IN_OUT_BOUNCE));
    EXPECT_FALSE(isParameterized(EasingType::LINEAR));
    EXPECT_FALSE(isParameterized(EasingType::EASE_IN_EXPO));
}

TEST(EasingTest, SampleCounts) {
    EXPECT_TRUE(sampleEasing(EasingType::LINEAR, {}, 0).empty());

    const auto single = sampleEasing(EasingType::EASE_IN_QUAD, {}, 1);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_NEAR(single[0], 1.0, TOLERANCE);

    const auto samples = sampleEasing(EasingType::LINEAR, {}, 5);
    ASSERT_EQ(samples.size(), 5u);
    for (size_t i = 0; i < samples.size(); ++i) {
        EXPECT_NEAR(samples[i], i / 4.0, TOLERANCE);
    }
}

TEST(EasingCurveTest, UnknownNameEvaluatesLinearAndKeepsName) {
    const auto curve = EasingCurve::fromName("Wobble");
    EXPECT_EQ(curve.type(), EasingType::LINEAR);
    EXPECT_TRUE(curve.isUnrecognized());
    EXPECT_EQ(curve.name(), "Wobble");
    EXPECT_NEAR(curve.evaluate(0.37), 0.37, TOLERANCE);
}

TEST(EasingCurveTest, SetTypeResetsParamsAndCache) {
    EasingCurve curve(EasingType::ELASTIC);
    ASSERT_TRUE(curve.setOscillations(8));
    curve.regenerateSamples(10);
    ASSERT_TRUE(curve.hasSamples());

    curve.setType(EasingType::BEZIER);
    EXPECT_FALSE(curve.hasSamples());
    ASSERT_NE(curve.bezier(), nullptr);
    EXPECT_EQ(*curve.bezier(), BezierParams{});
    EXPECT_EQ(curve.elastic(), nullptr);
}

TEST(EasingCurveTest, MutatorsRejectOtherKinds) {
    EasingCurve curve(EasingType::EASE_OUT_BOUNCE);
    EXPECT_FALSE(curve.setOscillations(3));
    EXPECT_FALSE(curve.setOvershoot(2.0));
    EXPECT_FALSE(curve.setParams(BackParams{2.0}));
    EXPECT_TRUE(curve.setBounceScale(6.0));
    EXPECT_DOUBLE_EQ(curve.bounce()->n1, 6.0);
}

TEST(EasingCurveTest, MutatorsInvalidateCache) {
    EasingCurve curve(EasingType::EASE_IN_BACK);
    curve.regenerateSamples(20);
    ASSERT_TRUE(curve.hasSamples());
    ASSERT_TRUE(curve.setOvershoot(2.5));
    EXPECT_FALSE(curve.hasSamples());
}

TEST(EasingCurveTest, ControlPointsAreClamped) {
    EasingCurve curve(EasingType::BEZIER);
    ASSERT_TRUE(curve.setControlPoints({-1.0, 0.5}, {2.0, 1.5}));
    EXPECT_EQ(curve.bezier()->p1, glm::dvec2(0.0, 0.5));
    EXPECT_EQ(curve.bezier()->p2, glm::dvec2(1.0, 1.0));
}

TEST(EasingCurveTest, CachedLookupUsesFloorIndex) {
    EasingCurve curve(EasingType::LINEAR);
    curve.setSamples({0.0, 0.25, 0.5, 0.75, 1.0});
    EXPECT_DOUBLE_EQ(curve.evaluateCached(0.0), 0.0);
    EXPECT_DOUBLE_EQ(curve.evaluateCached(0.3), 0.25);
    EXPECT_DOUBLE_EQ(curve.evaluateCached(0.99), 0.75);
    EXPECT_DOUBLE_EQ(curve.evaluateCached(1.0), 1.0);
}
