/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "io/camera_events.hpp"
#include "io/level.hpp"

using namespace adocam::io;
using namespace adocam::sequencer;

namespace {

    constexpr double TOLERANCE = 1e-9;

    std::filesystem::path tempFile(const std::string& name) {
        return std::filesystem::temp_directory_path() / ("adocam_test_" + name);
    }

} // namespace

TEST(LevelTextTest, StripsBomAndTrailingCommas) {
    const std::string text = "\xEF\xBB\xBF{\"a\": [1, 2, ], \"b\": {\"c\": \"x, ]\", }, }";
    EXPECT_EQ(sanitizeLevelText(text), "{\"a\": [1, 2 ], \"b\": {\"c\": \"x, ]\" } }");
}

TEST(LevelTextTest, KeepsEscapedQuotesInStrings) {
    const std::string text = R"({"s": "say \"hi\", ]", })";
    EXPECT_EQ(sanitizeLevelText(text), R"({"s": "say \"hi\", ]" })");
}

TEST(LevelTest, ParseRejectsNonObjects) {
    EXPECT_FALSE(Level::parse("[1, 2]").has_value());
    EXPECT_FALSE(Level::parse("{ not json").has_value());
}

TEST(LevelTest, AccessorsFallBackWhenMissing) {
    const auto level = Level::parse("{}");
    ASSERT_TRUE(level.has_value());
    EXPECT_TRUE(level->actions().empty());
    EXPECT_DOUBLE_EQ(level->bpm(), DEFAULT_BPM);
    EXPECT_FALSE(level->angles().has_value());
}

TEST(LevelTest, AngleDataWinsOverPathData) {
    const auto level = Level::parse(R"({"angleData": [0, 45, 999], "pathData": "RRRR"})");
    ASSERT_TRUE(level.has_value());
    const auto angles = level->angles();
    ASSERT_TRUE(angles.has_value());
    EXPECT_EQ(*angles, (std::vector<double>{0.0, 45.0, MIDSPIN_ANGLE}));
}

TEST(LevelTest, RemoveAndAddActions) {
    auto level = Level::parse(R"({"actions": [
        {"floor": 1, "eventType": "MoveCamera"},
        {"floor": 2, "eventType": "Twirl"},
        {"floor": 3, "eventType": "MoveCamera"}
    ]})");
    ASSERT_TRUE(level.has_value());
    EXPECT_EQ(level->actionsOfType(MOVE_CAMERA_EVENT).size(), 2u);
    EXPECT_EQ(level->removeActions(MOVE_CAMERA_EVENT), 2u);
    EXPECT_EQ(level->actions().size(), 1u);

    level->addAction({{"floor", 4}, {"eventType", "MoveCamera"}});
    EXPECT_EQ(level->actionsOfType(MOVE_CAMERA_EVENT).size(), 1u);
}

TEST(LevelTest, WriteAndReload) {
    const auto path = tempFile("write_reload.adofai");
    auto level = Level::parse(R"({"pathData": "RRU", "settings": {"bpm": 150, "song": "x"}, "actions": []})");
    ASSERT_TRUE(level.has_value());
    level->addAction({{"floor", 1}, {"eventType", "Twirl"}});

    ASSERT_TRUE(level->write(path).has_value());
    const auto reloaded = Level::load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(reloaded.has_value()) << reloaded.error();
    EXPECT_EQ(reloaded->data(), level->data());
    EXPECT_EQ(reloaded->path().string(), path.string());
}

TEST(LevelTest, LoadMissingFileFails) {
    EXPECT_FALSE(Level::load(tempFile("does_not_exist.adofai")).has_value());
}

TEST(LevelTest, WriteWithoutPathFails) {
    const Level level;
    EXPECT_FALSE(level.write().has_value());
}

TEST(CameraEventTest, ParsesModeledFieldsAndPassthrough) {
    const Json action = Json::parse(R"({
        "floor": 7, "eventType": "MoveCamera", "duration": 2, "relativeTo": "Player",
        "position": [3.5, null], "rotation": 45, "zoom": 80, "ease": "InOutQuad",
        "eventTag": "intro"
    })");
    const auto event = parseCameraEvent(action);
    ASSERT_TRUE(event.has_value()) << event.error();

    EXPECT_EQ(event->floor, 7u);
    EXPECT_NEAR(event->position.x, 3.5, TOLERANCE);
    EXPECT_NEAR(event->position.y, 0.0, TOLERANCE);
    EXPECT_NEAR(event->angle, 45.0, TOLERANCE);
    EXPECT_NEAR(event->zoom, 80.0, TOLERANCE);
    EXPECT_EQ(event->ease, "InOutQuad");

    EXPECT_EQ(event->passthrough.size(), 3u);
    EXPECT_EQ(event->passthrough["relativeTo"], "Player");
    EXPECT_EQ(event->passthrough["eventTag"], "intro");
    EXPECT_FALSE(event->passthrough.contains("floor"));
}

TEST(CameraEventTest, MissingFieldsTakeDefaults) {
    const auto event = parseCameraEvent(Json{{"floor", 0}, {"eventType", "MoveCamera"}});
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->position, glm::dvec2(0.0));
    EXPECT_DOUBLE_EQ(event->zoom, DEFAULT_ZOOM);
    EXPECT_EQ(event->ease, "Linear");
    EXPECT_FALSE(event->elastic.has_value());
    EXPECT_TRUE(event->samples.empty());
}

TEST(CameraEventTest, RejectsMissingFloorAndOtherEvents) {
    EXPECT_FALSE(parseCameraEvent(Json{{"eventType", "MoveCamera"}}).has_value());
    EXPECT_FALSE(parseCameraEvent(Json{{"floor", -1}, {"eventType", "MoveCamera"}}).has_value());
    EXPECT_FALSE(parseCameraEvent(Json{{"floor", 1}, {"eventType", "Twirl"}}).has_value());
    EXPECT_FALSE(parseCameraEvent(Json::array()).has_value());
}

TEST(CameraEventTest, MalformedParamsFallBackToDefaults) {
    const Json action = Json::parse(R"({
        "floor": 1, "eventType": "MoveCamera", "ease": "Elastic",
        "elastic": {"oscillations": "many", "decay": 5},
        "back": 3,
        "bezier": [0.1, 0.2]
    })");
    const auto event = parseCameraEvent(action);
    ASSERT_TRUE(event.has_value());

    ASSERT_TRUE(event->elastic.has_value());
    EXPECT_EQ(event->elastic->oscillations, ElasticParams{}.oscillations);
    EXPECT_DOUBLE_EQ(event->elastic->decay, 5.0);
    ASSERT_TRUE(event->back.has_value());
    EXPECT_EQ(*event->back, BackParams{});
    ASSERT_TRUE(event->bezier.has_value());
    EXPECT_EQ(*event->bezier, BezierParams{});
}

TEST(CameraEventTest, KeyframeCarriesParamsOfItsKindOnly) {
    CameraEvent event;
    event.ease = "Elastic";
    event.elastic = ElasticParams{5, 2.0};
    event.back = BackParams{9.0};
    event.samples = {0.0, 0.5, 1.0};

    const Keyframe kf = toKeyframe(event, 1234);
    EXPECT_EQ(kf.time, 1234);
    EXPECT_EQ(kf.ease.type(), EasingType::ELASTIC);
    ASSERT_NE(kf.ease.elastic(), nullptr);
    EXPECT_EQ(kf.ease.elastic()->oscillations, 5);
    EXPECT_EQ(kf.ease.samples(), (std::vector<double>{0.0, 0.5, 1.0}));
}

TEST(CameraEventTest, SingleSampleCacheIsDropped) {
    CameraEvent event;
    event.samples = {1.0};
    EXPECT_FALSE(toKeyframe(event, 0).ease.hasSamples());
}

TEST(CameraEventTest, UnknownEaseSurvivesRoundTrip) {
    CameraEvent event;
    event.floor = 3;
    event.ease = "Wobble";
    const Keyframe kf = toKeyframe(event, 0);
    EXPECT_EQ(kf.ease.type(), EasingType::LINEAR);

    const Json written = toJson(fromKeyframe(kf, 3, EXPORT_SAMPLE_COUNT));
    EXPECT_EQ(written["ease"], "Wobble");
    EXPECT_EQ(written["easeSamples"].size(), EXPORT_SAMPLE_COUNT);
}

TEST(CameraEventTest, WrittenActionOnlyHasMatchingParams) {
    Keyframe kf;
    kf.position = {1.0, 2.0};
    kf.ease = EasingCurve(EasingType::BEZIER);

    const Json written = toJson(fromKeyframe(kf, 5, 10, Json{{"relativeTo", "Tile"}, {"floor", 99}}));
    EXPECT_EQ(written["floor"], 5);
    EXPECT_EQ(written["eventType"], "MoveCamera");
    EXPECT_EQ(written["relativeTo"], "Tile");
    EXPECT_EQ(written["ease"], "Bezier");
    EXPECT_EQ(written["bezier"].size(), 4u);
    EXPECT_FALSE(written.contains("elastic"));
    EXPECT_FALSE(written.contains("back"));
    EXPECT_FALSE(written.contains("bounce"));
    EXPECT_EQ(written["easeSamples"].size(), 10u);
    EXPECT_EQ(written["position"], (Json{1.0, 2.0}));
}

TEST(CameraEventTest, ParseOfWrittenActionRestoresKeyframe) {
    Keyframe kf;
    kf.position = {-4.0, 2.5};
    kf.zoom = 130.0;
    kf.angle = -30.0;
    kf.ease = EasingCurve(EasingType::EASE_OUT_BACK);
    ASSERT_TRUE(kf.ease.setOvershoot(2.2));

    const auto parsed = parseCameraEvent(toJson(fromKeyframe(kf, 2, EXPORT_SAMPLE_COUNT)));
    ASSERT_TRUE(parsed.has_value());
    const Keyframe restored = toKeyframe(*parsed, 800);

    EXPECT_EQ(restored.position, kf.position);
    EXPECT_DOUBLE_EQ(restored.zoom, kf.zoom);
    EXPECT_DOUBLE_EQ(restored.angle, kf.angle);
    EXPECT_EQ(restored.ease.type(), EasingType::EASE_OUT_BACK);
    EXPECT_DOUBLE_EQ(restored.ease.back()->overshoot, 2.2);
    EXPECT_EQ(restored.ease.samples().size(), EXPORT_SAMPLE_COUNT);
}
