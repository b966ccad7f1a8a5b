#include <gtest/gtest.h>

#include "vgedit/render/line_buffer_sink.h"
#include "vgedit/render/render.h"
#include "tests/vgedit_test_common.h"

#include <vector>

using namespace vgedit;
using vgedit_test::RecordingSink;
using vgedit_test::expectVecNear;

namespace {

class RenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(scene.setWindow(Window{Vec2{-10.0, -10.0}, Vec2{10.0, 10.0}, 0.0}), EngineError::Ok);
    }

    void addPoint(double x, double y) {
        GraphicObject obj;
        ASSERT_EQ(makePoint("p", Vec2{x, y}, obj), EngineError::Ok);
        ASSERT_EQ(scene.addObject(obj), EngineError::Ok);
    }

    void addLine(const Vec2& a, const Vec2& b) {
        GraphicObject obj;
        ASSERT_EQ(makeLine("l", a, b, obj), EngineError::Ok);
        ASSERT_EQ(scene.addObject(obj), EngineError::Ok);
    }

    void addPolygon(const std::vector<Vec2>& vertices, bool filled) {
        GraphicObject obj;
        ASSERT_EQ(makePolygon("g", vertices, filled, obj), EngineError::Ok);
        ASSERT_EQ(scene.addObject(obj), EngineError::Ok);
    }

    void addPolyline(const std::vector<Vec2>& vertices) {
        GraphicObject obj;
        ASSERT_EQ(makeCurve("c", curve::CurveBasis::Polyline, vertices, editor_constants::CURVE_STEPS, obj),
            EngineError::Ok);
        ASSERT_EQ(scene.addObject(obj), EngineError::Ok);
    }

    Scene scene;
    // NDC (x, y) lands on (60 + 50x, 60 - 50y).
    const Viewport viewport{Vec2{10.0, 10.0}, Vec2{110.0, 110.0}};
};

} // namespace

TEST_F(RenderTest, PointsBecomeArcs) {
    addPoint(5.0, 5.0);
    addPoint(20.0, 0.0);
    RecordingSink sink;
    RenderStats stats;
    ASSERT_EQ(renderScene(scene, viewport, RenderOptions{}, sink, &stats), EngineError::Ok);
    ASSERT_EQ(sink.arcs.size(), 1u);
    expectVecNear(sink.arcs[0].center, Vec2{85.0, 35.0});
    EXPECT_DOUBLE_EQ(sink.arcs[0].radius, editor_constants::POINT_RADIUS_PX);
    EXPECT_EQ(stats.drawn, 1u);
    EXPECT_EQ(stats.culled, 1u);
}

TEST_F(RenderTest, LinesAreClippedBeforeMapping) {
    addLine(Vec2{-20.0, 0.0}, Vec2{20.0, 0.0});
    for (LineClipAlgorithm algorithm : {LineClipAlgorithm::CohenSutherland, LineClipAlgorithm::LiangBarsky}) {
        RecordingSink sink;
        RenderOptions options;
        options.algorithm = algorithm;
        ASSERT_EQ(renderScene(scene, viewport, options, sink), EngineError::Ok);
        ASSERT_EQ(sink.lines.size(), 1u);
        expectVecNear(sink.lines[0].a, Vec2{10.0, 60.0});
        expectVecNear(sink.lines[0].b, Vec2{110.0, 60.0});
    }
}

TEST_F(RenderTest, PolygonsKeepFillAndClose) {
    addPolygon({{-20.0, -20.0}, {20.0, -20.0}, {20.0, 20.0}, {-20.0, 20.0}}, true);
    addPolygon({{30.0, 30.0}, {40.0, 30.0}, {40.0, 40.0}}, false);
    RecordingSink sink;
    RenderStats stats;
    ASSERT_EQ(renderScene(scene, viewport, RenderOptions{}, sink, &stats), EngineError::Ok);
    ASSERT_EQ(sink.polylines.size(), 1u);
    EXPECT_TRUE(sink.polylines[0].closed);
    EXPECT_TRUE(sink.polylines[0].filled);
    ASSERT_EQ(sink.polylines[0].points.size(), 4u);
    expectVecNear(sink.polylines[0].points[0], Vec2{10.0, 10.0});
    expectVecNear(sink.polylines[0].points[2], Vec2{110.0, 110.0});
    EXPECT_EQ(stats.culled, 1u);
}

TEST_F(RenderTest, CurvesDrawOneLinePerSurvivingSegment) {
    addPolyline({{-5.0, 0.0}, {-5.0, 20.0}, {5.0, 20.0}, {5.0, 0.0}});
    RecordingSink sink;
    ASSERT_EQ(renderScene(scene, viewport, RenderOptions{}, sink), EngineError::Ok);
    ASSERT_EQ(sink.lines.size(), 2u);
    expectVecNear(sink.lines[0].a, Vec2{35.0, 60.0});
    expectVecNear(sink.lines[0].b, Vec2{35.0, 10.0});
    expectVecNear(sink.lines[1].a, Vec2{85.0, 10.0});
}

TEST_F(RenderTest, ViewportFrameIsOptional) {
    RecordingSink sink;
    RenderOptions options;
    options.drawViewportFrame = true;
    ASSERT_EQ(renderScene(scene, viewport, options, sink), EngineError::Ok);
    ASSERT_EQ(sink.polylines.size(), 1u);
    EXPECT_TRUE(sink.polylines[0].closed);
    EXPECT_FALSE(sink.polylines[0].filled);
    EXPECT_EQ(sink.polylines[0].points.size(), 4u);
}

TEST_F(RenderTest, RejectsUnsupportedAlgorithm) {
    addLine(Vec2{0.0, 0.0}, Vec2{1.0, 1.0});
    RecordingSink sink;
    RenderOptions options;
    options.algorithm = LineClipAlgorithm::NichollLeeNicholl;
    EXPECT_EQ(renderScene(scene, viewport, options, sink), EngineError::UnsupportedAlgorithm);
    EXPECT_TRUE(sink.lines.empty());
}

TEST(RenderNoWindowTest, NeedsAWindow) {
    Scene scene;
    RecordingSink sink;
    EXPECT_EQ(renderScene(scene, Viewport{Vec2{0.0, 0.0}, Vec2{10.0, 10.0}}, RenderOptions{}, sink),
        EngineError::InvalidOperation);
}

TEST(LineBufferSinkTest, FlattensDrawCalls) {
    LineBufferSink sink;
    sink.drawLine(Vec2{1.0, 2.0}, Vec2{3.0, 4.0});
    sink.drawPolyline({{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}}, true, true);
    sink.drawPolyline({{5.0, 5.0}, {6.0, 6.0}}, false, false);
    sink.drawArc(Vec2{7.0, 8.0}, 1.5);

    EXPECT_EQ(sink.segmentCount(), 1u);
    EXPECT_EQ(sink.segmentVertices(), (std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f}));

    ASSERT_EQ(sink.polylineCount(), 2u);
    EXPECT_EQ(sink.polylineRanges()[0].offset, 0u);
    EXPECT_EQ(sink.polylineRanges()[0].count, 6u);
    EXPECT_TRUE(sink.polylineRanges()[0].filled);
    EXPECT_EQ(sink.polylineRanges()[1].offset, 6u);
    EXPECT_EQ(sink.polylineRanges()[1].count, 4u);
    EXPECT_FALSE(sink.polylineRanges()[1].closed);

    EXPECT_EQ(sink.arcCount(), 1u);
    EXPECT_EQ(sink.arcData(), (std::vector<float>{7.0f, 8.0f, 1.5f}));

    sink.clear();
    EXPECT_EQ(sink.segmentCount(), 0u);
    EXPECT_EQ(sink.polylineCount(), 0u);
    EXPECT_EQ(sink.arcCount(), 0u);
}
