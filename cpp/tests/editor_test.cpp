#include <gtest/gtest.h>

#include "vgedit/editor.h"
#include "tests/vgedit_test_common.h"

#include <cmath>
#include <string>
#include <vector>

using namespace vgedit;
using vgedit_test::RecordingSink;
using vgedit_test::expectVecNear;
using vgedit_test::expectVecsNear;

namespace {

class EditorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 100x100 viewport after the margin; the first window matches it.
        ASSERT_EQ(editor.setViewportSize(120.0, 120.0), EngineError::Ok);
    }

    const GraphicObject& object(std::size_t index) const { return *editor.scene().objectAt(index); }

    Editor editor;
};

} // namespace

TEST(EditorSetupTest, RenderNeedsViewport) {
    Editor editor;
    RecordingSink sink;
    EXPECT_EQ(editor.render(sink), EngineError::InvalidOperation);
    EXPECT_EQ(editor.lastError(), EngineError::InvalidOperation);
}

TEST(EditorSetupTest, DegenerateViewportIsRejected) {
    Editor editor;
    EXPECT_EQ(editor.setViewportSize(15.0, 15.0), EngineError::ValidationError);
    EXPECT_FALSE(editor.hasViewport());
    EXPECT_EQ(editor.lastError(), EngineError::ValidationError);
}

TEST_F(EditorTest, ViewportCreatesWindow) {
    ASSERT_TRUE(editor.scene().hasWindow());
    expectVecNear(editor.viewport().min, Vec2{10.0, 10.0});
    expectVecNear(editor.viewport().max, Vec2{110.0, 110.0});
    expectVecNear(editor.scene().window().min, Vec2{-50.0, -50.0});
    expectVecNear(editor.scene().window().max, Vec2{50.0, 50.0});
}

TEST_F(EditorTest, AddObjectsAndRecordErrors) {
    EXPECT_EQ(editor.addPoint("p", 1.0, 2.0), EngineError::Ok);
    EXPECT_EQ(editor.addLine("l", 0.0, 0.0, 5.0, 5.0), EngineError::Ok);
    EXPECT_EQ(editor.addPolygon("g", {{0.0, 0.0}, {4.0, 0.0}, {0.0, 4.0}}, true), EngineError::Ok);
    EXPECT_EQ(editor.addCurve("c", curve::CurveBasis::BSpline, {{0.0, 0.0}, {1.0, 3.0}, {2.0, 3.0}, {3.0, 0.0}}),
        EngineError::Ok);
    EXPECT_EQ(editor.objectCount(), 4u);
    EXPECT_EQ(editor.lastError(), EngineError::Ok);

    EXPECT_EQ(editor.addLine("bad", 1.0, 1.0, 1.0, 1.0), EngineError::ValidationError);
    EXPECT_EQ(editor.lastError(), EngineError::ValidationError);
    EXPECT_EQ(editor.objectCount(), 4u);

    EXPECT_EQ(editor.removeObjects({3, 0}), EngineError::Ok);
    EXPECT_EQ(editor.objectCount(), 2u);
    EXPECT_EQ(object(0).name, "l");
}

TEST_F(EditorTest, CurveStepsApplyToNewCurves) {
    ASSERT_EQ(editor.setCurveSteps(5), EngineError::Ok);
    ASSERT_EQ(editor.addCurve("c", curve::CurveBasis::Bezier, {{0.0, 0.0}, {1.0, 3.0}, {2.0, 3.0}, {3.0, 0.0}}),
        EngineError::Ok);
    EXPECT_EQ(object(0).vertices.size(), 5u);
    EXPECT_EQ(editor.setCurveSteps(1), EngineError::ValidationError);
    EXPECT_EQ(editor.curveSteps(), 5u);
}

TEST_F(EditorTest, ClipAlgorithmSelection) {
    EXPECT_EQ(editor.setClipAlgorithm(LineClipAlgorithm::LiangBarsky), EngineError::Ok);
    EXPECT_EQ(editor.clipAlgorithm(), LineClipAlgorithm::LiangBarsky);
    EXPECT_EQ(editor.setClipAlgorithm(LineClipAlgorithm::Skala), EngineError::UnsupportedAlgorithm);
    EXPECT_EQ(editor.clipAlgorithm(), LineClipAlgorithm::LiangBarsky);
}

TEST_F(EditorTest, ScrollZoomsWindow) {
    ASSERT_EQ(editor.scroll(Editor::ScrollDirection::Up), EngineError::Ok);
    EXPECT_DOUBLE_EQ(editor.scene().window().width(), 50.0);
    ASSERT_EQ(editor.scroll(Editor::ScrollDirection::Down), EngineError::Ok);
    EXPECT_DOUBLE_EQ(editor.scene().window().width(), 100.0);
}

TEST_F(EditorTest, DragPansWindow) {
    EXPECT_EQ(editor.dragTo(5.0, 5.0), EngineError::InvalidOperation);

    editor.beginDrag(40.0, 40.0);
    ASSERT_EQ(editor.dragTo(50.0, 40.0), EngineError::Ok);
    ASSERT_EQ(editor.dragTo(50.0, 45.0), EngineError::Ok);
    editor.endDrag();
    EXPECT_FALSE(editor.isDragging());
    expectVecNear(editor.scene().window().center(), Vec2{-10.0, 5.0});
}

TEST_F(EditorTest, WindowCommands) {
    ASSERT_EQ(editor.panWindow(5.0, -5.0), EngineError::Ok);
    expectVecNear(editor.scene().window().center(), Vec2{5.0, -5.0});
    ASSERT_EQ(editor.rotateWindow(15.0), EngineError::Ok);
    EXPECT_DOUBLE_EQ(editor.scene().window().angleDeg, 15.0);
    EXPECT_EQ(editor.zoomWindow(-1.0), EngineError::InvalidOperation);
}

TEST_F(EditorTest, MoveFollowsWindowFrame) {
    ASSERT_EQ(editor.addPoint("p", 0.0, 0.0), EngineError::Ok);
    ASSERT_EQ(editor.navigate(Editor::NavCommand::MoveUp, {0}), EngineError::Ok);
    expectVecNear(object(0).vertices[0], Vec2{0.0, 10.0});

    ASSERT_EQ(editor.rotateWindow(90.0), EngineError::Ok);
    ASSERT_EQ(editor.navigate(Editor::NavCommand::MoveUp, {0}), EngineError::Ok);
    expectVecNear(object(0).vertices[0], Vec2{-10.0, 10.0});
}

TEST_F(EditorTest, RotateUsesReferenceMode) {
    ASSERT_EQ(editor.addPoint("p", 10.0, 0.0), EngineError::Ok);
    editor.setRotationReference(RotationReference::Origin);
    ASSERT_EQ(editor.navigate(Editor::NavCommand::RotateLeft, {0}), EngineError::Ok);
    const double a = 5.0 * std::acos(-1.0) / 180.0;
    expectVecNear(object(0).vertices[0], Vec2{10.0 * std::cos(a), 10.0 * std::sin(a)});

    editor.setRotationReference(RotationReference::Absolute);
    editor.setAbsolutePivot(object(0).vertices[0]);
    const Vec2 pinned = object(0).vertices[0];
    ASSERT_EQ(editor.navigate(Editor::NavCommand::RotateRight, {0}), EngineError::Ok);
    expectVecNear(object(0).vertices[0], pinned);
}

TEST_F(EditorTest, ZoomCommandsScaleSelection) {
    ASSERT_EQ(editor.addLine("l", -1.0, 0.0, 1.0, 0.0), EngineError::Ok);
    ASSERT_EQ(editor.addLine("other", -1.0, 5.0, 1.0, 5.0), EngineError::Ok);
    ASSERT_EQ(editor.navigate(Editor::NavCommand::ZoomIn, {0}), EngineError::Ok);
    expectVecsNear(object(0).vertices, {{-1.1, 0.0}, {1.1, 0.0}});
    expectVecsNear(object(1).vertices, {{-1.0, 5.0}, {1.0, 5.0}});

    ASSERT_EQ(editor.navigate(Editor::NavCommand::ZoomOut, {1}), EngineError::Ok);
    expectVecsNear(object(1).vertices, {{-0.9, 5.0}, {0.9, 5.0}});
}

TEST_F(EditorTest, NavigateWithBadIndexChangesNothing) {
    ASSERT_EQ(editor.addPoint("p", 1.0, 1.0), EngineError::Ok);
    EXPECT_EQ(editor.navigate(Editor::NavCommand::MoveLeft, {0, 4}), EngineError::IndexOutOfRange);
    expectVecNear(object(0).vertices[0], Vec2{1.0, 1.0});
}

TEST_F(EditorTest, RenderFrameFillsBuffers) {
    ASSERT_EQ(editor.addPoint("p", 0.0, 0.0), EngineError::Ok);
    ASSERT_EQ(editor.addLine("l", -100.0, 0.0, 100.0, 0.0), EngineError::Ok);
    ASSERT_EQ(editor.addPolygon("g", {{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}}, false), EngineError::Ok);
    ASSERT_EQ(editor.addPoint("far", 500.0, 0.0), EngineError::Ok);
    editor.setDrawViewportFrame(true);

    ASSERT_EQ(editor.renderFrame(), EngineError::Ok);
    EXPECT_EQ(editor.frame().arcCount(), 1u);
    EXPECT_EQ(editor.frame().segmentCount(), 1u);
    EXPECT_EQ(editor.frame().polylineCount(), 2u);
    EXPECT_EQ(editor.frameStats().drawn, 3u);
    EXPECT_EQ(editor.frameStats().culled, 1u);

    // The clipped line spans the whole viewport.
    const std::vector<float>& seg = editor.frame().segmentVertices();
    EXPECT_FLOAT_EQ(seg[0], 10.0f);
    EXPECT_FLOAT_EQ(seg[2], 110.0f);
    EXPECT_FLOAT_EQ(seg[1], 60.0f);
}

TEST_F(EditorTest, SceneStringRoundTrip) {
    ASSERT_EQ(editor.addPoint("p", 3.0, 4.0), EngineError::Ok);
    ASSERT_EQ(editor.addPolygon("g", {{0.0, 0.0}, {4.0, 0.0}, {0.0, 4.0}}, true), EngineError::Ok);
    const std::string text = editor.saveSceneString();

    Editor other;
    ASSERT_EQ(other.setViewportSize(120.0, 120.0), EngineError::Ok);
    ASSERT_EQ(other.loadSceneString(text), EngineError::Ok);
    EXPECT_EQ(other.objectCount(), 2u);
    EXPECT_TRUE(other.scene().objectAt(1)->filled);
}

TEST_F(EditorTest, CurveResolutionSurvivesSaveAndLoad) {
    ASSERT_EQ(editor.setCurveSteps(50), EngineError::Ok);
    ASSERT_EQ(editor.addCurve("c", curve::CurveBasis::Bezier, {{0.0, 0.0}, {1.0, 3.0}, {2.0, 3.0}, {3.0, 0.0}}),
        EngineError::Ok);
    ASSERT_EQ(object(0).vertices.size(), 50u);
    const std::string text = editor.saveSceneString();

    Editor other;
    ASSERT_EQ(other.setViewportSize(120.0, 120.0), EngineError::Ok);
    ASSERT_EQ(other.loadSceneString(text), EngineError::Ok);
    ASSERT_EQ(other.objectCount(), 1u);
    EXPECT_EQ(other.scene().objectAt(0)->steps, 50u);
    expectVecsNear(other.scene().objectAt(0)->vertices, object(0).vertices, 1e-12);
}

TEST_F(EditorTest, NameWithLineBreakIsRejected) {
    EXPECT_EQ(editor.addPoint("a\nv 1 2", 1.0, 1.0), EngineError::ValidationError);
    EXPECT_EQ(editor.objectCount(), 0u);
    ASSERT_EQ(editor.addPoint("a", 1.0, 1.0), EngineError::Ok);
    ASSERT_EQ(editor.loadSceneString(editor.saveSceneString()), EngineError::Ok);
    EXPECT_EQ(editor.objectCount(), 1u);
    EXPECT_EQ(object(0).name, "a");
}

TEST_F(EditorTest, LoadWithoutWindowFallsBackToViewportWindow) {
    ASSERT_EQ(editor.loadSceneString("v 1 1\np 1\n"), EngineError::Ok);
    ASSERT_TRUE(editor.scene().hasWindow());
    expectVecNear(editor.scene().window().max, Vec2{50.0, 50.0});
    expectVecsNear(*editor.scene().normalizedAt(0), {{0.02, 0.02}});
}

TEST_F(EditorTest, LoadFailureKeepsSceneAndReportsLine) {
    ASSERT_EQ(editor.addPoint("keep", 0.0, 0.0), EngineError::Ok);
    EXPECT_EQ(editor.loadSceneString("v 1 1\nq 1\n"), EngineError::ParseError);
    EXPECT_EQ(editor.lastError(), EngineError::ParseError);
    EXPECT_EQ(editor.lastDiagnostic().lineNumber, 2u);
    EXPECT_EQ(editor.lastDiagnostic().line, "q 1");
    EXPECT_EQ(editor.objectCount(), 1u);
}

TEST_F(EditorTest, FileRoundTrip) {
    const std::string path = ::testing::TempDir() + "vgedit_editor_test.obj";
    ASSERT_EQ(editor.addLine("l", 0.0, 0.0, 5.0, 5.0), EngineError::Ok);
    ASSERT_EQ(editor.saveSceneFile(path), EngineError::Ok);
    editor.clearScene();
    EXPECT_EQ(editor.objectCount(), 0u);
    ASSERT_EQ(editor.loadSceneFile(path), EngineError::Ok);
    EXPECT_EQ(editor.objectCount(), 1u);
    EXPECT_EQ(editor.loadSceneFile(path + ".missing"), EngineError::IoError);
}
