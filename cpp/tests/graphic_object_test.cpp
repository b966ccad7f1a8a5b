#include <gtest/gtest.h>

#include "vgedit/entity/graphic_object.h"
#include "tests/vgedit_test_common.h"

#include <cmath>
#include <vector>

using namespace vgedit;
using vgedit_test::expectVecNear;
using vgedit_test::expectVecsNear;

TEST(GraphicObjectTest, FactoriesBuildTaggedObjects) {
    GraphicObject point;
    ASSERT_EQ(makePoint("p", Vec2{1.0, 2.0}, point), EngineError::Ok);
    EXPECT_EQ(point.kind, ObjectKind::Point);
    EXPECT_EQ(point.name, "p");
    ASSERT_EQ(point.vertices.size(), 1u);

    GraphicObject line;
    ASSERT_EQ(makeLine("l", Vec2{0.0, 0.0}, Vec2{3.0, 4.0}, line), EngineError::Ok);
    EXPECT_EQ(line.kind, ObjectKind::Line);
    ASSERT_EQ(line.vertices.size(), 2u);

    GraphicObject tri;
    ASSERT_EQ(makePolygon("t", {{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}}, true, tri), EngineError::Ok);
    EXPECT_EQ(tri.kind, ObjectKind::Polygon);
    EXPECT_TRUE(tri.filled);
}

TEST(GraphicObjectTest, DegenerateGeometryIsRejected) {
    GraphicObject out;
    out.name = "untouched";
    EXPECT_EQ(makeLine("l", Vec2{1.0, 1.0}, Vec2{1.0, 1.0}, out), EngineError::ValidationError);
    EXPECT_EQ(makePolygon("p", {{0.0, 0.0}, {1.0, 0.0}}, false, out), EngineError::ValidationError);
    EXPECT_EQ(makeCurve("c", curve::CurveBasis::Bezier, {{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}, {3.0, 0.0}, {4.0, 0.0}},
                  editor_constants::CURVE_STEPS, out),
        EngineError::ValidationError);
    EXPECT_EQ(makeCurve("c", curve::CurveBasis::BSpline, {{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}},
                  editor_constants::CURVE_STEPS, out),
        EngineError::ValidationError);
    EXPECT_EQ(makePoint("nan", Vec2{std::nan(""), 0.0}, out), EngineError::ValidationError);
    EXPECT_EQ(out.name, "untouched");
}

TEST(GraphicObjectTest, CurveKeepsControlsAndTessellation) {
    GraphicObject curve;
    const std::vector<Vec2> controls{{0.0, 0.0}, {1.0, 2.0}, {3.0, 2.0}, {4.0, 0.0}};
    ASSERT_EQ(makeCurve("c", curve::CurveBasis::Bezier, controls, 10, curve), EngineError::Ok);
    EXPECT_EQ(curve.kind, ObjectKind::Curve);
    EXPECT_EQ(curve.controlPoints.size(), 4u);
    EXPECT_EQ(curve.vertices.size(), 10u);
    EXPECT_EQ(curve.steps, 10u);
}

TEST(GraphicObjectTest, CentroidIsVertexMean) {
    GraphicObject square;
    ASSERT_EQ(makePolygon("s", {{0.0, 0.0}, {4.0, 0.0}, {4.0, 2.0}, {0.0, 2.0}}, false, square), EngineError::Ok);
    expectVecNear(square.centroid(), Vec2{2.0, 1.0});
}

TEST(GraphicObjectTest, TranslateMovesEveryVertex) {
    GraphicObject line;
    ASSERT_EQ(makeLine("l", Vec2{0.0, 0.0}, Vec2{1.0, 1.0}, line), EngineError::Ok);
    ASSERT_EQ(translateObject(line, Vec2{2.0, -1.0}), EngineError::Ok);
    expectVecsNear(line.vertices, {{2.0, -1.0}, {3.0, 0.0}});
}

TEST(GraphicObjectTest, ScaleAboutCentroid) {
    GraphicObject square;
    ASSERT_EQ(makePolygon("s", {{0.0, 0.0}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}}, false, square), EngineError::Ok);
    ASSERT_EQ(scaleObject(square, 2.0), EngineError::Ok);
    expectVecsNear(square.vertices, {{-1.0, -1.0}, {3.0, -1.0}, {3.0, 3.0}, {-1.0, 3.0}});
    expectVecNear(square.centroid(), Vec2{1.0, 1.0});

    EXPECT_EQ(scaleObject(square, 0.0), EngineError::InvalidOperation);
    EXPECT_EQ(scaleObject(square, -1.0), EngineError::InvalidOperation);
}

TEST(GraphicObjectTest, RotationReferences) {
    GraphicObject line;
    ASSERT_EQ(makeLine("l", Vec2{1.0, 0.0}, Vec2{3.0, 0.0}, line), EngineError::Ok);

    GraphicObject aboutCenter = line;
    ASSERT_EQ(rotateObject(aboutCenter, 90.0, RotationReference::Center), EngineError::Ok);
    expectVecsNear(aboutCenter.vertices, {{2.0, -1.0}, {2.0, 1.0}});

    GraphicObject aboutOrigin = line;
    ASSERT_EQ(rotateObject(aboutOrigin, 90.0, RotationReference::Origin), EngineError::Ok);
    expectVecsNear(aboutOrigin.vertices, {{0.0, 1.0}, {0.0, 3.0}});

    GraphicObject aboutPivot = line;
    ASSERT_EQ(rotateObject(aboutPivot, 180.0, RotationReference::Absolute, Vec2{1.0, 0.0}), EngineError::Ok);
    expectVecsNear(aboutPivot.vertices, {{1.0, 0.0}, {-1.0, 0.0}});
}

TEST(GraphicObjectTest, CurveTransformMovesControlsAndRetessellates) {
    GraphicObject curve;
    const std::vector<Vec2> controls{{0.0, 0.0}, {1.0, 2.0}, {3.0, 2.0}, {4.0, 0.0}};
    ASSERT_EQ(makeCurve("c", curve::CurveBasis::Bezier, controls, 8, curve), EngineError::Ok);
    ASSERT_EQ(translateObject(curve, Vec2{10.0, 5.0}), EngineError::Ok);
    expectVecNear(curve.controlPoints.front(), Vec2{10.0, 5.0});
    ASSERT_EQ(curve.vertices.size(), 8u);
    EXPECT_EQ(curve.vertices.front(), curve.controlPoints.front());
    EXPECT_EQ(curve.vertices.back(), curve.controlPoints.back());
}

TEST(GraphicObjectTest, FailedTransformLeavesObjectUntouched) {
    GraphicObject line;
    ASSERT_EQ(makeLine("l", Vec2{0.0, 0.0}, Vec2{1.0, 0.0}, line), EngineError::Ok);
    // Collapsing the x axis makes both endpoints coincide.
    EXPECT_EQ(transformObject(line, scaleMatrix(0.0, 1.0)), EngineError::ValidationError);
    expectVecsNear(line.vertices, {{0.0, 0.0}, {1.0, 0.0}});
}
