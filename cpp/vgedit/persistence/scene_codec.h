#ifndef VGEDIT_PERSISTENCE_SCENE_CODEC_H
#define VGEDIT_PERSISTENCE_SCENE_CODEC_H

#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/scene/scene.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Line-oriented text format, a subset of Wavefront OBJ:
//
//   v x y [w]          vertex, 1-based index in declaration order
//   o name             name for the following objects
//   usemtl filled      next polygon is filled
//   usemtl bezier [n]  next open `l` holds Bezier controls, n curve steps
//   usemtl bspline [n] next open `l` holds B-spline controls, n curve steps
//   p i                point
//   l i j              line
//   l i1 .. iN i1      closed polygon over i1..iN
//   l i1 .. iN         open polyline (or curve controls, see usemtl)
//   w i j [angle]      window with min i, max j
//   # ...              comment
//
// Files written here stay readable by consumers that only know the
// original directives, except that marked curves carry their controls.

namespace vgedit {

struct ParseDiagnostic {
    std::size_t lineNumber{0}; // 1-based, 0 when not tied to a line
    std::string line;
    std::string reason;
};

std::string encodeScene(const Scene& scene);

// Replaces the objects and window of scene. The scene's viewport is kept.
// On failure scene is left untouched and diagnostic (if given) names the
// offending line. curveSteps applies to marked curves without an explicit
// step count and to unmarked polylines.
EngineError decodeScene(
    const std::string& text,
    Scene& scene,
    ParseDiagnostic* diagnostic = nullptr,
    std::uint32_t curveSteps = editor_constants::CURVE_STEPS
);

EngineError loadSceneFile(
    const std::string& path,
    Scene& scene,
    ParseDiagnostic* diagnostic = nullptr,
    std::uint32_t curveSteps = editor_constants::CURVE_STEPS
);
EngineError saveSceneFile(const std::string& path, const Scene& scene);

} // namespace vgedit

#endif // VGEDIT_PERSISTENCE_SCENE_CODEC_H
