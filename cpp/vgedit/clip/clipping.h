#ifndef VGEDIT_CLIP_CLIPPING_H
#define VGEDIT_CLIP_CLIPPING_H

#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/math/vector_math.h"
#include "vgedit/view/coordinate_system.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace vgedit {

// Axis-aligned clip rectangle. Geometry must already be expressed in the
// rectangle's frame (normalized coordinates, or toWindowLocal output).
struct ClipBounds {
    Vec2 min;
    Vec2 max;

    static ClipBounds unit() noexcept { return ClipBounds{Vec2{-1.0, -1.0}, Vec2{1.0, 1.0}}; }
    static ClipBounds fromWindow(const Window& window) noexcept { return ClipBounds{window.min, window.max}; }
};

struct Segment {
    Vec2 start;
    Vec2 end;
};

enum class LineClipAlgorithm : std::uint8_t {
    CohenSutherland = 0,
    LiangBarsky = 1,
    // Reserved for the cross-product and slope-region variants; selecting
    // them reports UnsupportedAlgorithm.
    Skala = 2,
    NichollLeeNicholl = 3,
};

const char* lineClipAlgorithmName(LineClipAlgorithm algorithm) noexcept;
bool isLineClipAlgorithmSupported(LineClipAlgorithm algorithm) noexcept;

// Cohen-Sutherland region code bits.
enum OutcodeBits : std::uint8_t {
    OutcodeInside = 0,
    OutcodeLeft = 1 << 0,
    OutcodeRight = 1 << 1,
    OutcodeBottom = 1 << 2,
    OutcodeTop = 1 << 3,
};

std::uint8_t computeOutcode(const Vec2& p, const ClipBounds& bounds) noexcept;

// Inclusive on every boundary.
bool clipPoint(const Vec2& p, const ClipBounds& bounds) noexcept;

// Gives up and rejects after maxIterations endpoint replacements. Both
// algorithms reject segments with a non-finite endpoint.
std::optional<Segment> clipLineCohenSutherland(
    const Segment& line,
    const ClipBounds& bounds,
    int maxIterations = editor_constants::COHEN_SUTHERLAND_MAX_ITERATIONS
);
std::optional<Segment> clipLineLiangBarsky(const Segment& line, const ClipBounds& bounds);

// Strategy entry point. out is reset to nullopt when the line is rejected.
// A non-finite endpoint is a ValidationError.
EngineError clipLine(
    const Segment& line,
    const ClipBounds& bounds,
    LineClipAlgorithm algorithm,
    std::optional<Segment>& out);

// Sutherland-Hodgman against LEFT, RIGHT, BOTTOM, TOP (in that order).
// A fully inside polygon comes back with its vertices in the same order.
// Consecutive duplicates produced by boundary vertices are collapsed.
// An empty result means the polygon lies outside.
std::vector<Vec2> clipPolygon(const std::vector<Vec2>& vertices, const ClipBounds& bounds);

// Same sweep for a polygon given in world coordinates against a possibly
// rotated window. The result is in the window's unrotated local frame.
std::vector<Vec2> clipPolygonToWindow(const std::vector<Vec2>& worldVertices, const Window& window);

// Clips each consecutive vertex pair as an independent segment. The result
// holds the surviving segments' endpoints as flat pairs (start0, end0,
// start1, end1, ...). Gaps are not bridged.
EngineError clipCurve(
    const std::vector<Vec2>& vertices,
    const ClipBounds& bounds,
    LineClipAlgorithm algorithm,
    std::vector<Vec2>& outSegmentPoints);

} // namespace vgedit

#endif // VGEDIT_CLIP_CLIPPING_H
