#ifndef VGEDIT_CURVE_CURVE_TESSELLATION_H
#define VGEDIT_CURVE_CURVE_TESSELLATION_H

#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/math/vector_math.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vgedit::curve {

enum class CurveBasis : std::uint8_t {
    Bezier = 0,
    BSpline = 1,
    // Open polyline whose controls are used verbatim (no tessellation).
    Polyline = 2,
};

const char* curveBasisName(CurveBasis basis) noexcept;

struct TessellateOptions {
    std::uint32_t steps{editor_constants::CURVE_STEPS}; // samples per Bezier segment, increments per B-spline window
};

using Mat4x4 = std::array<std::array<double, 4>, 4>;

// [t^3, t^2, t, 1] * M * G
const Mat4x4& bezierBasis() noexcept;
// Uniform cubic B-spline basis, already divided by 6.
const Mat4x4& bsplineBasis() noexcept;
// Maps cubic coefficients [a, b, c, d] to [f0, df, d2f, d3f] for step delta.
Mat4x4 forwardDifferenceMatrix(double delta) noexcept;

// Checks the control count against the basis grouping rule.
// Bezier: >= 4 and (n - 1) % 3 == 0. BSpline: >= 4. Polyline: >= 3.
EngineError validateControlCount(CurveBasis basis, std::size_t count) noexcept;

std::size_t bezierSegmentCount(std::size_t controlCount) noexcept;
std::size_t bsplineSegmentCount(std::size_t controlCount) noexcept;

class CurveTessellator {
public:
    CurveTessellator() = default;
    explicit CurveTessellator(const TessellateOptions& options) : options_(options) {}

    const TessellateOptions& options() const noexcept { return options_; }

    // Replaces out with the tessellated polyline. Joint samples shared by
    // consecutive segments are emitted once.
    EngineError tessellate(CurveBasis basis, const std::vector<Vec2>& controls, std::vector<Vec2>& out) const;

    EngineError tessellateBezier(const std::vector<Vec2>& controls, std::vector<Vec2>& out) const;

    // Forward differencing; every 4-point window restarts from freshly
    // computed coefficients so round-off does not carry across segments.
    EngineError tessellateBSpline(const std::vector<Vec2>& controls, std::vector<Vec2>& out) const;

private:
    TessellateOptions options_{};
};

} // namespace vgedit::curve

#endif // VGEDIT_CURVE_CURVE_TESSELLATION_H
