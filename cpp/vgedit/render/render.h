#ifndef VGEDIT_RENDER_RENDER_H
#define VGEDIT_RENDER_RENDER_H

#include "vgedit/clip/clipping.h"
#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/math/vector_math.h"
#include "vgedit/scene/scene.h"
#include "vgedit/view/coordinate_system.h"

#include <cstdint>
#include <vector>

namespace vgedit {

// Low-level drawing capability. All coordinates are device units.
class DrawSink {
public:
    virtual ~DrawSink() = default;

    virtual void drawLine(const Vec2& a, const Vec2& b) = 0;
    virtual void drawPolyline(const std::vector<Vec2>& points, bool closed, bool filled) = 0;
    virtual void drawArc(const Vec2& center, double radius) = 0;
};

struct RenderOptions {
    LineClipAlgorithm algorithm{LineClipAlgorithm::CohenSutherland};
    double pointRadius{editor_constants::POINT_RADIUS_PX};
    bool drawViewportFrame{false};
};

struct RenderStats {
    std::uint32_t drawn{0};
    std::uint32_t culled{0};
};

// Clips every object's normalized vertices against the unit square, maps the
// survivors through viewportMatrix(viewport) and hands them to sink in
// display order. Requires a window on the scene.
EngineError renderScene(
    const Scene& scene,
    const Viewport& viewport,
    const RenderOptions& options,
    DrawSink& sink,
    RenderStats* stats = nullptr);

} // namespace vgedit

#endif // VGEDIT_RENDER_RENDER_H
