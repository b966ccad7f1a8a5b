#ifndef VGEDIT_VIEW_COORDINATE_SYSTEM_H
#define VGEDIT_VIEW_COORDINATE_SYSTEM_H

#include "vgedit/core/types.h"
#include "vgedit/math/vector_math.h"

#include <vector>

namespace vgedit {

// The region of the world being viewed. min/max describe the unrotated
// rectangle; angleDeg rotates it about its center.
struct Window {
    Vec2 min;
    Vec2 max;
    double angleDeg{0.0};

    Vec2 center() const noexcept { return (min + max) * 0.5; }
    double width() const noexcept { return max.x - min.x; }
    double height() const noexcept { return max.y - min.y; }
    bool isValid() const noexcept;
};

// Device-space rectangle. Device y grows downward.
struct Viewport {
    Vec2 min;
    Vec2 max;

    Vec2 center() const noexcept { return (min + max) * 0.5; }
    double width() const noexcept { return max.x - min.x; }
    double height() const noexcept { return max.y - min.y; }
    bool isValid() const noexcept;
};

// Builds a viewport from a device rectangle shrunk by margin on every side.
// Returns ValidationError if the result is degenerate.
EngineError makeViewport(const Vec2& deviceMin, const Vec2& deviceMax, double margin, Viewport& out);

// World -> NDC: translate(-center) * rotate(-angle) * scale(2/w, 2/h).
Mat3 normalizationMatrix(const Window& window) noexcept;

// NDC -> device: scale(w/2, -h/2) * translate(viewport center).
Mat3 viewportMatrix(const Viewport& viewport) noexcept;

// Window mutations. They return InvalidOperation/ValidationError and leave
// the window untouched when the request would break its invariant.
void translateWindow(Window& window, const Vec2& offset) noexcept;
EngineError zoomWindow(Window& window, double factor) noexcept;
void rotateWindow(Window& window, double deltaDeg) noexcept;

// Rotates world points by -angle about the window center. The result can be
// clipped against ClipBounds::fromWindow(window).
std::vector<Vec2> toWindowLocal(const std::vector<Vec2>& points, const Window& window);

// Converts a window-frame offset (e.g. "up" on screen) to a world offset.
Vec2 windowFrameToWorld(const Vec2& offset, const Window& window) noexcept;

class CoordinateSystem {
public:
    CoordinateSystem() = default;

    bool hasWindow() const noexcept { return hasWindow_; }
    const Window& window() const noexcept { return window_; }
    const Viewport& viewport() const noexcept { return viewport_; }

    EngineError setWindow(const Window& window) noexcept;
    void clearWindow() noexcept { hasWindow_ = false; }

    // Replaces the viewport. An existing window is resized about its center
    // by the new/old size ratio so the world-per-device scale is kept; when
    // there is no window yet, one the size of the viewport is created around
    // the origin.
    EngineError resizeViewport(const Viewport& viewport) noexcept;

    Mat3 normalization() const noexcept { return normalizationMatrix(window_); }
    Mat3 deviceTransform() const noexcept { return viewportMatrix(viewport_); }

    EngineError translate(const Vec2& offset) noexcept;
    EngineError zoom(double factor) noexcept;
    EngineError rotate(double deltaDeg) noexcept;

    // Converts a drag in device units into a window translation. The content
    // follows the cursor, so the window moves against the drag.
    EngineError panByDevice(const Vec2& deviceDelta) noexcept;

private:
    Window window_{};
    Viewport viewport_{Vec2{0.0, 0.0}, Vec2{1.0, 1.0}};
    bool hasWindow_{false};
    bool hasViewport_{false};
};

} // namespace vgedit

#endif // VGEDIT_VIEW_COORDINATE_SYSTEM_H
