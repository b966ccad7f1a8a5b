#include "vgedit/view/coordinate_system.h"
#include "vgedit/core/logging.h"

#include <cmath>

namespace vgedit {

bool Window::isValid() const noexcept {
    return std::isfinite(min.x) && std::isfinite(min.y) && std::isfinite(max.x) && std::isfinite(max.y)
        && std::isfinite(angleDeg) && max.x > min.x && max.y > min.y;
}

bool Viewport::isValid() const noexcept {
    return std::isfinite(min.x) && std::isfinite(min.y) && std::isfinite(max.x) && std::isfinite(max.y)
        && max.x > min.x && max.y > min.y;
}

EngineError makeViewport(const Vec2& deviceMin, const Vec2& deviceMax, double margin, Viewport& out) {
    Viewport vp{deviceMin + Vec2{margin, margin}, deviceMax - Vec2{margin, margin}};
    if (!vp.isValid()) {
        VGEDIT_LOG_WARN("viewport (%g,%g)-(%g,%g) with margin %g is degenerate",
            deviceMin.x, deviceMin.y, deviceMax.x, deviceMax.y, margin);
        return EngineError::ValidationError;
    }
    out = vp;
    return EngineError::Ok;
}

Mat3 normalizationMatrix(const Window& window) noexcept {
    const Vec2 c = window.center();
    return translationMatrix(-c.x, -c.y)
        * rotationMatrix(-window.angleDeg)
        * scaleMatrix(2.0 / window.width(), 2.0 / window.height());
}

Mat3 viewportMatrix(const Viewport& viewport) noexcept {
    const Vec2 c = viewport.center();
    return scaleMatrix(viewport.width() / 2.0, -viewport.height() / 2.0)
        * translationMatrix(c.x, c.y);
}

void translateWindow(Window& window, const Vec2& offset) noexcept {
    window.min += offset;
    window.max += offset;
}

EngineError zoomWindow(Window& window, double factor) noexcept {
    if (!(factor > 0.0) || !std::isfinite(factor)) return EngineError::InvalidOperation;
    const Mat3 m = aroundPivot(scaleMatrix(factor, factor), window.center());
    Window next = window;
    next.min = transform(window.min, m);
    next.max = transform(window.max, m);
    if (!next.isValid()) return EngineError::InvalidOperation;
    window = next;
    return EngineError::Ok;
}

void rotateWindow(Window& window, double deltaDeg) noexcept {
    window.angleDeg += deltaDeg;
}

std::vector<Vec2> toWindowLocal(const std::vector<Vec2>& points, const Window& window) {
    return transformed(points, aroundPivot(rotationMatrix(-window.angleDeg), window.center()));
}

Vec2 windowFrameToWorld(const Vec2& offset, const Window& window) noexcept {
    return transform(offset, rotationMatrix(window.angleDeg));
}

EngineError CoordinateSystem::setWindow(const Window& window) noexcept {
    if (!window.isValid()) return EngineError::ValidationError;
    window_ = window;
    hasWindow_ = true;
    return EngineError::Ok;
}

EngineError CoordinateSystem::resizeViewport(const Viewport& viewport) noexcept {
    if (!viewport.isValid()) return EngineError::ValidationError;

    if (!hasWindow_) {
        const double hw = viewport.width() / 2.0;
        const double hh = viewport.height() / 2.0;
        window_ = Window{Vec2{-hw, -hh}, Vec2{hw, hh}, 0.0};
        hasWindow_ = true;
    } else if (hasViewport_) {
        const double sx = viewport.width() / viewport_.width();
        const double sy = viewport.height() / viewport_.height();
        const Mat3 m = aroundPivot(scaleMatrix(sx, sy), window_.center());
        window_.min = transform(window_.min, m);
        window_.max = transform(window_.max, m);
    }

    viewport_ = viewport;
    hasViewport_ = true;
    return EngineError::Ok;
}

EngineError CoordinateSystem::translate(const Vec2& offset) noexcept {
    if (!hasWindow_) return EngineError::InvalidOperation;
    if (!std::isfinite(offset.x) || !std::isfinite(offset.y)) return EngineError::InvalidOperation;
    translateWindow(window_, offset);
    return EngineError::Ok;
}

EngineError CoordinateSystem::zoom(double factor) noexcept {
    if (!hasWindow_) return EngineError::InvalidOperation;
    return zoomWindow(window_, factor);
}

EngineError CoordinateSystem::rotate(double deltaDeg) noexcept {
    if (!hasWindow_) return EngineError::InvalidOperation;
    if (!std::isfinite(deltaDeg)) return EngineError::InvalidOperation;
    rotateWindow(window_, deltaDeg);
    return EngineError::Ok;
}

EngineError CoordinateSystem::panByDevice(const Vec2& deviceDelta) noexcept {
    if (!hasWindow_ || !hasViewport_) return EngineError::InvalidOperation;
    const Vec2 local{
        -deviceDelta.x / viewport_.width() * window_.width(),
        deviceDelta.y / viewport_.height() * window_.height(),
    };
    translateWindow(window_, windowFrameToWorld(local, window_));
    return EngineError::Ok;
}

} // namespace vgedit
