#include "vgedit/editor.h"
#include "vgedit/core/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vgedit {

EngineError Editor::setViewportSize(double width, double height) {
    if (!std::isfinite(width) || !std::isfinite(height)) return record(EngineError::ValidationError);
    Viewport vp{};
    EngineError err = makeViewport(Vec2{0.0, 0.0}, Vec2{width, height}, editor_constants::VIEWPORT_MARGIN_PX, vp);
    if (err != EngineError::Ok) return record(err);
    err = scene_.resizeViewport(vp);
    if (err != EngineError::Ok) return record(err);
    hasViewport_ = true;
    return record(EngineError::Ok);
}

EngineError Editor::setClipAlgorithm(LineClipAlgorithm algorithm) {
    if (!isLineClipAlgorithmSupported(algorithm)) {
        VGEDIT_LOG_WARN("keeping %s; %s is not available",
            lineClipAlgorithmName(algorithm_), lineClipAlgorithmName(algorithm));
        return record(EngineError::UnsupportedAlgorithm);
    }
    algorithm_ = algorithm;
    return record(EngineError::Ok);
}

EngineError Editor::setCurveSteps(std::uint32_t steps) {
    if (steps < 2 || steps > editor_constants::CURVE_STEPS_MAX) return record(EngineError::ValidationError);
    curveSteps_ = steps;
    return record(EngineError::Ok);
}

EngineError Editor::addObject(const GraphicObject& object) {
    return record(scene_.addObject(object));
}

EngineError Editor::addPoint(const std::string& name, double x, double y) {
    GraphicObject obj{};
    const EngineError err = makePoint(name, Vec2{x, y}, obj);
    if (err != EngineError::Ok) return record(err);
    return addObject(obj);
}

EngineError Editor::addLine(const std::string& name, double x0, double y0, double x1, double y1) {
    GraphicObject obj{};
    const EngineError err = makeLine(name, Vec2{x0, y0}, Vec2{x1, y1}, obj);
    if (err != EngineError::Ok) return record(err);
    return addObject(obj);
}

EngineError Editor::addPolygon(const std::string& name, const std::vector<Vec2>& vertices, bool filled) {
    GraphicObject obj{};
    const EngineError err = makePolygon(name, vertices, filled, obj);
    if (err != EngineError::Ok) return record(err);
    return addObject(obj);
}

EngineError Editor::addCurve(const std::string& name, curve::CurveBasis basis, const std::vector<Vec2>& controls) {
    GraphicObject obj{};
    const EngineError err = makeCurve(name, basis, controls, curveSteps_, obj);
    if (err != EngineError::Ok) return record(err);
    return addObject(obj);
}

EngineError Editor::removeObjects(const std::vector<std::size_t>& indices) {
    return record(scene_.removeObjects(indices));
}

void Editor::clearScene() {
    scene_.clear();
    record(EngineError::Ok);
}

EngineError Editor::panWindow(double dx, double dy) {
    return record(scene_.translateWindow(Vec2{dx, dy}));
}

EngineError Editor::zoomWindow(double factor) {
    return record(scene_.zoomWindow(factor));
}

EngineError Editor::rotateWindow(double deltaDeg) {
    return record(scene_.rotateWindow(deltaDeg));
}

void Editor::beginDrag(double x, double y) noexcept {
    dragging_ = true;
    dragLast_ = Vec2{x, y};
}

EngineError Editor::dragTo(double x, double y) {
    if (!dragging_) return record(EngineError::InvalidOperation);
    const Vec2 current{x, y};
    const Vec2 delta = current - dragLast_;
    dragLast_ = current;
    return record(scene_.panByDevice(delta));
}

EngineError Editor::scroll(ScrollDirection direction) {
    const double factor = direction == ScrollDirection::Up
        ? editor_constants::SCROLL_ZOOM_IN
        : editor_constants::SCROLL_ZOOM_OUT;
    return record(scene_.zoomWindow(factor));
}

EngineError Editor::navigate(NavCommand command, const std::vector<std::size_t>& selection) {
    std::vector<std::size_t> targets = selection;
    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());
    if (!targets.empty() && targets.back() >= scene_.size()) return record(EngineError::IndexOutOfRange);

    const double step = editor_constants::NAV_MOVE_STEP;
    Vec2 frameOffset{};
    switch (command) {
        case NavCommand::MoveUp: frameOffset = Vec2{0.0, step}; break;
        case NavCommand::MoveDown: frameOffset = Vec2{0.0, -step}; break;
        case NavCommand::MoveLeft: frameOffset = Vec2{-step, 0.0}; break;
        case NavCommand::MoveRight: frameOffset = Vec2{step, 0.0}; break;
        default: break;
    }
    const Vec2 worldOffset = scene_.hasWindow() ? windowFrameToWorld(frameOffset, scene_.window()) : frameOffset;

    // Applied to a copy so a failure part way leaves the scene unchanged.
    Scene next = scene_;
    for (const std::size_t index : targets) {
        EngineError err = EngineError::Ok;
        switch (command) {
            case NavCommand::MoveUp:
            case NavCommand::MoveDown:
            case NavCommand::MoveLeft:
            case NavCommand::MoveRight:
                err = next.translateObject(index, worldOffset);
                break;
            case NavCommand::RotateLeft:
                err = next.rotateObject(index, editor_constants::NAV_ROTATE_STEP_DEG, rotationRef_, absolutePivot_);
                break;
            case NavCommand::RotateRight:
                err = next.rotateObject(index, -editor_constants::NAV_ROTATE_STEP_DEG, rotationRef_, absolutePivot_);
                break;
            case NavCommand::ZoomIn:
                err = next.scaleObject(index, editor_constants::NAV_SCALE_UP);
                break;
            case NavCommand::ZoomOut:
                err = next.scaleObject(index, editor_constants::NAV_SCALE_DOWN);
                break;
        }
        if (err != EngineError::Ok) return record(err);
    }
    scene_ = std::move(next);
    return record(EngineError::Ok);
}

EngineError Editor::render(DrawSink& sink, RenderStats* stats) const {
    if (!hasViewport_) return record(EngineError::InvalidOperation);
    RenderOptions options{};
    options.algorithm = algorithm_;
    options.pointRadius = editor_constants::POINT_RADIUS_PX;
    options.drawViewportFrame = drawFrame_;
    return record(renderScene(scene_, viewport(), options, sink, stats));
}

EngineError Editor::renderFrame() {
    frame_.clear();
    return render(frame_, &frameStats_);
}

EngineError Editor::ensureWindow() {
    if (scene_.hasWindow() || !hasViewport_) return EngineError::Ok;
    return scene_.resizeViewport(viewport());
}

EngineError Editor::loadSceneString(const std::string& text) {
    lastDiagnostic_ = ParseDiagnostic{};
    const EngineError err = decodeScene(text, scene_, &lastDiagnostic_, curveSteps_);
    if (err != EngineError::Ok) return record(err);
    return record(ensureWindow());
}

std::string Editor::saveSceneString() const {
    record(EngineError::Ok);
    return encodeScene(scene_);
}

EngineError Editor::loadSceneFile(const std::string& path) {
    lastDiagnostic_ = ParseDiagnostic{};
    const EngineError err = vgedit::loadSceneFile(path, scene_, &lastDiagnostic_, curveSteps_);
    if (err != EngineError::Ok) return record(err);
    return record(ensureWindow());
}

EngineError Editor::saveSceneFile(const std::string& path) {
    return record(vgedit::saveSceneFile(path, scene_));
}

} // namespace vgedit
