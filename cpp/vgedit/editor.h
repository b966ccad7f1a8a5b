#pragma once

#include "vgedit/clip/clipping.h"
#include "vgedit/core/editor_constants.h"
#include "vgedit/core/types.h"
#include "vgedit/curve/curve_tessellation.h"
#include "vgedit/entity/graphic_object.h"
#include "vgedit/persistence/scene_codec.h"
#include "vgedit/render/line_buffer_sink.h"
#include "vgedit/render/render.h"
#include "vgedit/scene/scene.h"
#include "vgedit/view/coordinate_system.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vgedit {

// Editor context: the scene plus every piece of UI state the pipeline needs
// (viewport, clip algorithm, rotation reference, curve resolution).
//
// Operations return their status and also record it in lastError() so a
// host that only polls can still see the failure.
class Editor {
public:
    enum class NavCommand : std::uint8_t {
        MoveUp = 0,
        MoveDown = 1,
        MoveLeft = 2,
        MoveRight = 3,
        RotateLeft = 4,
        RotateRight = 5,
        ZoomIn = 6,
        ZoomOut = 7,
    };

    enum class ScrollDirection : std::uint8_t { Up = 0, Down = 1 };

    Editor() = default;

    EngineError lastError() const noexcept { return lastError_; }
    const ParseDiagnostic& lastDiagnostic() const noexcept { return lastDiagnostic_; }

    const Scene& scene() const noexcept { return scene_; }
    std::size_t objectCount() const noexcept { return scene_.size(); }
    bool hasViewport() const noexcept { return hasViewport_; }
    const Viewport& viewport() const noexcept { return scene_.coordinates().viewport(); }

    // Drawing surface size in device units. The viewport is the surface
    // minus VIEWPORT_MARGIN_PX on every side.
    EngineError setViewportSize(double width, double height);

    LineClipAlgorithm clipAlgorithm() const noexcept { return algorithm_; }
    EngineError setClipAlgorithm(LineClipAlgorithm algorithm);

    RotationReference rotationReference() const noexcept { return rotationRef_; }
    void setRotationReference(RotationReference ref) noexcept { rotationRef_ = ref; }
    const Vec2& absolutePivot() const noexcept { return absolutePivot_; }
    void setAbsolutePivot(const Vec2& pivot) noexcept { absolutePivot_ = pivot; }

    std::uint32_t curveSteps() const noexcept { return curveSteps_; }
    EngineError setCurveSteps(std::uint32_t steps);

    bool drawViewportFrame() const noexcept { return drawFrame_; }
    void setDrawViewportFrame(bool enabled) noexcept { drawFrame_ = enabled; }

    EngineError addPoint(const std::string& name, double x, double y);
    EngineError addLine(const std::string& name, double x0, double y0, double x1, double y1);
    EngineError addPolygon(const std::string& name, const std::vector<Vec2>& vertices, bool filled);
    EngineError addCurve(const std::string& name, curve::CurveBasis basis, const std::vector<Vec2>& controls);
    EngineError removeObjects(const std::vector<std::size_t>& indices);
    void clearScene();

    // Window navigation. offset is in world units.
    EngineError panWindow(double dx, double dy);
    EngineError zoomWindow(double factor);
    EngineError rotateWindow(double deltaDeg);

    // Pointer drag pans the window so the content follows the cursor.
    void beginDrag(double x, double y) noexcept;
    EngineError dragTo(double x, double y);
    void endDrag() noexcept { dragging_ = false; }
    bool isDragging() const noexcept { return dragging_; }

    EngineError scroll(ScrollDirection direction);

    // Applies one navigation step to every selected object. Moves are
    // expressed in the window frame, so "up" follows the rotated window.
    EngineError navigate(NavCommand command, const std::vector<std::size_t>& selection);

    EngineError render(DrawSink& sink, RenderStats* stats = nullptr) const;
    // Renders into the internal frame buffers exposed to hosts.
    EngineError renderFrame();
    const LineBufferSink& frame() const noexcept { return frame_; }
    const RenderStats& frameStats() const noexcept { return frameStats_; }

    EngineError loadSceneString(const std::string& text);
    std::string saveSceneString() const;
    EngineError loadSceneFile(const std::string& path);
    EngineError saveSceneFile(const std::string& path);

private:
    EngineError record(EngineError err) const noexcept {
        lastError_ = err;
        return err;
    }
    EngineError addObject(const GraphicObject& object);
    EngineError ensureWindow();

    Scene scene_{};
    LineClipAlgorithm algorithm_{LineClipAlgorithm::CohenSutherland};
    RotationReference rotationRef_{RotationReference::Center};
    Vec2 absolutePivot_{};
    std::uint32_t curveSteps_{editor_constants::CURVE_STEPS};
    bool drawFrame_{false};
    bool hasViewport_{false};

    bool dragging_{false};
    Vec2 dragLast_{};

    LineBufferSink frame_{};
    RenderStats frameStats_{};

    mutable EngineError lastError_{EngineError::Ok};
    ParseDiagnostic lastDiagnostic_{};
};

} // namespace vgedit
