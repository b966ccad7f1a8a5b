#ifndef VGEDIT_SCENE_SCENE_H
#define VGEDIT_SCENE_SCENE_H

#include "vgedit/core/types.h"
#include "vgedit/entity/graphic_object.h"
#include "vgedit/view/coordinate_system.h"

#include <cstddef>
#include <vector>

namespace vgedit {

// Ordered display list plus the coordinate system it is viewed through.
//
// Every mutation leaves the normalized cache consistent with the current
// window before returning. Without a window the cache is empty.
class Scene {
public:
    Scene() = default;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    // nullptr when index is out of range.
    const GraphicObject* objectAt(std::size_t index) const noexcept;
    const std::vector<Vec2>* normalizedAt(std::size_t index) const noexcept;

    // Validates and appends. outIndex receives the display index.
    EngineError addObject(const GraphicObject& object, std::size_t* outIndex = nullptr);

    // Indices refer to the list before removal. Duplicates are ignored.
    // Any out-of-range index rejects the whole request.
    EngineError removeObjects(const std::vector<std::size_t>& indices);
    void clear() noexcept;

    const CoordinateSystem& coordinates() const noexcept { return coords_; }
    bool hasWindow() const noexcept { return coords_.hasWindow(); }
    const Window& window() const noexcept { return coords_.window(); }

    EngineError setWindow(const Window& window);
    void clearWindow();
    EngineError resizeViewport(const Viewport& viewport);

    EngineError translateWindow(const Vec2& offset);
    EngineError zoomWindow(double factor);
    EngineError rotateWindow(double deltaDeg);
    EngineError panByDevice(const Vec2& deviceDelta);

    EngineError transformObject(std::size_t index, const Mat3& matrix);
    EngineError translateObject(std::size_t index, const Vec2& offset);
    EngineError scaleObject(std::size_t index, double factor);
    EngineError rotateObject(std::size_t index, double angleDeg, RotationReference ref, const Vec2& absolutePivot);

    // Recomputes the normalized coordinates of every object.
    void updateNormalized();

private:
    struct Entry {
        GraphicObject object;
        std::vector<Vec2> normalized;
    };

    void normalizeEntry(Entry& entry, const Mat3& normalization) const;
    EngineError afterWindowChange(EngineError err);

    CoordinateSystem coords_{};
    std::vector<Entry> entries_;
};

} // namespace vgedit

#endif // VGEDIT_SCENE_SCENE_H
