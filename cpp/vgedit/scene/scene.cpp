#include "vgedit/scene/scene.h"
#include "vgedit/core/logging.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>

namespace vgedit {

const GraphicObject* Scene::objectAt(std::size_t index) const noexcept {
    if (index >= entries_.size()) return nullptr;
    return &entries_[index].object;
}

const std::vector<Vec2>* Scene::normalizedAt(std::size_t index) const noexcept {
    if (index >= entries_.size()) return nullptr;
    return &entries_[index].normalized;
}

EngineError Scene::addObject(const GraphicObject& object, std::size_t* outIndex) {
    const EngineError err = validateObject(object);
    if (err != EngineError::Ok) return err;

    Entry entry{object, {}};
    if (coords_.hasWindow()) normalizeEntry(entry, coords_.normalization());
    entries_.push_back(std::move(entry));
    if (outIndex) *outIndex = entries_.size() - 1;
    VGEDIT_LOG_DEBUG("added %s '%s' at %zu", objectKindName(object.kind), object.name.c_str(), entries_.size() - 1);
    return EngineError::Ok;
}

EngineError Scene::removeObjects(const std::vector<std::size_t>& indices) {
    std::vector<std::size_t> sorted = indices;
    std::sort(sorted.begin(), sorted.end(), std::greater<std::size_t>());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    if (!sorted.empty() && sorted.front() >= entries_.size()) {
        VGEDIT_LOG_WARN("remove index %zu out of range (size %zu)", sorted.front(), entries_.size());
        return EngineError::IndexOutOfRange;
    }

    // Highest index first so earlier removals do not shift later ones.
    for (const std::size_t index : sorted) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return EngineError::Ok;
}

void Scene::clear() noexcept {
    entries_.clear();
}

EngineError Scene::setWindow(const Window& window) {
    return afterWindowChange(coords_.setWindow(window));
}

void Scene::clearWindow() {
    coords_.clearWindow();
    updateNormalized();
}

EngineError Scene::resizeViewport(const Viewport& viewport) {
    return afterWindowChange(coords_.resizeViewport(viewport));
}

EngineError Scene::translateWindow(const Vec2& offset) {
    return afterWindowChange(coords_.translate(offset));
}

EngineError Scene::zoomWindow(double factor) {
    return afterWindowChange(coords_.zoom(factor));
}

EngineError Scene::rotateWindow(double deltaDeg) {
    return afterWindowChange(coords_.rotate(deltaDeg));
}

EngineError Scene::panByDevice(const Vec2& deviceDelta) {
    return afterWindowChange(coords_.panByDevice(deviceDelta));
}

EngineError Scene::transformObject(std::size_t index, const Mat3& matrix) {
    if (index >= entries_.size()) return EngineError::IndexOutOfRange;
    Entry& entry = entries_[index];
    const EngineError err = vgedit::transformObject(entry.object, matrix);
    if (err != EngineError::Ok) return err;
    normalizeEntry(entry, coords_.normalization());
    return EngineError::Ok;
}

EngineError Scene::translateObject(std::size_t index, const Vec2& offset) {
    if (index >= entries_.size()) return EngineError::IndexOutOfRange;
    Entry& entry = entries_[index];
    const EngineError err = vgedit::translateObject(entry.object, offset);
    if (err != EngineError::Ok) return err;
    normalizeEntry(entry, coords_.normalization());
    return EngineError::Ok;
}

EngineError Scene::scaleObject(std::size_t index, double factor) {
    if (index >= entries_.size()) return EngineError::IndexOutOfRange;
    Entry& entry = entries_[index];
    const EngineError err = vgedit::scaleObject(entry.object, factor);
    if (err != EngineError::Ok) return err;
    normalizeEntry(entry, coords_.normalization());
    return EngineError::Ok;
}

EngineError Scene::rotateObject(std::size_t index, double angleDeg, RotationReference ref, const Vec2& absolutePivot) {
    if (index >= entries_.size()) return EngineError::IndexOutOfRange;
    Entry& entry = entries_[index];
    const EngineError err = vgedit::rotateObject(entry.object, angleDeg, ref, absolutePivot);
    if (err != EngineError::Ok) return err;
    normalizeEntry(entry, coords_.normalization());
    return EngineError::Ok;
}

void Scene::updateNormalized() {
    const Mat3 normalization = coords_.normalization();
    for (Entry& entry : entries_) normalizeEntry(entry, normalization);
}

void Scene::normalizeEntry(Entry& entry, const Mat3& normalization) const {
    if (!coords_.hasWindow()) {
        entry.normalized.clear();
        return;
    }
    entry.normalized = transformed(entry.object.vertices, normalization);
}

EngineError Scene::afterWindowChange(EngineError err) {
    if (err != EngineError::Ok) return err;
    updateNormalized();
    return EngineError::Ok;
}

} // namespace vgedit
