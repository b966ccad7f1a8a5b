#include "vgedit/render/render.h"
#include "vgedit/core/logging.h"

#include <optional>

namespace vgedit {

namespace {

// Returns true if anything reached the sink.
bool renderObject(
    const GraphicObject& object,
    const std::vector<Vec2>& normalized,
    const Mat3& toDevice,
    const RenderOptions& options,
    DrawSink& sink
) {
    const ClipBounds bounds = ClipBounds::unit();

    switch (object.kind) {
        case ObjectKind::Point: {
            if (normalized.empty() || !clipPoint(normalized[0], bounds)) return false;
            sink.drawArc(transform(normalized[0], toDevice), options.pointRadius);
            return true;
        }
        case ObjectKind::Line: {
            if (normalized.size() < 2) return false;
            std::optional<Segment> clipped;
            if (clipLine(Segment{normalized[0], normalized[1]}, bounds, options.algorithm, clipped) != EngineError::Ok) {
                return false;
            }
            if (!clipped) return false;
            sink.drawLine(transform(clipped->start, toDevice), transform(clipped->end, toDevice));
            return true;
        }
        case ObjectKind::Polygon: {
            const std::vector<Vec2> clipped = clipPolygon(normalized, bounds);
            if (clipped.size() < 3) return false;
            sink.drawPolyline(transformed(clipped, toDevice), true, object.filled);
            return true;
        }
        case ObjectKind::Curve: {
            std::vector<Vec2> segments;
            if (clipCurve(normalized, bounds, options.algorithm, segments) != EngineError::Ok) return false;
            for (std::size_t i = 0; i + 1 < segments.size(); i += 2) {
                sink.drawLine(transform(segments[i], toDevice), transform(segments[i + 1], toDevice));
            }
            return !segments.empty();
        }
    }
    return false;
}

} // namespace

EngineError renderScene(
    const Scene& scene,
    const Viewport& viewport,
    const RenderOptions& options,
    DrawSink& sink,
    RenderStats* stats
) {
    if (stats) *stats = RenderStats{};
    if (!scene.hasWindow()) {
        VGEDIT_LOG_WARN("render requested without a window");
        return EngineError::InvalidOperation;
    }
    if (!viewport.isValid()) return EngineError::ValidationError;
    if (!isLineClipAlgorithmSupported(options.algorithm)) {
        VGEDIT_LOG_WARN("render with unsupported algorithm %s", lineClipAlgorithmName(options.algorithm));
        return EngineError::UnsupportedAlgorithm;
    }

    const Mat3 toDevice = viewportMatrix(viewport);
    RenderStats local{};
    for (std::size_t i = 0; i < scene.size(); ++i) {
        const bool drawn = renderObject(*scene.objectAt(i), *scene.normalizedAt(i), toDevice, options, sink);
        if (drawn) {
            ++local.drawn;
        } else {
            ++local.culled;
        }
    }

    if (options.drawViewportFrame) {
        const std::vector<Vec2> frame{
            viewport.min,
            Vec2{viewport.max.x, viewport.min.y},
            viewport.max,
            Vec2{viewport.min.x, viewport.max.y},
        };
        sink.drawPolyline(frame, true, false);
    }

    if (stats) *stats = local;
    return EngineError::Ok;
}

} // namespace vgedit
