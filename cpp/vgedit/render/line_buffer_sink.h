#ifndef VGEDIT_RENDER_LINE_BUFFER_SINK_H
#define VGEDIT_RENDER_LINE_BUFFER_SINK_H

#include "vgedit/render/render.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vgedit {

struct PolylineRange {
    std::uint32_t offset; // float offset into polylineVertices
    std::uint32_t count;  // float count (2 per point)
    bool closed;
    bool filled;
};

// Collects draw calls into flat float buffers so a host can upload them
// without walking the scene.
class LineBufferSink : public DrawSink {
public:
    void drawLine(const Vec2& a, const Vec2& b) override;
    void drawPolyline(const std::vector<Vec2>& points, bool closed, bool filled) override;
    void drawArc(const Vec2& center, double radius) override;

    void clear() noexcept;

    // x0, y0, x1, y1 per segment.
    const std::vector<float>& segmentVertices() const noexcept { return segments_; }
    const std::vector<float>& polylineVertices() const noexcept { return polylines_; }
    const std::vector<PolylineRange>& polylineRanges() const noexcept { return ranges_; }
    // cx, cy, r per arc.
    const std::vector<float>& arcData() const noexcept { return arcs_; }

    std::size_t segmentCount() const noexcept { return segments_.size() / 4; }
    std::size_t polylineCount() const noexcept { return ranges_.size(); }
    std::size_t arcCount() const noexcept { return arcs_.size() / 3; }

private:
    std::vector<float> segments_;
    std::vector<float> polylines_;
    std::vector<PolylineRange> ranges_;
    std::vector<float> arcs_;
};

} // namespace vgedit

#endif // VGEDIT_RENDER_LINE_BUFFER_SINK_H
