#include "vgedit/render/line_buffer_sink.h"

namespace vgedit {

void LineBufferSink::drawLine(const Vec2& a, const Vec2& b) {
    segments_.push_back(static_cast<float>(a.x));
    segments_.push_back(static_cast<float>(a.y));
    segments_.push_back(static_cast<float>(b.x));
    segments_.push_back(static_cast<float>(b.y));
}

void LineBufferSink::drawPolyline(const std::vector<Vec2>& points, bool closed, bool filled) {
    if (points.empty()) return;
    const std::uint32_t offset = static_cast<std::uint32_t>(polylines_.size());
    for (const Vec2& p : points) {
        polylines_.push_back(static_cast<float>(p.x));
        polylines_.push_back(static_cast<float>(p.y));
    }
    const std::uint32_t count = static_cast<std::uint32_t>(polylines_.size()) - offset;
    ranges_.push_back(PolylineRange{offset, count, closed, filled});
}

void LineBufferSink::drawArc(const Vec2& center, double radius) {
    arcs_.push_back(static_cast<float>(center.x));
    arcs_.push_back(static_cast<float>(center.y));
    arcs_.push_back(static_cast<float>(radius));
}

void LineBufferSink::clear() noexcept {
    segments_.clear();
    polylines_.clear();
    ranges_.clear();
    arcs_.clear();
}

} // namespace vgedit
