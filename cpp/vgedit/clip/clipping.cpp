#include "vgedit/clip/clipping.h"
#include "vgedit/core/editor_constants.h"
#include "vgedit/core/logging.h"

#include <algorithm>
#include <cmath>

namespace vgedit {

namespace {

enum class ClipEdge : std::uint8_t { Left, Right, Bottom, Top };

constexpr ClipEdge kSweepOrder[] = {ClipEdge::Left, ClipEdge::Right, ClipEdge::Bottom, ClipEdge::Top};

inline bool insideEdge(const Vec2& p, ClipEdge edge, const ClipBounds& b) noexcept {
    switch (edge) {
        case ClipEdge::Left: return p.x >= b.min.x;
        case ClipEdge::Right: return p.x <= b.max.x;
        case ClipEdge::Bottom: return p.y >= b.min.y;
        case ClipEdge::Top: return p.y <= b.max.y;
    }
    return false;
}

// Intersection of segment a->b with the boundary line of edge. Callers only
// ask when a and b straddle the boundary, so the relevant delta is non-zero;
// the zero branch keeps degenerate input finite.
Vec2 intersectEdge(const Vec2& a, const Vec2& b, ClipEdge edge, const ClipBounds& bounds) noexcept {
    const bool vertical = edge == ClipEdge::Left || edge == ClipEdge::Right;
    if (vertical) {
        const double x = edge == ClipEdge::Left ? bounds.min.x : bounds.max.x;
        const double dx = b.x - a.x;
        if (dx == 0.0) return Vec2{x, a.y};
        const double t = (x - a.x) / dx;
        if (t <= 0.0) return Vec2{x, a.y};
        if (t >= 1.0) return Vec2{x, b.y};
        return Vec2{x, a.y + t * (b.y - a.y)};
    }
    const double y = edge == ClipEdge::Bottom ? bounds.min.y : bounds.max.y;
    const double dy = b.y - a.y;
    if (dy == 0.0) return Vec2{a.x, y};
    const double t = (y - a.y) / dy;
    if (t <= 0.0) return Vec2{a.x, y};
    if (t >= 1.0) return Vec2{b.x, y};
    return Vec2{a.x + t * (b.x - a.x), y};
}

inline bool finiteSegment(const Segment& line) noexcept {
    return std::isfinite(line.start.x) && std::isfinite(line.start.y)
        && std::isfinite(line.end.x) && std::isfinite(line.end.y);
}

// Pulls a coordinate that rounding left just outside [lo, hi] back onto the
// bound, so a boundary hit never picks up a spurious outcode bit.
inline double snapToRange(double v, double lo, double hi) noexcept {
    const double tol = editor_constants::GEOMETRY_EPSILON * std::max({1.0, std::fabs(lo), std::fabs(hi)});
    if (v < lo && lo - v <= tol) return lo;
    if (v > hi && v - hi <= tol) return hi;
    return v;
}

inline void pushUnique(const Vec2& p, std::vector<Vec2>& out) {
    if (!out.empty() && nearlyEqual(out.back(), p, editor_constants::GEOMETRY_EPSILON)) return;
    out.push_back(p);
}

void clipAgainstEdge(
    const std::vector<Vec2>& input,
    std::vector<Vec2>& output,
    ClipEdge edge,
    const ClipBounds& bounds
) {
    output.clear();
    if (input.empty()) return;

    // Walking (prev, curr) starting from the wrap-around edge keeps the
    // original vertex order for polygons that are already inside.
    Vec2 prev = input.back();
    bool prevInside = insideEdge(prev, edge, bounds);
    for (const Vec2& curr : input) {
        const bool currInside = insideEdge(curr, edge, bounds);
        if (currInside) {
            if (!prevInside) pushUnique(intersectEdge(prev, curr, edge, bounds), output);
            pushUnique(curr, output);
        } else if (prevInside) {
            pushUnique(intersectEdge(prev, curr, edge, bounds), output);
        }
        prev = curr;
        prevInside = currInside;
    }
    while (output.size() > 1 && nearlyEqual(output.front(), output.back(), editor_constants::GEOMETRY_EPSILON)) {
        output.pop_back();
    }
}

} // namespace

const char* lineClipAlgorithmName(LineClipAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case LineClipAlgorithm::CohenSutherland: return "Cohen-Sutherland";
        case LineClipAlgorithm::LiangBarsky: return "Liang-Barsky";
        case LineClipAlgorithm::Skala: return "Skala";
        case LineClipAlgorithm::NichollLeeNicholl: return "Nicholl-Lee-Nicholl";
    }
    return "Unknown";
}

bool isLineClipAlgorithmSupported(LineClipAlgorithm algorithm) noexcept {
    return algorithm == LineClipAlgorithm::CohenSutherland || algorithm == LineClipAlgorithm::LiangBarsky;
}

std::uint8_t computeOutcode(const Vec2& p, const ClipBounds& bounds) noexcept {
    std::uint8_t code = OutcodeInside;
    if (p.x < bounds.min.x) {
        code |= OutcodeLeft;
    } else if (p.x > bounds.max.x) {
        code |= OutcodeRight;
    }
    if (p.y < bounds.min.y) {
        code |= OutcodeBottom;
    } else if (p.y > bounds.max.y) {
        code |= OutcodeTop;
    }
    return code;
}

bool clipPoint(const Vec2& p, const ClipBounds& bounds) noexcept {
    return p.x >= bounds.min.x && p.x <= bounds.max.x && p.y >= bounds.min.y && p.y <= bounds.max.y;
}

std::optional<Segment> clipLineCohenSutherland(const Segment& line, const ClipBounds& bounds, int maxIterations) {
    if (!finiteSegment(line)) return std::nullopt;

    // Hits are always interpolated along the input segment, never from an
    // already clipped endpoint, so rounding does not accumulate.
    const Vec2 a = line.start;
    const double dx = line.end.x - a.x;
    const double dy = line.end.y - a.y;

    Vec2 p0 = line.start;
    Vec2 p1 = line.end;
    std::uint8_t code0 = computeOutcode(p0, bounds);
    std::uint8_t code1 = computeOutcode(p1, bounds);

    for (int iteration = 0; iteration < maxIterations; ++iteration) {
        if ((code0 | code1) == OutcodeInside) return Segment{p0, p1};
        if ((code0 & code1) != 0) return std::nullopt;

        const bool clipStart = code0 != OutcodeInside;
        const std::uint8_t code = clipStart ? code0 : code1;

        Vec2 hit;
        if (code & OutcodeTop) {
            if (dy == 0.0) return std::nullopt;
            const double x = a.x + (dx / dy) * (bounds.max.y - a.y);
            hit = Vec2{snapToRange(x, bounds.min.x, bounds.max.x), bounds.max.y};
        } else if (code & OutcodeBottom) {
            if (dy == 0.0) return std::nullopt;
            const double x = a.x + (dx / dy) * (bounds.min.y - a.y);
            hit = Vec2{snapToRange(x, bounds.min.x, bounds.max.x), bounds.min.y};
        } else if (code & OutcodeRight) {
            if (dx == 0.0) return std::nullopt;
            const double y = a.y + (dy / dx) * (bounds.max.x - a.x);
            hit = Vec2{bounds.max.x, snapToRange(y, bounds.min.y, bounds.max.y)};
        } else {
            if (dx == 0.0) return std::nullopt;
            const double y = a.y + (dy / dx) * (bounds.min.x - a.x);
            hit = Vec2{bounds.min.x, snapToRange(y, bounds.min.y, bounds.max.y)};
        }

        if (clipStart) {
            p0 = hit;
            code0 = computeOutcode(p0, bounds);
        } else {
            p1 = hit;
            code1 = computeOutcode(p1, bounds);
        }
    }

    VGEDIT_LOG_WARN("cohen-sutherland hit iteration cap for (%g,%g)-(%g,%g)",
        line.start.x, line.start.y, line.end.x, line.end.y);
    return std::nullopt;
}

std::optional<Segment> clipLineLiangBarsky(const Segment& line, const ClipBounds& bounds) {
    if (!finiteSegment(line)) return std::nullopt;
    const double x0 = line.start.x;
    const double y0 = line.start.y;

    const double p1 = x0 - line.end.x;
    const double p2 = -p1;
    const double p3 = y0 - line.end.y;
    const double p4 = -p3;

    const double q1 = x0 - bounds.min.x;
    const double q2 = bounds.max.x - x0;
    const double q3 = y0 - bounds.min.y;
    const double q4 = bounds.max.y - y0;

    double tEntry = 0.0;
    double tExit = 1.0;

    if (p1 == 0.0) {
        // Vertical line: only the x position decides.
        if (q1 < 0.0 || q2 < 0.0) return std::nullopt;
    } else {
        const double r1 = q1 / p1;
        const double r2 = q2 / p2;
        if (p1 < 0.0) {
            tEntry = std::max(tEntry, r1);
            tExit = std::min(tExit, r2);
        } else {
            tEntry = std::max(tEntry, r2);
            tExit = std::min(tExit, r1);
        }
    }

    if (p3 == 0.0) {
        if (q3 < 0.0 || q4 < 0.0) return std::nullopt;
    } else {
        const double r3 = q3 / p3;
        const double r4 = q4 / p4;
        if (p3 < 0.0) {
            tEntry = std::max(tEntry, r3);
            tExit = std::min(tExit, r4);
        } else {
            tEntry = std::max(tEntry, r4);
            tExit = std::min(tExit, r3);
        }
    }

    if (tEntry > tExit) return std::nullopt;

    // Untouched ends are returned bit-exact.
    const Vec2 start = tEntry == 0.0 ? line.start : Vec2{x0 + p2 * tEntry, y0 + p4 * tEntry};
    const Vec2 end = tExit == 1.0 ? line.end : Vec2{x0 + p2 * tExit, y0 + p4 * tExit};
    return Segment{start, end};
}

EngineError clipLine(
    const Segment& line,
    const ClipBounds& bounds,
    LineClipAlgorithm algorithm,
    std::optional<Segment>& out
) {
    out.reset();
    if (!isLineClipAlgorithmSupported(algorithm)) {
        VGEDIT_LOG_WARN("line clip algorithm %s is not supported", lineClipAlgorithmName(algorithm));
        return EngineError::UnsupportedAlgorithm;
    }
    if (!finiteSegment(line)) {
        VGEDIT_LOG_WARN("rejecting non-finite segment (%g,%g)-(%g,%g)",
            line.start.x, line.start.y, line.end.x, line.end.y);
        return EngineError::ValidationError;
    }
    out = algorithm == LineClipAlgorithm::CohenSutherland
        ? clipLineCohenSutherland(line, bounds)
        : clipLineLiangBarsky(line, bounds);
    return EngineError::Ok;
}

std::vector<Vec2> clipPolygon(const std::vector<Vec2>& vertices, const ClipBounds& bounds) {
    std::vector<Vec2> current = vertices;
    std::vector<Vec2> next;
    next.reserve(vertices.size() + 4);

    for (ClipEdge edge : kSweepOrder) {
        clipAgainstEdge(current, next, edge, bounds);
        current.swap(next);
        if (current.empty()) break;
    }

    // Anything under three vertices only touches the bounds.
    if (current.size() < 3) current.clear();
    return current;
}

std::vector<Vec2> clipPolygonToWindow(const std::vector<Vec2>& worldVertices, const Window& window) {
    return clipPolygon(toWindowLocal(worldVertices, window), ClipBounds::fromWindow(window));
}

EngineError clipCurve(
    const std::vector<Vec2>& vertices,
    const ClipBounds& bounds,
    LineClipAlgorithm algorithm,
    std::vector<Vec2>& outSegmentPoints
) {
    outSegmentPoints.clear();
    if (!isLineClipAlgorithmSupported(algorithm)) {
        VGEDIT_LOG_WARN("curve clip with unsupported algorithm %s", lineClipAlgorithmName(algorithm));
        return EngineError::UnsupportedAlgorithm;
    }

    std::optional<Segment> clipped;
    for (std::size_t i = 1; i < vertices.size(); ++i) {
        const EngineError err = clipLine(Segment{vertices[i - 1], vertices[i]}, bounds, algorithm, clipped);
        if (err != EngineError::Ok) return err;
        if (!clipped) continue;
        outSegmentPoints.push_back(clipped->start);
        outSegmentPoints.push_back(clipped->end);
    }
    return EngineError::Ok;
}

} // namespace vgedit
