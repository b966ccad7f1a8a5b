#include "vgedit/curve/curve_tessellation.h"
#include "vgedit/core/logging.h"

namespace vgedit::curve {

namespace {

struct Coefficients {
    std::array<Vec2, 4> rows;
};

// C = M * G, where G holds four control points as rows.
Coefficients multiplyGeometry(const Mat4x4& m, const Vec2* g) noexcept {
    Coefficients c{};
    for (std::size_t r = 0; r < 4; ++r) {
        Vec2 acc{};
        for (std::size_t k = 0; k < 4; ++k) {
            acc += g[k] * m[r][k];
        }
        c.rows[r] = acc;
    }
    return c;
}

inline Vec2 evaluateCubic(const Coefficients& c, double t) noexcept {
    // Horner form of [t^3, t^2, t, 1] * C.
    return ((c.rows[0] * t + c.rows[1]) * t + c.rows[2]) * t + c.rows[3];
}

EngineError validateSteps(std::uint32_t steps, std::uint32_t minimum) noexcept {
    if (steps < minimum || steps > editor_constants::CURVE_STEPS_MAX) {
        VGEDIT_LOG_WARN("curve steps %u outside [%u, %u]", steps, minimum, editor_constants::CURVE_STEPS_MAX);
        return EngineError::ValidationError;
    }
    return EngineError::Ok;
}

} // namespace

const char* curveBasisName(CurveBasis basis) noexcept {
    switch (basis) {
        case CurveBasis::Bezier: return "bezier";
        case CurveBasis::BSpline: return "bspline";
        case CurveBasis::Polyline: return "polyline";
    }
    return "unknown";
}

const Mat4x4& bezierBasis() noexcept {
    static const Mat4x4 kBezier{{
        {{-1.0, 3.0, -3.0, 1.0}},
        {{3.0, -6.0, 3.0, 0.0}},
        {{-3.0, 3.0, 0.0, 0.0}},
        {{1.0, 0.0, 0.0, 0.0}},
    }};
    return kBezier;
}

const Mat4x4& bsplineBasis() noexcept {
    static const Mat4x4 kBSpline{{
        {{-1.0 / 6.0, 3.0 / 6.0, -3.0 / 6.0, 1.0 / 6.0}},
        {{3.0 / 6.0, -6.0 / 6.0, 3.0 / 6.0, 0.0}},
        {{-3.0 / 6.0, 0.0, 3.0 / 6.0, 0.0}},
        {{1.0 / 6.0, 4.0 / 6.0, 1.0 / 6.0, 0.0}},
    }};
    return kBSpline;
}

Mat4x4 forwardDifferenceMatrix(double delta) noexcept {
    const double d2 = delta * delta;
    const double d3 = d2 * delta;
    return Mat4x4{{
        {{0.0, 0.0, 0.0, 1.0}},
        {{d3, d2, delta, 0.0}},
        {{6.0 * d3, 2.0 * d2, 0.0, 0.0}},
        {{6.0 * d3, 0.0, 0.0, 0.0}},
    }};
}

EngineError validateControlCount(CurveBasis basis, std::size_t count) noexcept {
    switch (basis) {
        case CurveBasis::Bezier:
            if (count >= 4 && (count - 1) % 3 == 0) return EngineError::Ok;
            break;
        case CurveBasis::BSpline:
            if (count >= 4) return EngineError::Ok;
            break;
        case CurveBasis::Polyline:
            if (count >= 3) return EngineError::Ok;
            break;
    }
    VGEDIT_LOG_WARN("%zu control points do not form a %s curve", count, curveBasisName(basis));
    return EngineError::ValidationError;
}

std::size_t bezierSegmentCount(std::size_t controlCount) noexcept {
    return controlCount < 4 ? 0 : (controlCount - 1) / 3;
}

std::size_t bsplineSegmentCount(std::size_t controlCount) noexcept {
    return controlCount < 4 ? 0 : controlCount - 3;
}

EngineError CurveTessellator::tessellate(
    CurveBasis basis,
    const std::vector<Vec2>& controls,
    std::vector<Vec2>& out
) const {
    switch (basis) {
        case CurveBasis::Bezier: return tessellateBezier(controls, out);
        case CurveBasis::BSpline: return tessellateBSpline(controls, out);
        case CurveBasis::Polyline: {
            out.clear();
            const EngineError err = validateControlCount(basis, controls.size());
            if (err != EngineError::Ok) return err;
            out = controls;
            return EngineError::Ok;
        }
    }
    return EngineError::InvalidOperation;
}

EngineError CurveTessellator::tessellateBezier(const std::vector<Vec2>& controls, std::vector<Vec2>& out) const {
    out.clear();
    EngineError err = validateControlCount(CurveBasis::Bezier, controls.size());
    if (err != EngineError::Ok) return err;
    err = validateSteps(options_.steps, 2);
    if (err != EngineError::Ok) return err;

    const std::uint32_t n = options_.steps;
    const std::size_t segments = bezierSegmentCount(controls.size());
    out.reserve(segments * (n - 1) + 1);

    for (std::size_t s = 0; s < segments; ++s) {
        const std::size_t base = s * 3;
        const Coefficients c = multiplyGeometry(bezierBasis(), &controls[base]);
        // Segment joints are shared; later segments start at their second sample.
        const std::uint32_t first = s == 0 ? 0u : 1u;
        for (std::uint32_t i = first; i < n; ++i) {
            if (i == 0) {
                out.push_back(controls[base]);
            } else if (i == n - 1) {
                out.push_back(controls[base + 3]);
            } else {
                const double t = static_cast<double>(i) / static_cast<double>(n - 1);
                out.push_back(evaluateCubic(c, t));
            }
        }
    }
    return EngineError::Ok;
}

EngineError CurveTessellator::tessellateBSpline(const std::vector<Vec2>& controls, std::vector<Vec2>& out) const {
    out.clear();
    EngineError err = validateControlCount(CurveBasis::BSpline, controls.size());
    if (err != EngineError::Ok) return err;
    err = validateSteps(options_.steps, 1);
    if (err != EngineError::Ok) return err;

    const std::uint32_t n = options_.steps;
    const double delta = 1.0 / static_cast<double>(n);
    const Mat4x4 fd = forwardDifferenceMatrix(delta);
    const std::size_t windows = bsplineSegmentCount(controls.size());
    out.reserve(windows * n + 1);

    for (std::size_t w = 0; w < windows; ++w) {
        const Coefficients c = multiplyGeometry(bsplineBasis(), &controls[w]);
        Coefficients d{};
        for (std::size_t r = 0; r < 4; ++r) {
            Vec2 acc{};
            for (std::size_t k = 0; k < 4; ++k) {
                acc += c.rows[k] * fd[r][k];
            }
            d.rows[r] = acc;
        }

        Vec2 f = d.rows[0];
        Vec2 d1 = d.rows[1];
        Vec2 d2 = d.rows[2];
        const Vec2 d3 = d.rows[3];

        // The joint restarts from this window's exact start point instead of
        // the previous window's accumulated end.
        if (w == 0) {
            out.push_back(f);
        } else {
            out.back() = f;
        }
        for (std::uint32_t step = 0; step < n; ++step) {
            f += d1;
            d1 += d2;
            d2 += d3;
            out.push_back(f);
        }
    }
    return EngineError::Ok;
}

} // namespace vgedit::curve
