#pragma once

#include <cstdint>

/**
 * @file editor_constants.h
 * @brief Tunables for the editor pipeline.
 *
 * Device units are viewport pixels. World units are whatever the scene file
 * uses. Navigation commands are expressed in the window's own frame.
 */

namespace vgedit::editor_constants {

// =============================================================================
// Viewport
// =============================================================================

/// Margin removed from every side of the drawing surface before mapping NDC.
constexpr double VIEWPORT_MARGIN_PX = 10.0;

/// Radius used when a point is drawn as an arc.
constexpr double POINT_RADIUS_PX = 1.0;

// =============================================================================
// Curves
// =============================================================================

/// Samples per Bezier segment / forward-difference steps per B-spline window.
constexpr std::uint32_t CURVE_STEPS = 20;

/// Upper bound accepted for curve steps (keeps tessellation bounded).
constexpr std::uint32_t CURVE_STEPS_MAX = 4096;

// =============================================================================
// Navigation (selection transforms and window)
// =============================================================================

/// Move step for the up/down/left/right commands, in window-frame units.
constexpr double NAV_MOVE_STEP = 10.0;

/// Rotation step for rotate-left/rotate-right, in degrees.
constexpr double NAV_ROTATE_STEP_DEG = 5.0;

constexpr double NAV_SCALE_UP = 1.1;
constexpr double NAV_SCALE_DOWN = 0.9;

/// Scroll zoom: < 1 shrinks the window (zooms in), > 1 grows it.
constexpr double SCROLL_ZOOM_IN = 0.5;
constexpr double SCROLL_ZOOM_OUT = 2.0;

// =============================================================================
// Numerics
// =============================================================================

/// Hard cap on Cohen-Sutherland endpoint replacements for one segment.
/// Each endpoint needs at most two, so anything beyond this is oscillation.
constexpr int COHEN_SUTHERLAND_MAX_ITERATIONS = 16;

/// Tolerance used when comparing geometry for degeneracy.
constexpr double GEOMETRY_EPSILON = 1e-12;

} // namespace vgedit::editor_constants
