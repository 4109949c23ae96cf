/**
 * @file    hit_tester.hpp
 * @brief   Pointer hit testing against boxes and corner handles
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include "core/annotation.hpp"
#include "core/coordinate_mapper.hpp"

#include <opencv2/core.hpp>
#include <cstddef>

namespace bxa {

enum class HitTarget {
    None,
    Handle,     // Corner handle of the selected box
    Body        // Inside a box (tolerance expanded)
};

struct HitResult {
    HitTarget target{HitTarget::None};
    std::size_t index{0};
    Corner corner{Corner::TopLeft};

    [[nodiscard]] bool hit() const noexcept { return target != HitTarget::None; }
};

/**
 * Radii in screen pixels
 */
struct HitTolerance {
    double body{8.0};       // Border expansion for box bodies
    double handle{8.0};     // Radius around each corner of the selected box
};

/**
 * Resolve a screen point to a handle, a box, or nothing.
 *
 * Handles of the selected box are tested first so that grabbing a corner
 * wins over starting a new box or selecting a box underneath. Bodies are
 * scanned top-most first, so the most recently added box wins overlaps.
 */
[[nodiscard]] HitResult hit_test(const cv::Point2d& screen,
                                 const AnnotationSet& set,
                                 const Selection& selection,
                                 const ViewTransform& view,
                                 const cv::Size& image_size,
                                 const HitTolerance& tolerance);

/**
 * Corner handle test for a single box
 * @return  true and the nearest corner when within radius
 */
[[nodiscard]] bool hit_test_handle(const cv::Point2d& screen,
                                   const ScreenRect& rect,
                                   double radius,
                                   Corner& out_corner) noexcept;

}  // namespace bxa
