/**
 * @file    hit_tester.cpp
 * @brief   Pointer hit testing against boxes and corner handles
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/hit_tester.hpp"

#include <limits>

namespace bxa {

bool hit_test_handle(const cv::Point2d& screen,
                     const ScreenRect& rect,
                     double radius,
                     Corner& out_corner) noexcept {
    const double radius_sq = radius * radius;
    double best = std::numeric_limits<double>::max();
    bool found = false;

    for (int i = 0; i < kCornerCount; ++i) {
        const auto corner = static_cast<Corner>(i);
        const cv::Point2d p = rect.corner(corner);
        const double dx = screen.x - p.x;
        const double dy = screen.y - p.y;
        const double dist_sq = dx * dx + dy * dy;

        // Small boxes put several corners in range, take the closest
        if (dist_sq <= radius_sq && dist_sq < best) {
            best = dist_sq;
            out_corner = corner;
            found = true;
        }
    }

    return found;
}

HitResult hit_test(const cv::Point2d& screen,
                   const AnnotationSet& set,
                   const Selection& selection,
                   const ViewTransform& view,
                   const cv::Size& image_size,
                   const HitTolerance& tolerance) {
    HitResult result;

    if (selection.index && set.contains(*selection.index)) {
        const ScreenRect rect = box_to_screen(set.at(*selection.index), view, image_size);
        Corner corner{};
        if (hit_test_handle(screen, rect, tolerance.handle, corner)) {
            result.target = HitTarget::Handle;
            result.index = *selection.index;
            result.corner = corner;
            return result;
        }
    }

    const auto& boxes = set.boxes();
    for (std::size_t i = boxes.size(); i-- > 0;) {
        const ScreenRect rect = box_to_screen(boxes[i], view, image_size);
        if (rect.contains(screen, tolerance.body)) {
            result.target = HitTarget::Body;
            result.index = i;
            return result;
        }
    }

    return result;
}

}  // namespace bxa
