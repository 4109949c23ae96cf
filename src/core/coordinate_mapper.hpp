/**
 * @file    coordinate_mapper.hpp
 * @brief   Screen <-> normalized image coordinate conversion
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * The viewport transform is owned by the GUI shell and passed in on every
 * call. It places the image origin at `pan` (screen pixels) and scales one
 * image pixel to `zoom` screen pixels:
 *
 *   screen = pan + normalized * image_size * zoom
 *
 * All interaction thresholds (drag minimum, handle radius, click tolerance)
 * are screen pixels and go through screen_extent_to_normalized() so they
 * look the same at every zoom level.
 */

#pragma once

#include "core/annotation.hpp"

#include <opencv2/core.hpp>

namespace bxa {

/**
 * Viewport transform supplied by the shell
 */
struct ViewTransform {
    double zoom{1.0};               // Screen pixels per image pixel
    cv::Point2d pan{0.0, 0.0};      // Screen position of the image top-left

    [[nodiscard]] bool valid() const noexcept { return zoom >= 1e-6; }
};

/**
 * Screen rectangle of a box, in screen pixels
 */
struct ScreenRect {
    double left{0.0};
    double top{0.0};
    double right{0.0};
    double bottom{0.0};

    [[nodiscard]] double width() const noexcept { return right - left; }
    [[nodiscard]] double height() const noexcept { return bottom - top; }

    [[nodiscard]] bool contains(const cv::Point2d& p, double tolerance = 0.0) const noexcept {
        return p.x >= left - tolerance && p.x <= right + tolerance &&
               p.y >= top - tolerance && p.y <= bottom + tolerance;
    }

    [[nodiscard]] cv::Point2d corner(Corner c) const noexcept;
};

// Image pixel space
[[nodiscard]] cv::Point2d screen_to_image(const cv::Point2d& screen,
                                          const ViewTransform& view) noexcept;
[[nodiscard]] cv::Point2d image_to_screen(const cv::Point2d& image,
                                          const ViewTransform& view) noexcept;

// Normalized (0..1) image-fraction space
[[nodiscard]] cv::Point2d to_normalized(const cv::Point2d& screen,
                                        const ViewTransform& view,
                                        const cv::Size& image_size) noexcept;
[[nodiscard]] cv::Point2d to_screen(const cv::Point2d& normalized,
                                    const ViewTransform& view,
                                    const cv::Size& image_size) noexcept;

/**
 * Convert a screen-pixel distance to normalized units on each axis
 */
[[nodiscard]] cv::Point2d screen_extent_to_normalized(double pixels,
                                                      const ViewTransform& view,
                                                      const cv::Size& image_size) noexcept;

/**
 * Project a box to screen space
 */
[[nodiscard]] ScreenRect box_to_screen(const Box& box,
                                       const ViewTransform& view,
                                       const cv::Size& image_size) noexcept;

}  // namespace bxa
