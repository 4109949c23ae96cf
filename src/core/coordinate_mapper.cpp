/**
 * @file    coordinate_mapper.cpp
 * @brief   Screen <-> normalized image coordinate conversion
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/coordinate_mapper.hpp"

namespace bxa {

namespace {

[[nodiscard]] bool usable(const ViewTransform& view, const cv::Size& image_size) noexcept {
    return view.valid() && image_size.width > 0 && image_size.height > 0;
}

}  // anonymous namespace

cv::Point2d ScreenRect::corner(Corner c) const noexcept {
    switch (c) {
        case Corner::TopLeft:     return {left, top};
        case Corner::TopRight:    return {right, top};
        case Corner::BottomLeft:  return {left, bottom};
        case Corner::BottomRight: return {right, bottom};
    }
    return {left, top};
}

cv::Point2d screen_to_image(const cv::Point2d& screen, const ViewTransform& view) noexcept {
    if (!view.valid()) return {0.0, 0.0};
    return {
        (screen.x - view.pan.x) / view.zoom,
        (screen.y - view.pan.y) / view.zoom
    };
}

cv::Point2d image_to_screen(const cv::Point2d& image, const ViewTransform& view) noexcept {
    return {
        view.pan.x + image.x * view.zoom,
        view.pan.y + image.y * view.zoom
    };
}

cv::Point2d to_normalized(const cv::Point2d& screen,
                          const ViewTransform& view,
                          const cv::Size& image_size) noexcept {
    if (!usable(view, image_size)) return {0.0, 0.0};

    const cv::Point2d image = screen_to_image(screen, view);
    return {
        image.x / static_cast<double>(image_size.width),
        image.y / static_cast<double>(image_size.height)
    };
}

cv::Point2d to_screen(const cv::Point2d& normalized,
                      const ViewTransform& view,
                      const cv::Size& image_size) noexcept {
    return image_to_screen({
        normalized.x * static_cast<double>(image_size.width),
        normalized.y * static_cast<double>(image_size.height)
    }, view);
}

cv::Point2d screen_extent_to_normalized(double pixels,
                                        const ViewTransform& view,
                                        const cv::Size& image_size) noexcept {
    if (!usable(view, image_size)) return {0.0, 0.0};
    return {
        pixels / (static_cast<double>(image_size.width) * view.zoom),
        pixels / (static_cast<double>(image_size.height) * view.zoom)
    };
}

ScreenRect box_to_screen(const Box& box,
                         const ViewTransform& view,
                         const cv::Size& image_size) noexcept {
    const cv::Point2d tl = to_screen({box.left(), box.top()}, view, image_size);
    const cv::Point2d br = to_screen({box.right(), box.bottom()}, view, image_size);
    return ScreenRect{tl.x, tl.y, br.x, br.y};
}

}  // namespace bxa
