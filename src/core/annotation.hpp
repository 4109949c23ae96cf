/**
 * @file    annotation.hpp
 * @brief   Bounding-box annotation model
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Box geometry is normalized to image fractions and center based,
 * matching the darknet/YOLO label format:
 *   cx, cy  box center   (0..1)
 *   w, h    box extent   (0..1)
 */

#pragma once

#include "core/class_registry.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bxa {

// =============================================================================
// Box
// =============================================================================

struct Box {
    ClassId class_id{0};
    double cx{0.0};
    double cy{0.0};
    double w{0.0};
    double h{0.0};

    [[nodiscard]] double left() const noexcept { return cx - w * 0.5; }
    [[nodiscard]] double right() const noexcept { return cx + w * 0.5; }
    [[nodiscard]] double top() const noexcept { return cy - h * 0.5; }
    [[nodiscard]] double bottom() const noexcept { return cy + h * 0.5; }

    [[nodiscard]] bool has_area() const noexcept { return w > 0.0 && h > 0.0; }

    [[nodiscard]] static Box from_edges(ClassId id, double l, double t, double r, double b) noexcept {
        return Box{id, (l + r) * 0.5, (t + b) * 0.5, r - l, b - t};
    }

    friend bool operator==(const Box&, const Box&) = default;
};

// =============================================================================
// Corners / Interaction
// =============================================================================

/**
 * Corner handle index, in the order the hit tester reports them
 */
enum class Corner : int {
    TopLeft = 0,
    TopRight = 1,
    BottomLeft = 2,
    BottomRight = 3
};

inline constexpr int kCornerCount = 4;

[[nodiscard]] constexpr Corner opposite(Corner c) noexcept {
    switch (c) {
        case Corner::TopLeft:     return Corner::BottomRight;
        case Corner::TopRight:    return Corner::BottomLeft;
        case Corner::BottomLeft:  return Corner::TopRight;
        case Corner::BottomRight: return Corner::TopLeft;
    }
    return Corner::TopLeft;
}

enum class InteractionMode {
    None,
    Creating,
    Moving,
    Resizing
};

[[nodiscard]] constexpr std::string_view to_string(InteractionMode mode) noexcept {
    switch (mode) {
        case InteractionMode::None:     return "None";
        case InteractionMode::Creating: return "Creating";
        case InteractionMode::Moving:   return "Moving";
        case InteractionMode::Resizing: return "Resizing";
        default:                         return "Unknown";
    }
}

/**
 * Active box plus the gesture in progress.
 *
 * The index is a plain position into the AnnotationSet, it does not track
 * the box. Anything that removes boxes must clear or fix it up.
 */
struct Selection {
    std::optional<std::size_t> index;
    InteractionMode mode{InteractionMode::None};
    Corner corner{Corner::TopLeft};     // Meaningful only while Resizing

    [[nodiscard]] bool has_box() const noexcept { return index.has_value(); }

    void clear() noexcept {
        index.reset();
        mode = InteractionMode::None;
        corner = Corner::TopLeft;
    }
};

// =============================================================================
// AnnotationSet
// =============================================================================

/**
 * Boxes of one image. Order is stacking order: later boxes are drawn on
 * top and win overlapping hit tests.
 */
class AnnotationSet {
public:
    AnnotationSet() = default;
    explicit AnnotationSet(std::vector<Box> boxes) : m_boxes(std::move(boxes)) {}

    [[nodiscard]] std::size_t size() const noexcept { return m_boxes.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_boxes.empty(); }
    [[nodiscard]] const std::vector<Box>& boxes() const noexcept { return m_boxes; }

    [[nodiscard]] const Box& at(std::size_t index) const { return m_boxes.at(index); }
    [[nodiscard]] bool contains(std::size_t index) const noexcept { return index < m_boxes.size(); }

    void append(const Box& box);
    void insert(std::size_t index, const Box& box);
    Box erase(std::size_t index);
    void replace(std::size_t index, const Box& box);

    /**
     * Replace all boxes without marking dirty (file load)
     */
    void reset(std::vector<Box> boxes);

    [[nodiscard]] bool is_dirty() const noexcept { return m_dirty; }
    void mark_dirty() noexcept { m_dirty = true; }
    void mark_clean() noexcept { m_dirty = false; }

private:
    std::vector<Box> m_boxes;
    bool m_dirty{false};
};

}  // namespace bxa
