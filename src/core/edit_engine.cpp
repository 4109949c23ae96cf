/**
 * @file    edit_engine.cpp
 * @brief   Box editing operations and pointer gesture state machine
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/edit_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace bxa {

namespace {

[[nodiscard]] cv::Point2d clamp01(const cv::Point2d& p) noexcept {
    return {std::clamp(p.x, 0.0, 1.0), std::clamp(p.y, 0.0, 1.0)};
}

[[nodiscard]] cv::Point2d corner_point(const Box& box, Corner corner) noexcept {
    switch (corner) {
        case Corner::TopLeft:     return {box.left(), box.top()};
        case Corner::TopRight:    return {box.right(), box.top()};
        case Corner::BottomLeft:  return {box.left(), box.bottom()};
        case Corner::BottomRight: return {box.right(), box.bottom()};
    }
    return {box.left(), box.top()};
}

[[nodiscard]] bool is_blank(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // anonymous namespace

EditEngine::EditEngine(AnnotationSet& set,
                       Selection& selection,
                       UndoStack& undo_stack,
                       ClassRegistry& registry,
                       const EditorSettings& settings)
    : m_set(set)
    , m_selection(selection)
    , m_undo(undo_stack)
    , m_registry(registry)
    , m_settings(settings)
{
}

// =============================================================================
// Pointer gestures
// =============================================================================

void EditEngine::press(const cv::Point2d& screen, const Viewport& viewport) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!viewport.usable()) {
        spdlog::debug("Press ignored: no usable viewport");
        return;
    }

    m_gesture = Gesture{};
    m_gesture.press_screen = screen;
    m_gesture.current_screen = screen;
    m_gesture.press_normalized = to_normalized(screen, viewport.transform, viewport.image_size);
    m_gesture.selection_before = m_selection.index;

    const HitResult hit = hit_test(screen, m_set, m_selection,
                                   viewport.transform, viewport.image_size, tolerance());

    switch (hit.target) {
        case HitTarget::Handle:
            m_gesture.box_at_press = m_set.at(hit.index);
            m_gesture.pinned = corner_point(m_gesture.box_at_press, opposite(hit.corner));
            m_selection.mode = InteractionMode::Resizing;
            m_selection.corner = hit.corner;
            break;

        case HitTarget::Body:
            m_gesture.box_at_press = m_set.at(hit.index);
            m_selection.index = hit.index;
            m_selection.mode = InteractionMode::Moving;
            break;

        case HitTarget::None:
            m_selection.clear();
            m_selection.mode = InteractionMode::Creating;
            break;
    }

    spdlog::debug("Press at ({:.1f}, {:.1f}) -> {}", screen.x, screen.y, to_string(m_selection.mode));
}

void EditEngine::drag(const cv::Point2d& screen, const Viewport& viewport) {
    if (m_selection.mode == InteractionMode::None || !viewport.usable()) {
        return;
    }

    m_gesture.current_screen = screen;

    if (m_selection.mode == InteractionMode::Creating) {
        return;
    }

    if (!m_selection.index || !m_set.contains(*m_selection.index)) {
        finish_gesture();
        return;
    }

    const std::size_t index = *m_selection.index;
    const cv::Point2d pointer = to_normalized(screen, viewport.transform, viewport.image_size);

    Box updated;
    if (m_selection.mode == InteractionMode::Moving) {
        updated = translated(m_gesture.box_at_press, pointer - m_gesture.press_normalized);
    } else {
        updated = resized(m_gesture.box_at_press, m_selection.corner, m_gesture.pinned,
                          clamp01(pointer), min_extent(viewport));
    }

    if (updated != m_set.at(index)) {
        m_set.replace(index, updated);
    }
}

bool EditEngine::release(const cv::Point2d& screen, const Viewport& viewport) {
    const InteractionMode mode = m_selection.mode;
    if (mode == InteractionMode::None) {
        return false;
    }

    drag(screen, viewport);

    if (mode == InteractionMode::Creating) {
        finish_gesture();
        return create_box_impl(m_gesture.press_screen, screen, viewport, m_gesture.selection_before);
    }

    bool changed = false;
    if (m_selection.index && m_set.contains(*m_selection.index)) {
        const std::size_t index = *m_selection.index;
        const Box& after = m_set.at(index);

        if (after != m_gesture.box_at_press) {
            if (mode == InteractionMode::Moving) {
                push(BoxMoved{index, m_gesture.box_at_press, after},
                     m_gesture.selection_before, m_registry.size());
            } else {
                push(BoxResized{index, m_gesture.box_at_press, after},
                     m_gesture.selection_before, m_registry.size());
            }
            changed = true;
        }
    }

    finish_gesture();
    return changed;
}

void EditEngine::cancel() {
    const InteractionMode mode = m_selection.mode;
    if ((mode == InteractionMode::Moving || mode == InteractionMode::Resizing) &&
        m_selection.index && m_set.contains(*m_selection.index) &&
        m_set.at(*m_selection.index) != m_gesture.box_at_press) {
        m_set.replace(*m_selection.index, m_gesture.box_at_press);
    }
    finish_gesture();
}

std::optional<ScreenRect> EditEngine::rubber_band() const noexcept {
    if (m_selection.mode != InteractionMode::Creating) {
        return std::nullopt;
    }
    const auto& a = m_gesture.press_screen;
    const auto& b = m_gesture.current_screen;
    return ScreenRect{std::min(a.x, b.x), std::min(a.y, b.y),
                      std::max(a.x, b.x), std::max(a.y, b.y)};
}

// =============================================================================
// Operations
// =============================================================================

bool EditEngine::create_box(const cv::Point2d& start, const cv::Point2d& end, const Viewport& viewport) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    return create_box_impl(start, end, viewport, m_selection.index);
}

bool EditEngine::create_box_impl(const cv::Point2d& start,
                                 const cv::Point2d& end,
                                 const Viewport& viewport,
                                 std::optional<std::size_t> selection_before) {
    if (!viewport.usable()) {
        return false;
    }

    const auto& view = viewport.transform;
    const auto& size = viewport.image_size;

    // Boxes never extend past the image
    const cv::Point2d n0 = clamp01(to_normalized(start, view, size));
    const cv::Point2d n1 = clamp01(to_normalized(end, view, size));

    const cv::Point2d s0 = to_screen(n0, view, size);
    const cv::Point2d s1 = to_screen(n1, view, size);
    const double pixel_w = std::abs(s1.x - s0.x);
    const double pixel_h = std::abs(s1.y - s0.y);

    if (pixel_w < m_settings.min_box_pixels || pixel_h < m_settings.min_box_pixels) {
        spdlog::debug("Box rejected: {:.1f}x{:.1f}px below {:.1f}px minimum",
                      pixel_w, pixel_h, m_settings.min_box_pixels);
        return false;
    }

    const std::size_t registry_size_before = m_registry.size();
    const ClassId class_id = class_for_new_box();

    const Box box = Box::from_edges(class_id,
                                    std::min(n0.x, n1.x), std::min(n0.y, n1.y),
                                    std::max(n0.x, n1.x), std::max(n0.y, n1.y));
    m_set.append(box);

    const std::size_t index = m_set.size() - 1;
    m_selection.clear();
    m_selection.index = index;

    push(BoxCreated{index}, selection_before, registry_size_before);

    spdlog::debug("Created box #{} class {} ({:.4f}, {:.4f}, {:.4f}, {:.4f})",
                  index, class_id, box.cx, box.cy, box.w, box.h);
    return true;
}

bool EditEngine::select_at(const cv::Point2d& screen, const Viewport& viewport) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!viewport.usable()) {
        return false;
    }

    const HitResult hit = hit_test(screen, m_set, m_selection,
                                   viewport.transform, viewport.image_size, tolerance());
    if (!hit.hit()) {
        m_selection.clear();
        return false;
    }

    m_selection.index = hit.index;
    return true;
}

bool EditEngine::move_selected(const cv::Point2d& screen_delta, const Viewport& viewport) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index) || !viewport.usable()) {
        return false;
    }

    const std::size_t index = *m_selection.index;
    const cv::Point2d unit = screen_extent_to_normalized(1.0, viewport.transform, viewport.image_size);

    const Box before = m_set.at(index);
    const Box after = translated(before, {screen_delta.x * unit.x, screen_delta.y * unit.y});
    if (after == before) {
        return false;
    }

    m_set.replace(index, after);
    push(BoxMoved{index, before, after}, index, m_registry.size());
    return true;
}

bool EditEngine::resize_selected(Corner corner, const cv::Point2d& screen, const Viewport& viewport) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index) || !viewport.usable()) {
        return false;
    }

    const std::size_t index = *m_selection.index;
    const Box before = m_set.at(index);
    const cv::Point2d pointer = clamp01(to_normalized(screen, viewport.transform, viewport.image_size));

    const Box after = resized(before, corner, corner_point(before, opposite(corner)),
                              pointer, min_extent(viewport));
    if (after == before) {
        return false;
    }

    m_set.replace(index, after);
    push(BoxResized{index, before, after}, index, m_registry.size());
    return true;
}

bool EditEngine::delete_selected() {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index)) {
        return false;
    }

    const std::size_t index = *m_selection.index;
    Box removed = m_set.erase(index);

    // The index now points at a different box (or past the end)
    m_selection.clear();

    push(BoxDeleted{index, removed}, index, m_registry.size());
    spdlog::debug("Deleted box #{}", index);
    return true;
}

bool EditEngine::duplicate_selected() {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index)) {
        return false;
    }

    const std::size_t index = *m_selection.index;
    const Box copy = m_set.at(index);
    m_set.insert(index + 1, copy);
    m_selection.index = index + 1;

    push(BoxDuplicated{index + 1}, index, m_registry.size());
    spdlog::debug("Duplicated box #{} -> #{}", index, index + 1);
    return true;
}

bool EditEngine::assign_class(ClassId id) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index)) {
        return false;
    }
    if (!m_registry.contains(id)) {
        spdlog::debug("Assign rejected: unknown class id {}", id);
        return false;
    }
    return assign_impl(id, m_registry.size());
}

bool EditEngine::assign_class_by_name(std::string_view token) {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }
    if (!m_selection.index || !m_set.contains(*m_selection.index) || is_blank(token)) {
        return false;
    }

    const std::size_t registry_size_before = m_registry.size();
    ClassId id = 0;
    try {
        id = m_registry.resolve(token);
    } catch (const std::out_of_range& e) {
        spdlog::debug("Assign rejected: {}", e.what());
        return false;
    }

    return assign_impl(id, registry_size_before);
}

bool EditEngine::assign_impl(ClassId id, std::size_t registry_size_before) {
    const std::size_t index = *m_selection.index;
    const Box before = m_set.at(index);
    if (before.class_id == id) {
        return false;
    }

    Box after = before;
    after.class_id = id;
    m_set.replace(index, after);

    push(ClassAssigned{index, before.class_id, id}, index, registry_size_before);
    spdlog::debug("Box #{} class {} -> {}", index, before.class_id, id);
    return true;
}

bool EditEngine::undo() {
    if (m_selection.mode != InteractionMode::None) {
        cancel();
    }

    const bool undone = m_undo.undo(m_set, m_selection, m_registry);

    // The class picked for new boxes may have been rolled back
    if (!m_registry.contains(m_current_class)) {
        m_current_class = 0;
    }
    return undone;
}

// =============================================================================
// Current class
// =============================================================================

bool EditEngine::set_current_class(ClassId id) {
    if (!m_registry.contains(id)) {
        return false;
    }
    m_current_class = id;
    return true;
}

void EditEngine::reset() noexcept {
    m_gesture = Gesture{};
    finish_gesture();
}

// =============================================================================
// Internal helpers
// =============================================================================

HitTolerance EditEngine::tolerance() const noexcept {
    return HitTolerance{m_settings.click_tolerance, m_settings.effective_handle_radius()};
}

cv::Point2d EditEngine::min_extent(const Viewport& viewport) const noexcept {
    return screen_extent_to_normalized(m_settings.min_box_pixels,
                                       viewport.transform, viewport.image_size);
}

ClassId EditEngine::class_for_new_box() {
    if (m_registry.empty()) {
        m_current_class = m_registry.add_explicit(kDefaultClassName);
        spdlog::info("No classes defined, using '{}'", kDefaultClassName);
    } else if (!m_registry.contains(m_current_class)) {
        m_current_class = 0;
    }
    return m_current_class;
}

void EditEngine::finish_gesture() noexcept {
    m_selection.mode = InteractionMode::None;
    m_selection.corner = Corner::TopLeft;
}

void EditEngine::push(UndoAction action,
                      std::optional<std::size_t> selection_before,
                      std::size_t registry_size_before) {
    m_undo.push(UndoEntry{std::move(action), selection_before, registry_size_before});
}

Box EditEngine::translated(const Box& box, const cv::Point2d& delta) noexcept {
    Box moved = box;
    moved.cx = std::clamp(box.cx + delta.x, 0.0, 1.0);
    moved.cy = std::clamp(box.cy + delta.y, 0.0, 1.0);
    return moved;
}

Box EditEngine::resized(const Box& box,
                        Corner corner,
                        const cv::Point2d& pinned,
                        const cv::Point2d& pointer,
                        const cv::Point2d& min) noexcept {
    // Direction the dragged corner extends from the pinned one when the
    // pointer sits exactly on the pinned axis
    const bool right_side = corner == Corner::TopRight || corner == Corner::BottomRight;
    const bool bottom_side = corner == Corner::BottomLeft || corner == Corner::BottomRight;

    const double dx = pointer.x - pinned.x;
    const double dy = pointer.y - pinned.y;
    const bool grow_right = dx > 0.0 || (dx == 0.0 && right_side);
    const bool grow_down = dy > 0.0 || (dy == 0.0 && bottom_side);

    // Clamp to the minimum size, never to zero
    const double w = std::max(std::abs(dx), min.x);
    const double h = std::max(std::abs(dy), min.y);

    const double left = grow_right ? pinned.x : pinned.x - w;
    const double top = grow_down ? pinned.y : pinned.y - h;

    return Box::from_edges(box.class_id, left, top, left + w, top + h);
}

}  // namespace bxa
