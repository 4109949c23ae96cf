/**
 * @file    edit_engine.hpp
 * @brief   Box editing operations and pointer gesture state machine
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * All pointer input is in screen pixels together with the viewport
 * transform the shell rendered with. Every committed mutation pushes
 * exactly one undo entry; rejected operations are silent no-ops.
 *
 * Gesture flow:
 *   press    handle of selected box -> resize (opposite corner pinned)
 *            body of a box          -> select it, move
 *            nothing                -> clear selection, rubber-band create
 *   drag     live update
 *   release  commit (one undo entry if anything changed)
 *   cancel   restore the box as it was at press
 */

#pragma once

#include "core/annotation.hpp"
#include "core/class_registry.hpp"
#include "core/coordinate_mapper.hpp"
#include "core/hit_tester.hpp"
#include "core/settings.hpp"
#include "core/undo_stack.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string_view>

namespace bxa {

/**
 * Viewport the pointer coordinates were taken in
 */
struct Viewport {
    ViewTransform transform;
    cv::Size image_size;

    [[nodiscard]] bool usable() const noexcept {
        return transform.valid() && image_size.width > 0 && image_size.height > 0;
    }
};

class EditEngine {
public:
    /**
     * All references must outlive the engine
     */
    EditEngine(AnnotationSet& set,
               Selection& selection,
               UndoStack& undo_stack,
               ClassRegistry& registry,
               const EditorSettings& settings);

    // Non-copyable (holds references)
    EditEngine(const EditEngine&) = delete;
    EditEngine& operator=(const EditEngine&) = delete;

    // ==========================================================================
    // Pointer gestures
    // ==========================================================================

    void press(const cv::Point2d& screen, const Viewport& viewport);
    void drag(const cv::Point2d& screen, const Viewport& viewport);

    /**
     * Finish the current gesture
     * @return  true if the annotation set was changed
     */
    bool release(const cv::Point2d& screen, const Viewport& viewport);

    void cancel();

    [[nodiscard]] InteractionMode mode() const noexcept { return m_selection.mode; }

    /**
     * Rubber band of a create gesture in progress, in screen pixels
     */
    [[nodiscard]] std::optional<ScreenRect> rubber_band() const noexcept;

    // ==========================================================================
    // Operations
    // ==========================================================================

    /**
     * Create a box from two screen corners
     * @return  false if either side is below min_box_pixels
     */
    bool create_box(const cv::Point2d& start, const cv::Point2d& end, const Viewport& viewport);

    /**
     * Select the box under the pointer, or clear the selection
     * @return  true if a box is now selected
     */
    bool select_at(const cv::Point2d& screen, const Viewport& viewport);

    /**
     * Translate the selected box by a screen-pixel offset (keyboard nudge)
     */
    bool move_selected(const cv::Point2d& screen_delta, const Viewport& viewport);

    /**
     * Drag one corner of the selected box to a screen position
     */
    bool resize_selected(Corner corner, const cv::Point2d& screen, const Viewport& viewport);

    bool delete_selected();
    bool duplicate_selected();

    bool assign_class(ClassId id);

    /**
     * Assign by token; unknown names are added to the registry
     */
    bool assign_class_by_name(std::string_view token);

    bool undo();

    // ==========================================================================
    // Class used for new boxes
    // ==========================================================================

    [[nodiscard]] ClassId current_class() const noexcept { return m_current_class; }
    bool set_current_class(ClassId id);

    /**
     * Forget the gesture without touching boxes (image switched)
     */
    void reset() noexcept;

private:
    struct Gesture {
        cv::Point2d press_screen{0.0, 0.0};
        cv::Point2d current_screen{0.0, 0.0};
        cv::Point2d press_normalized{0.0, 0.0};
        cv::Point2d pinned{0.0, 0.0};               // Fixed corner while resizing
        Box box_at_press;
        std::optional<std::size_t> selection_before;
    };

    [[nodiscard]] HitTolerance tolerance() const noexcept;
    [[nodiscard]] cv::Point2d min_extent(const Viewport& viewport) const noexcept;

    ClassId class_for_new_box();
    bool create_box_impl(const cv::Point2d& start, const cv::Point2d& end,
                         const Viewport& viewport, std::optional<std::size_t> selection_before);
    bool assign_impl(ClassId id, std::size_t registry_size_before);
    void finish_gesture() noexcept;
    void push(UndoAction action, std::optional<std::size_t> selection_before,
              std::size_t registry_size_before);

    [[nodiscard]] static Box translated(const Box& box, const cv::Point2d& delta) noexcept;
    [[nodiscard]] static Box resized(const Box& box, Corner corner, const cv::Point2d& pinned,
                                     const cv::Point2d& pointer, const cv::Point2d& min) noexcept;

    AnnotationSet& m_set;
    Selection& m_selection;
    UndoStack& m_undo;
    ClassRegistry& m_registry;
    const EditorSettings& m_settings;

    ClassId m_current_class{0};
    Gesture m_gesture;
};

}  // namespace bxa
