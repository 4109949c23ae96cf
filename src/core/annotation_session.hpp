/**
 * @file    annotation_session.hpp
 * @brief   Editing session for one image at a time
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Owns the boxes, selection, undo history and edit engine of the image
 * being annotated, and moves them to and from disk. The class registry is
 * shared by every image of a directory and is held by reference.
 *
 * Not thread-safe. The shell must not issue edits while a load or save of
 * the same image is in flight.
 */

#pragma once

#include "core/annotation.hpp"
#include "core/annotation_codec.hpp"
#include "core/class_registry.hpp"
#include "core/edit_engine.hpp"
#include "core/settings.hpp"
#include "core/undo_stack.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <string_view>

namespace bxa {

class AnnotationSession {
public:
    /**
     * @param registry    Class table shared across images (must outlive session)
     * @param settings    Editor settings, copied
     * @param class_file  Where registry growth is persisted
     */
    AnnotationSession(ClassRegistry& registry,
                      EditorSettings settings,
                      std::filesystem::path class_file);

    // Non-copyable, non-movable (engine holds references to members)
    AnnotationSession(const AnnotationSession&) = delete;
    AnnotationSession& operator=(const AnnotationSession&) = delete;
    AnnotationSession(AnnotationSession&&) = delete;
    AnnotationSession& operator=(AnnotationSession&&) = delete;

    /**
     * Load the class file into a registry. A missing file leaves it empty.
     * @return  false if the file exists but cannot be read
     */
    static bool load_classes(const std::filesystem::path& class_file, ClassRegistry& registry);

    // ==========================================================================
    // Lifecycle
    // ==========================================================================

    /**
     * Switch to an image and load its annotation file
     *
     * Unsaved edits of the previous image are discarded; the shell decides
     * whether to save first. Undo history starts empty.
     *
     * @param image       Image path; the annotation file sits next to it
     * @param image_size  Pixel dimensions of the image
     * @return            Parse report of the annotation file
     */
    ParseResult open(const std::filesystem::path& image, cv::Size image_size);

    /**
     * Write the annotation file, then the class file if the registry grew
     */
    SaveResult save();

    /**
     * Re-read the current image's annotation file, dropping edits
     */
    ParseResult reload();

    void close();

    [[nodiscard]] bool has_image() const noexcept { return !m_image_path.empty(); }
    [[nodiscard]] bool is_dirty() const noexcept { return m_set.is_dirty(); }

    // ==========================================================================
    // State Access
    // ==========================================================================

    [[nodiscard]] const std::filesystem::path& image_path() const noexcept { return m_image_path; }
    [[nodiscard]] std::filesystem::path annotation_path() const;
    [[nodiscard]] const std::filesystem::path& class_file() const noexcept { return m_class_file; }
    [[nodiscard]] cv::Size image_size() const noexcept { return m_image_size; }

    [[nodiscard]] const AnnotationSet& annotations() const noexcept { return m_set; }
    [[nodiscard]] const Selection& selection() const noexcept { return m_selection; }
    [[nodiscard]] const UndoStack& undo_stack() const noexcept { return m_undo; }
    [[nodiscard]] const ClassRegistry& registry() const noexcept { return m_registry; }
    [[nodiscard]] const EditorSettings& settings() const noexcept { return m_settings; }

    [[nodiscard]] EditEngine& engine() noexcept { return m_engine; }

    // ==========================================================================
    // Editing (forwarded to the engine with the current image size)
    // ==========================================================================

    void press(const cv::Point2d& screen, const ViewTransform& view);
    void drag(const cv::Point2d& screen, const ViewTransform& view);
    bool release(const cv::Point2d& screen, const ViewTransform& view);
    void cancel() { m_engine.cancel(); }

    bool delete_selected() { return m_engine.delete_selected(); }
    bool duplicate_selected() { return m_engine.duplicate_selected(); }
    bool assign_class(ClassId id) { return m_engine.assign_class(id); }
    bool assign_class_by_name(std::string_view name) { return m_engine.assign_class_by_name(name); }
    bool undo() { return m_engine.undo(); }

    // ==========================================================================
    // Classes
    // ==========================================================================

    bool set_current_class(ClassId id) { return m_engine.set_current_class(id); }
    [[nodiscard]] ClassId current_class() const noexcept { return m_engine.current_class(); }

    /**
     * Add a class by name and write the class file right away
     * @throws std::invalid_argument  blank name
     */
    SaveResult add_class(std::string_view name);

private:
    [[nodiscard]] Viewport viewport(const ViewTransform& view) const noexcept {
        return Viewport{view, m_image_size};
    }

    SaveResult persist_classes();

    ClassRegistry& m_registry;
    EditorSettings m_settings;
    std::filesystem::path m_class_file;

    std::filesystem::path m_image_path;
    cv::Size m_image_size;

    AnnotationSet m_set;
    Selection m_selection;
    UndoStack m_undo;
    EditEngine m_engine;

    bool m_classes_pending{false};      // Registry has names not yet on disk
};

}  // namespace bxa
