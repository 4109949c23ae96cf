/**
 * @file    annotation_session.cpp
 * @brief   Editing session for one image at a time
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/annotation_session.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace fs = std::filesystem;

namespace bxa {

// =============================================================================
// Construction
// =============================================================================

AnnotationSession::AnnotationSession(ClassRegistry& registry,
                                     EditorSettings settings,
                                     fs::path class_file)
    : m_registry(registry)
    , m_settings(std::move(settings))
    , m_class_file(std::move(class_file))
    , m_undo(m_settings.undo_capacity)
    , m_engine(m_set, m_selection, m_undo, m_registry, m_settings)
{
    spdlog::debug("AnnotationSession initialized (classes: {})", m_class_file);
}

bool AnnotationSession::load_classes(const fs::path& class_file, ClassRegistry& registry) {
    if (!fs::exists(class_file)) {
        spdlog::info("No class file at {}, starting empty", class_file);
        registry.assign({});
        return true;
    }

    std::vector<std::string> names;
    if (!load_class_file(class_file, names)) {
        return false;
    }

    registry.assign(std::move(names));
    spdlog::info("Loaded {} class(es) from {}", registry.size(), filename_utf8(class_file));
    return true;
}

// =============================================================================
// Lifecycle
// =============================================================================

ParseResult AnnotationSession::open(const fs::path& image, cv::Size image_size) {
    spdlog::info("Opening: {}", image);

    if (m_set.is_dirty()) {
        spdlog::warn("Discarding unsaved edits of {}", filename_utf8(m_image_path));
    }

    m_engine.reset();
    m_selection.clear();
    m_undo.clear();

    m_image_path = image;
    m_image_size = image_size;

    const std::size_t classes_before = m_registry.size();
    ParseResult result = load_annotation_file(annotation_path(), m_registry);
    m_set.reset(result.boxes);

    for (std::size_t id = classes_before; id < m_registry.size(); ++id) {
        spdlog::info("New class {} '{}' from {}", id, m_registry.name(static_cast<ClassId>(id)),
                     filename_utf8(annotation_path()));
    }

    // Anything loaded from disk is permanent; undo must not remove it
    if (m_registry.size() > m_registry.sealed_size()) {
        m_classes_pending = true;
    }
    m_registry.seal();

    if (m_classes_pending) {
        if (const SaveResult saved = persist_classes(); !saved.ok()) {
            spdlog::warn("Class file not updated, will retry on save: {}", saved.message);
        }
    }

    spdlog::info("Loaded {} box(es), {} malformed line(s)", result.boxes.size(), result.errors.size());
    return result;
}

SaveResult AnnotationSession::save() {
    if (!has_image()) {
        spdlog::warn("No image to save");
        return SaveResult{SaveStatus::IoError, "no image open"};
    }

    const fs::path path = annotation_path();
    SaveResult result = save_annotation_file(path, m_set.boxes());
    if (!result.ok()) {
        return result;
    }

    if (m_registry.size() > m_registry.sealed_size()) {
        m_classes_pending = true;
    }
    if (m_classes_pending) {
        SaveResult classes = persist_classes();
        if (!classes.ok()) {
            return classes;
        }
    }

    m_set.mark_clean();
    spdlog::info("Saved {} box(es) to {}", m_set.size(), filename_utf8(path));
    return result;
}

ParseResult AnnotationSession::reload() {
    if (!has_image()) {
        return {};
    }
    const fs::path image = m_image_path;
    return open(image, m_image_size);
}

void AnnotationSession::close() {
    m_engine.reset();
    m_selection.clear();
    m_undo.clear();
    m_set.reset({});

    m_image_path.clear();
    m_image_size = cv::Size();
    spdlog::debug("Image closed");
}

fs::path AnnotationSession::annotation_path() const {
    return annotation_path_for(m_image_path);
}

// =============================================================================
// Editing
// =============================================================================

void AnnotationSession::press(const cv::Point2d& screen, const ViewTransform& view) {
    if (!has_image()) return;
    m_engine.press(screen, viewport(view));
}

void AnnotationSession::drag(const cv::Point2d& screen, const ViewTransform& view) {
    if (!has_image()) return;
    m_engine.drag(screen, viewport(view));
}

bool AnnotationSession::release(const cv::Point2d& screen, const ViewTransform& view) {
    if (!has_image()) return false;
    return m_engine.release(screen, viewport(view));
}

// =============================================================================
// Classes
// =============================================================================

SaveResult AnnotationSession::add_class(std::string_view name) {
    const std::size_t before = m_registry.size();
    const ClassId id = m_registry.add_explicit(name);
    if (m_registry.size() == before) {
        spdlog::debug("Class '{}' already exists as {}", m_registry.name(id), id);
        return {};
    }

    spdlog::info("Added class {} '{}'", id, m_registry.name(id));
    m_classes_pending = true;
    return persist_classes();
}

SaveResult AnnotationSession::persist_classes() {
    SaveResult result = save_class_file(m_class_file, m_registry);
    if (result.ok()) {
        m_classes_pending = false;
        m_registry.seal();
        spdlog::debug("Class file updated: {} class(es)", m_registry.size());
    }
    return result;
}

}  // namespace bxa
