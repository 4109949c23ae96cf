/**
 * @file    annotation_codec.hpp
 * @brief   Annotation and class file reading / writing
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Annotation file (one per image, `<image basename>.txt`):
 *
 *   <class_token> <cx> <cy> <w> <h>
 *
 * Written with numeric class ids and six fixed decimals. This layout is
 * read by training pipelines and must not change. On read the token may
 * also be a class name (legacy files), resolved through the ClassRegistry.
 *
 * Class file: one class name per line, line index = class id.
 */

#pragma once

#include "core/annotation.hpp"
#include "core/class_registry.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace bxa {

inline constexpr int kCoordinatePrecision = 6;

// =============================================================================
// Results
// =============================================================================

struct LineError {
    std::size_t line_number{0};     // 1-based
    std::string text;
    std::string reason;
};

struct ParseResult {
    std::vector<Box> boxes;
    std::vector<LineError> errors;
    std::size_t legacy_tokens{0};   // Lines that named their class

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

enum class SaveStatus {
    Ok,
    PermissionDenied,
    IoError
};

[[nodiscard]] constexpr std::string_view to_string(SaveStatus status) noexcept {
    switch (status) {
        case SaveStatus::Ok:               return "Ok";
        case SaveStatus::PermissionDenied: return "PermissionDenied";
        case SaveStatus::IoError:          return "IoError";
        default:                            return "Unknown";
    }
}

struct SaveResult {
    SaveStatus status{SaveStatus::Ok};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return status == SaveStatus::Ok; }
};

// =============================================================================
// Annotation lines
// =============================================================================

/**
 * Parse annotation text
 *
 * Malformed lines are skipped and collected in ParseResult::errors; all
 * other lines still load. A line's class token is only resolved once its
 * geometry parsed, so a bad line never adds classes.
 */
[[nodiscard]] ParseResult parse_annotations(std::istream& in, ClassRegistry& registry);
[[nodiscard]] ParseResult parse_annotations(std::string_view text, ClassRegistry& registry);

[[nodiscard]] std::string format_box(const Box& box);
[[nodiscard]] std::string serialize_annotations(const std::vector<Box>& boxes);

// =============================================================================
// Files
// =============================================================================

/**
 * `<dir>/<stem>.txt` next to the image
 */
[[nodiscard]] std::filesystem::path annotation_path_for(const std::filesystem::path& image_path);

/**
 * Load an annotation file. A missing file is an empty, valid result.
 */
[[nodiscard]] ParseResult load_annotation_file(const std::filesystem::path& path, ClassRegistry& registry);

[[nodiscard]] SaveResult save_annotation_file(const std::filesystem::path& path, const std::vector<Box>& boxes);

/**
 * Read a class file into a name list
 *
 * Trailing blank lines are dropped. Blank or duplicate lines in the
 * middle keep their position as a placeholder so later ids stay put.
 *
 * @return  false if the file exists but cannot be read
 */
bool load_class_file(const std::filesystem::path& path, std::vector<std::string>& out);

[[nodiscard]] SaveResult save_class_file(const std::filesystem::path& path, const ClassRegistry& registry);

}  // namespace bxa
