/**
 * @file    settings.hpp
 * @brief   Editor settings
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Interaction thresholds are in screen pixels. Settings file is JSON:
 *
 *   {
 *     "click_tolerance": 8,
 *     "min_box_pixels": 6,
 *     "handle_radius": 6,
 *     "undo_capacity": 100,
 *     "class_file": "_darknet.labels"
 *   }
 *
 * Missing keys keep their defaults.
 */

#pragma once

#include "core/undo_stack.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace bxa {

// Ranges accepted from the settings file / command line
namespace limits {
inline constexpr double kClickToleranceMin = 1.0;
inline constexpr double kClickToleranceMax = 30.0;
inline constexpr double kMinBoxPixelsMin = 1.0;
inline constexpr double kMinBoxPixelsMax = 40.0;
inline constexpr double kHandleRadiusMin = 1.0;
inline constexpr double kHandleRadiusMax = 30.0;
inline constexpr std::size_t kUndoCapacityMin = 1;
inline constexpr std::size_t kUndoCapacityMax = 10000;
}  // namespace limits

struct EditorSettings {
    double click_tolerance{8.0};            // Body hit expansion (px)
    double min_box_pixels{6.0};             // Smallest box side (px)
    double handle_radius{6.0};              // Corner handle radius (px)
    std::size_t undo_capacity{kDefaultUndoCapacity};
    std::string class_file{"_darknet.labels"};

    /**
     * Handles grow with the click tolerance but never below handle_radius
     */
    [[nodiscard]] double effective_handle_radius() const noexcept {
        return handle_radius > click_tolerance ? handle_radius : click_tolerance;
    }

    /**
     * Check every field against its range
     * @return  empty string if valid, otherwise a description of the first problem
     */
    [[nodiscard]] std::string validate() const;
};

/**
 * Load settings from a JSON file
 *
 * @param path  Settings file
 * @param out   Receives the settings. Left untouched on failure.
 * @return      true on success
 */
bool load_settings(const std::filesystem::path& path, EditorSettings& out);

/**
 * Write settings as JSON
 * @return  true on success
 */
bool save_settings(const std::filesystem::path& path, const EditorSettings& settings);

}  // namespace bxa
