/**
 * @file    settings.cpp
 * @brief   Editor settings - JSON loading and validation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/settings.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>

namespace bxa {

std::string EditorSettings::validate() const {
    if (click_tolerance < limits::kClickToleranceMin || click_tolerance > limits::kClickToleranceMax) {
        return fmt::format("click_tolerance {} outside [{}, {}]", click_tolerance,
                           limits::kClickToleranceMin, limits::kClickToleranceMax);
    }
    if (min_box_pixels < limits::kMinBoxPixelsMin || min_box_pixels > limits::kMinBoxPixelsMax) {
        return fmt::format("min_box_pixels {} outside [{}, {}]", min_box_pixels,
                           limits::kMinBoxPixelsMin, limits::kMinBoxPixelsMax);
    }
    if (handle_radius < limits::kHandleRadiusMin || handle_radius > limits::kHandleRadiusMax) {
        return fmt::format("handle_radius {} outside [{}, {}]", handle_radius,
                           limits::kHandleRadiusMin, limits::kHandleRadiusMax);
    }
    if (undo_capacity < limits::kUndoCapacityMin || undo_capacity > limits::kUndoCapacityMax) {
        return fmt::format("undo_capacity {} outside [{}, {}]", undo_capacity,
                           limits::kUndoCapacityMin, limits::kUndoCapacityMax);
    }
    if (class_file.empty()) {
        return "class_file must not be empty";
    }
    return {};
}

bool load_settings(const std::filesystem::path& path, EditorSettings& out) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("[settings] File not found: {}", path);
        return false;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::error("[settings] Failed to open: {}", path);
            return false;
        }

        const nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            spdlog::error("[settings] {}: top level must be an object", path);
            return false;
        }

        EditorSettings loaded = out;
        loaded.click_tolerance = j.value("click_tolerance", loaded.click_tolerance);
        loaded.min_box_pixels = j.value("min_box_pixels", loaded.min_box_pixels);
        loaded.handle_radius = j.value("handle_radius", loaded.handle_radius);
        loaded.undo_capacity = j.value("undo_capacity", loaded.undo_capacity);
        loaded.class_file = j.value("class_file", loaded.class_file);

        if (auto problem = loaded.validate(); !problem.empty()) {
            spdlog::error("[settings] {}: {}", path, problem);
            return false;
        }

        out = loaded;
        spdlog::debug("[settings] Loaded {}", path);
        return true;

    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[settings] JSON error in {}: {}", path, e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("[settings] Failed to load {}: {}", path, e.what());
        return false;
    }
}

bool save_settings(const std::filesystem::path& path, const EditorSettings& settings) {
    const nlohmann::json j = {
        {"click_tolerance", settings.click_tolerance},
        {"min_box_pixels", settings.min_box_pixels},
        {"handle_radius", settings.handle_radius},
        {"undo_capacity", settings.undo_capacity},
        {"class_file", settings.class_file},
    };

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("[settings] Failed to create: {}", path);
        return false;
    }

    file << j.dump(2) << '\n';
    if (!file.good()) {
        spdlog::error("[settings] Write failed: {}", path);
        return false;
    }
    return true;
}

}  // namespace bxa
