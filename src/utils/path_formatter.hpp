/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Paths are logged and shown as UTF-8 on every platform. With C++20
 * path::u8string() returns std::u8string, so the bytes are reinterpreted
 * as char before they reach fmt / spdlog.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved: {}", annotation_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace bxa {

/**
 * Filesystem path as a UTF-8 std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

inline std::string filename_utf8(const std::filesystem::path& path) {
    return to_utf8(path.filename());
}

/**
 * Build a path from a UTF-8 string (command line arguments, settings values)
 *
 * std::filesystem::path(const char*) uses the ANSI code page on Windows,
 * which corrupts non-ASCII directory names.
 */
inline std::filesystem::path path_from_utf8(const std::string& utf8_str) {
#ifdef _WIN32
    if (utf8_str.empty()) return {};

    int len = MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(), -1, nullptr, 0);
    if (len <= 0) return std::filesystem::path(utf8_str);

    std::wstring wstr(len - 1, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(), -1, wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(utf8_str);
#endif
}

}  // namespace bxa

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
