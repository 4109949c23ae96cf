/**
 * @file    image_catalog.cpp
 * @brief   Ordered list of images in a working directory
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/image_catalog.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace bxa {

namespace {

/**
 * cv::imread on Windows takes an ANSI path, so read the bytes ourselves
 * and decode from memory there.
 */
cv::Mat imread_utf8(const fs::path& path) {
#ifdef _WIN32
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return cv::Mat();
    }

    auto size = file.tellg();
    if (size <= 0) {
        return cv::Mat();
    }
    file.seekg(0, std::ios::beg);

    std::vector<uchar> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return cv::Mat();
    }
    return cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
#else
    return cv::imread(path.string(), cv::IMREAD_UNCHANGED);
#endif
}

}  // anonymous namespace

bool ImageCatalog::scan(const fs::path& dir) {
    m_dir = dir;
    m_images.clear();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        spdlog::error("Not a directory: {}", dir);
        return false;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::error("Cannot read directory {}: {}", dir, ec.message());
        return false;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (!is_supported_extension(entry.path())) continue;
        m_images.push_back(entry.path());
    }

    std::sort(m_images.begin(), m_images.end());
    spdlog::debug("Found {} image(s) in {}", m_images.size(), dir);
    return true;
}

std::size_t ImageCatalog::next(std::size_t index) const noexcept {
    if (m_images.empty()) return 0;
    return (index + 1) % m_images.size();
}

std::size_t ImageCatalog::prev(std::size_t index) const noexcept {
    if (m_images.empty()) return 0;
    if (index == 0 || index >= m_images.size()) return m_images.size() - 1;
    return index - 1;
}

// =============================================================================
// Utility
// =============================================================================

std::vector<std::string> ImageCatalog::supported_extensions() {
    return {".png", ".jpg", ".jpeg", ".bmp", ".webp", ".tif", ".tiff"};
}

bool ImageCatalog::is_supported_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto exts = supported_extensions();
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

cv::Size ImageCatalog::image_size(const fs::path& path) {
    cv::Mat image = imread_utf8(path);
    if (image.empty()) {
        spdlog::error("Failed to read image: {}", path);
        return {};
    }
    return image.size();
}

}  // namespace bxa
