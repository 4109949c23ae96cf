/**
 * @file    image_catalog.hpp
 * @brief   Ordered list of images in a working directory
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace bxa {

class ImageCatalog {
public:
    ImageCatalog() = default;

    /**
     * Collect supported images in a directory (not recursive), sorted by path
     * @return  false if dir is not a readable directory
     */
    bool scan(const std::filesystem::path& dir);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return m_dir; }
    [[nodiscard]] const std::vector<std::filesystem::path>& images() const noexcept { return m_images; }
    [[nodiscard]] std::size_t size() const noexcept { return m_images.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_images.empty(); }

    [[nodiscard]] const std::filesystem::path& at(std::size_t index) const { return m_images.at(index); }

    // Navigation wraps around at both ends
    [[nodiscard]] std::size_t next(std::size_t index) const noexcept;
    [[nodiscard]] std::size_t prev(std::size_t index) const noexcept;

    // ==========================================================================
    // Utility
    // ==========================================================================

    [[nodiscard]] static std::vector<std::string> supported_extensions();

    /**
     * Extension check, case-insensitive
     */
    [[nodiscard]] static bool is_supported_extension(const std::filesystem::path& path);

    /**
     * Pixel dimensions of an image file
     * @return  empty cv::Size if the file cannot be decoded
     */
    [[nodiscard]] static cv::Size image_size(const std::filesystem::path& path);

private:
    std::filesystem::path m_dir;
    std::vector<std::filesystem::path> m_images;
};

}  // namespace bxa
