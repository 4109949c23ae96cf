/**
 * @file    annotation.cpp
 * @brief   Bounding-box annotation model
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/annotation.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace bxa {

void AnnotationSet::append(const Box& box) {
    m_boxes.push_back(box);
    m_dirty = true;
}

void AnnotationSet::insert(std::size_t index, const Box& box) {
    if (index > m_boxes.size()) {
        throw std::out_of_range(
            fmt::format("insert position {} past end ({})", index, m_boxes.size()));
    }
    m_boxes.insert(m_boxes.begin() + static_cast<std::ptrdiff_t>(index), box);
    m_dirty = true;
}

Box AnnotationSet::erase(std::size_t index) {
    Box removed = m_boxes.at(index);
    m_boxes.erase(m_boxes.begin() + static_cast<std::ptrdiff_t>(index));
    m_dirty = true;
    return removed;
}

void AnnotationSet::replace(std::size_t index, const Box& box) {
    m_boxes.at(index) = box;
    m_dirty = true;
}

void AnnotationSet::reset(std::vector<Box> boxes) {
    m_boxes = std::move(boxes);
    m_dirty = false;
}

}  // namespace bxa
