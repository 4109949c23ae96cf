/**
 * @file    class_registry.cpp
 * @brief   Ordered class-name registry
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/class_registry.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace bxa {

namespace {

std::string_view trim(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}  // anonymous namespace

ClassRegistry::ClassRegistry(std::vector<std::string> names) {
    assign(std::move(names));
}

ClassId ClassRegistry::resolve(std::string_view token) {
    if (is_numeric_token(token)) {
        unsigned long long value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || value > kMaxClassId) {
            throw std::out_of_range(
                fmt::format("class id {} exceeds limit {}", token, kMaxClassId));
        }

        const auto id = static_cast<ClassId>(value);
        if (!contains(id)) {
            grow_to(id);
        }
        return id;
    }

    if (auto existing = find(token)) {
        return *existing;
    }

    // Legacy annotation files name the class instead of numbering it
    const auto id = static_cast<ClassId>(m_names.size());
    m_names.emplace_back(token);
    spdlog::info("New class from legacy token: {} -> id {}", token, id);
    return id;
}

ClassId ClassRegistry::add_explicit(std::string_view name) {
    std::string_view trimmed = trim(name);
    if (trimmed.empty()) {
        throw std::invalid_argument("class name must not be empty");
    }

    if (auto existing = find(trimmed)) {
        return *existing;
    }

    const auto id = static_cast<ClassId>(m_names.size());
    m_names.emplace_back(trimmed);
    spdlog::debug("Added class: {} -> id {}", trimmed, id);
    return id;
}

std::optional<ClassId> ClassRegistry::find(std::string_view name) const {
    auto it = std::find(m_names.begin(), m_names.end(), name);
    if (it == m_names.end()) {
        return std::nullopt;
    }
    return static_cast<ClassId>(std::distance(m_names.begin(), it));
}

const std::string& ClassRegistry::name(ClassId id) const {
    if (!contains(id)) {
        throw std::out_of_range(fmt::format("unknown class id {}", id));
    }
    return m_names[id];
}

std::size_t ClassRegistry::rollback(std::size_t size_before) {
    const std::size_t floor = std::max(size_before, m_sealed);
    if (m_names.size() <= floor) {
        return 0;
    }

    const std::size_t removed = m_names.size() - floor;
    m_names.resize(floor);
    spdlog::debug("Class registry rolled back by {} (now {})", removed, m_names.size());
    return removed;
}

void ClassRegistry::assign(std::vector<std::string> names) {
    m_names = std::move(names);
    m_sealed = m_names.size();
}

std::string ClassRegistry::placeholder_name(ClassId id) {
    return fmt::format("class_{}", id);
}

bool ClassRegistry::is_numeric_token(std::string_view token) noexcept {
    return !token.empty() &&
           std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

void ClassRegistry::grow_to(ClassId id) {
    const std::size_t before = m_names.size();
    while (m_names.size() <= id) {
        std::string placeholder = placeholder_name(static_cast<ClassId>(m_names.size()));
        // A placeholder must not collide with a real name further up
        while (find(placeholder)) {
            placeholder += "_";
        }
        m_names.push_back(std::move(placeholder));
    }
    spdlog::warn("Class id {} out of range, added {} placeholder class(es)",
                 id, m_names.size() - before);
}

}  // namespace bxa
