/**
 * @file    class_registry.hpp
 * @brief   Ordered class-name registry
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Maps class names to zero-based ids. The id of a class is its position in
 * the registry, so the registry only ever grows: annotation files written
 * earlier refer to classes by position and would be silently corrupted by
 * a removal or reorder.
 *
 * The only way to shrink it is rollback(), used by undo to take back an
 * append that was never persisted (see seal()).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bxa {

using ClassId = std::uint32_t;

// Highest numeric id accepted from a file. Anything above is treated as a
// corrupt token rather than a request for thousands of placeholders.
inline constexpr ClassId kMaxClassId = 65535;

// Class appended when a box is created and no class exists yet
inline constexpr std::string_view kDefaultClassName = "object";

class ClassRegistry {
public:
    ClassRegistry() = default;
    explicit ClassRegistry(std::vector<std::string> names);

    /**
     * Resolve an annotation-file token to a class id
     *
     * Numeric tokens are ids: an id past the end grows the registry with
     * placeholder names up to and including it. Any other token is a class
     * name: matched against existing names, appended when unknown.
     *
     * @throws std::out_of_range  numeric id above kMaxClassId
     */
    ClassId resolve(std::string_view token);

    /**
     * Append a class by name, returning the existing id if already present
     * @throws std::invalid_argument  empty or blank name
     */
    ClassId add_explicit(std::string_view name);

    [[nodiscard]] std::optional<ClassId> find(std::string_view name) const;
    [[nodiscard]] const std::string& name(ClassId id) const;
    [[nodiscard]] bool contains(ClassId id) const noexcept { return id < m_names.size(); }

    [[nodiscard]] std::size_t size() const noexcept { return m_names.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_names.empty(); }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return m_names; }

    /**
     * Mark every current entry as permanent (persisted or loaded).
     * rollback() never removes sealed entries.
     */
    void seal() noexcept { m_sealed = m_names.size(); }
    [[nodiscard]] std::size_t sealed_size() const noexcept { return m_sealed; }

    /**
     * Undo growth back to size_before, without touching sealed entries
     * @return number of names removed
     */
    std::size_t rollback(std::size_t size_before);

    /**
     * Replace the whole table (class file load). Seals the result.
     */
    void assign(std::vector<std::string> names);

    [[nodiscard]] static std::string placeholder_name(ClassId id);
    [[nodiscard]] static bool is_numeric_token(std::string_view token) noexcept;

private:
    void grow_to(ClassId id);

    std::vector<std::string> m_names;
    std::size_t m_sealed{0};
};

}  // namespace bxa
