/**
 * @file    undo_stack.hpp
 * @brief   Bounded undo history for the active image
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Each entry is an inverse snapshot of one user action. The action payload
 * is a variant so every kind carries only what it needs to be reverted;
 * the common part (selection and class registry size before the action)
 * lives on the entry itself.
 *
 * There is no redo. The stack is cleared whenever another image becomes
 * active: an edit is only ever undoable on the image it was made on.
 */

#pragma once

#include "core/annotation.hpp"
#include "core/class_registry.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <variant>

namespace bxa {

inline constexpr std::size_t kDefaultUndoCapacity = 100;

// =============================================================================
// Entry payloads
// =============================================================================

struct BoxCreated {
    std::size_t index{0};
};

struct BoxMoved {
    std::size_t index{0};
    Box before;
    Box after;
};

struct BoxResized {
    std::size_t index{0};
    Box before;
    Box after;
};

struct BoxDeleted {
    std::size_t index{0};
    Box box;
};

struct BoxDuplicated {
    std::size_t index{0};   // Position of the copy
};

struct ClassAssigned {
    std::size_t index{0};
    ClassId previous{0};
    ClassId assigned{0};
};

using UndoAction = std::variant<BoxCreated, BoxMoved, BoxResized,
                                BoxDeleted, BoxDuplicated, ClassAssigned>;

struct UndoEntry {
    UndoAction action;
    std::optional<std::size_t> selection_before;
    std::size_t registry_size_before{0};
};

[[nodiscard]] std::string_view describe(const UndoAction& action);

// =============================================================================
// UndoStack
// =============================================================================

class UndoStack {
public:
    explicit UndoStack(std::size_t capacity = kDefaultUndoCapacity);

    /**
     * Record an action. Past capacity the oldest entry is dropped.
     */
    void push(UndoEntry entry);

    /**
     * Pop the newest entry and revert it
     *
     * Restores the boxes, the selection the user had before the action and
     * rolls back any class registry growth the action caused.
     *
     * @return  false if there was nothing to undo
     */
    bool undo(AnnotationSet& set, Selection& selection, ClassRegistry& registry);

    void clear() noexcept { m_entries.clear(); }

    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

    /**
     * Change capacity, dropping the oldest entries if needed
     * @throws std::invalid_argument  zero capacity
     */
    void set_capacity(std::size_t capacity);

    [[nodiscard]] const UndoEntry* top() const noexcept {
        return m_entries.empty() ? nullptr : &m_entries.back();
    }

private:
    std::deque<UndoEntry> m_entries;
    std::size_t m_capacity;
};

}  // namespace bxa
