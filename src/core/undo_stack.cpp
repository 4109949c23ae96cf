/**
 * @file    undo_stack.cpp
 * @brief   Bounded undo history for the active image
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/undo_stack.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace bxa {

namespace {

// Helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // anonymous namespace

std::string_view describe(const UndoAction& action) {
    return std::visit(overloaded{
        [](const BoxCreated&)    -> std::string_view { return "create"; },
        [](const BoxMoved&)      -> std::string_view { return "move"; },
        [](const BoxResized&)    -> std::string_view { return "resize"; },
        [](const BoxDeleted&)    -> std::string_view { return "delete"; },
        [](const BoxDuplicated&) -> std::string_view { return "duplicate"; },
        [](const ClassAssigned&) -> std::string_view { return "assign class"; },
    }, action);
}

UndoStack::UndoStack(std::size_t capacity)
    : m_capacity(capacity)
{
    if (m_capacity == 0) {
        throw std::invalid_argument("undo capacity must be at least 1");
    }
}

void UndoStack::push(UndoEntry entry) {
    m_entries.push_back(std::move(entry));
    while (m_entries.size() > m_capacity) {
        m_entries.pop_front();
    }
}

bool UndoStack::undo(AnnotationSet& set, Selection& selection, ClassRegistry& registry) {
    if (m_entries.empty()) {
        return false;
    }

    UndoEntry entry = std::move(m_entries.back());
    m_entries.pop_back();

    std::visit(overloaded{
        [&](const BoxCreated& a) {
            set.erase(a.index);
        },
        [&](const BoxMoved& a) {
            set.replace(a.index, a.before);
        },
        [&](const BoxResized& a) {
            set.replace(a.index, a.before);
        },
        [&](const BoxDeleted& a) {
            set.insert(a.index, a.box);
        },
        [&](const BoxDuplicated& a) {
            set.erase(a.index);
        },
        [&](const ClassAssigned& a) {
            Box box = set.at(a.index);
            box.class_id = a.previous;
            set.replace(a.index, box);
        },
    }, entry.action);

    registry.rollback(entry.registry_size_before);

    selection.clear();
    if (entry.selection_before && set.contains(*entry.selection_before)) {
        selection.index = entry.selection_before;
    }

    spdlog::debug("Undo: {} ({} left)", describe(entry.action), m_entries.size());
    return true;
}

void UndoStack::set_capacity(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("undo capacity must be at least 1");
    }
    m_capacity = capacity;
    while (m_entries.size() > m_capacity) {
        m_entries.pop_front();
    }
}

}  // namespace bxa
