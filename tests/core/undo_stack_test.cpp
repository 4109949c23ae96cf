/**
 * @file    undo_stack_test.cpp
 * @brief   Unit tests for AnnotationSet and UndoStack
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/annotation.hpp"
#include "core/undo_stack.hpp"

#include <stdexcept>

namespace bxa {

// =============================================================================
// AnnotationSet Tests
// =============================================================================

TEST(AnnotationSetTest, MutatorsMarkDirty) {
    AnnotationSet set;
    EXPECT_FALSE(set.is_dirty());

    set.append(Box{0, 0.5, 0.5, 0.1, 0.1});
    EXPECT_TRUE(set.is_dirty());

    set.mark_clean();
    set.replace(0, Box{1, 0.5, 0.5, 0.1, 0.1});
    EXPECT_TRUE(set.is_dirty());
    EXPECT_EQ(set.at(0).class_id, 1u);
}

TEST(AnnotationSetTest, ResetIsClean) {
    AnnotationSet set;
    set.append(Box{0, 0.5, 0.5, 0.1, 0.1});
    set.reset({Box{2, 0.1, 0.1, 0.1, 0.1}, Box{3, 0.2, 0.2, 0.1, 0.1}});

    EXPECT_FALSE(set.is_dirty());
    EXPECT_EQ(set.size(), 2u);
}

TEST(AnnotationSetTest, InsertPastEndThrows) {
    AnnotationSet set;
    EXPECT_THROW(set.insert(1, Box{}), std::out_of_range);
    EXPECT_THROW(set.erase(0), std::out_of_range);
}

TEST(AnnotationSetTest, BoxEdges) {
    const Box box = Box::from_edges(4, 0.2, 0.1, 0.6, 0.5);
    EXPECT_EQ(box.class_id, 4u);
    EXPECT_NEAR(box.cx, 0.4, 1e-12);
    EXPECT_NEAR(box.cy, 0.3, 1e-12);
    EXPECT_NEAR(box.left(), 0.2, 1e-12);
    EXPECT_NEAR(box.bottom(), 0.5, 1e-12);
    EXPECT_TRUE(box.has_area());
}

// =============================================================================
// UndoStack Tests
// =============================================================================

class UndoStackTest : public ::testing::Test {
protected:
    void append_with_undo(const Box& box) {
        const std::size_t before = registry_.size();
        set_.append(box);
        stack_.push(UndoEntry{BoxCreated{set_.size() - 1}, std::nullopt, before});
    }

    AnnotationSet set_;
    Selection selection_;
    ClassRegistry registry_{std::vector<std::string>{"a", "b"}};
    UndoStack stack_{3};
};

TEST_F(UndoStackTest, ZeroCapacityRejected) {
    EXPECT_THROW(UndoStack(0), std::invalid_argument);
    EXPECT_THROW(stack_.set_capacity(0), std::invalid_argument);
}

TEST_F(UndoStackTest, UndoOnEmptyStack) {
    EXPECT_FALSE(stack_.undo(set_, selection_, registry_));
    EXPECT_TRUE(stack_.empty());
}

TEST_F(UndoStackTest, NOperationsThenNUndosRestore) {
    append_with_undo(Box{0, 0.1, 0.1, 0.1, 0.1});
    append_with_undo(Box{1, 0.2, 0.2, 0.1, 0.1});
    append_with_undo(Box{0, 0.3, 0.3, 0.1, 0.1});

    EXPECT_TRUE(stack_.undo(set_, selection_, registry_));
    EXPECT_TRUE(stack_.undo(set_, selection_, registry_));
    EXPECT_TRUE(stack_.undo(set_, selection_, registry_));
    EXPECT_TRUE(set_.empty());
    EXPECT_FALSE(stack_.undo(set_, selection_, registry_));
}

TEST_F(UndoStackTest, OldestEntryDroppedPastCapacity) {
    for (int i = 0; i < 5; ++i) {
        append_with_undo(Box{0, 0.1 * (i + 1), 0.5, 0.05, 0.05});
    }
    EXPECT_EQ(stack_.size(), 3u);

    while (stack_.undo(set_, selection_, registry_)) {
    }

    // Only the last three creations were reversible
    ASSERT_EQ(set_.size(), 2u);
    EXPECT_NEAR(set_.at(1).cx, 0.2, 1e-12);
}

TEST_F(UndoStackTest, ShrinkingCapacityDropsOldest) {
    append_with_undo(Box{0, 0.1, 0.1, 0.1, 0.1});
    append_with_undo(Box{0, 0.2, 0.2, 0.1, 0.1});
    stack_.set_capacity(1);

    EXPECT_EQ(stack_.size(), 1u);
    ASSERT_NE(stack_.top(), nullptr);
    EXPECT_EQ(std::get<BoxCreated>(stack_.top()->action).index, 1u);
}

TEST_F(UndoStackTest, UndoDeleteRestoresPositionAndSelection) {
    set_.reset({Box{0, 0.1, 0.1, 0.1, 0.1}, Box{1, 0.5, 0.5, 0.1, 0.1}, Box{0, 0.9, 0.9, 0.1, 0.1}});
    const Box removed = set_.erase(1);
    stack_.push(UndoEntry{BoxDeleted{1, removed}, 1, registry_.size()});

    ASSERT_TRUE(stack_.undo(set_, selection_, registry_));
    ASSERT_EQ(set_.size(), 3u);
    EXPECT_EQ(set_.at(1), removed);
    ASSERT_TRUE(selection_.index.has_value());
    EXPECT_EQ(*selection_.index, 1u);
}

TEST_F(UndoStackTest, UndoClassAssignRollsBackRegistryGrowth) {
    set_.reset({Box{0, 0.5, 0.5, 0.1, 0.1}});

    const std::size_t before = registry_.size();
    const ClassId id = registry_.resolve("zebra");
    Box box = set_.at(0);
    box.class_id = id;
    set_.replace(0, box);
    stack_.push(UndoEntry{ClassAssigned{0, 0, id}, 0, before});

    ASSERT_TRUE(stack_.undo(set_, selection_, registry_));
    EXPECT_EQ(set_.at(0).class_id, 0u);
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(UndoStackTest, ClearForgetsHistory) {
    append_with_undo(Box{0, 0.1, 0.1, 0.1, 0.1});
    stack_.clear();
    EXPECT_TRUE(stack_.empty());
    EXPECT_FALSE(stack_.undo(set_, selection_, registry_));
    EXPECT_EQ(set_.size(), 1u);
}

TEST(UndoActionTest, Describe) {
    EXPECT_EQ(describe(BoxCreated{}), "create");
    EXPECT_EQ(describe(BoxDuplicated{}), "duplicate");
    EXPECT_EQ(describe(ClassAssigned{}), "assign class");
}

}  // namespace bxa
