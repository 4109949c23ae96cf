/**
 * @file    annotation_session_test.cpp
 * @brief   Unit tests for AnnotationSession load / save lifecycle
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/annotation_session.hpp"
#include "temp_dir.hpp"

#include <memory>
#include <stdexcept>

namespace bxa {

namespace fs = std::filesystem;

class AnnotationSessionTest : public test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        class_file_ = dir_ / "_darknet.labels";
        image_ = dir_ / "img_001.png";
        write_file(image_, "not decoded by the session");
    }

    // Load the class file and build a session over it
    void start() {
        ASSERT_TRUE(AnnotationSession::load_classes(class_file_, registry_));
        session_ = std::make_unique<AnnotationSession>(registry_, EditorSettings{}, class_file_);
    }

    // Drag out a box in a 200x100 image at zoom 1
    bool drag_box(const cv::Point2d& from, const cv::Point2d& to) {
        session_->press(from, view_);
        session_->drag(to, view_);
        return session_->release(to, view_);
    }

    fs::path class_file_;
    fs::path image_;
    cv::Size size_{200, 100};
    ViewTransform view_;
    ClassRegistry registry_;
    std::unique_ptr<AnnotationSession> session_;
};

// =============================================================================
// Open Tests
// =============================================================================

TEST_F(AnnotationSessionTest, OpenWithoutAnnotationFile) {
    start();
    const ParseResult result = session_->open(image_, size_);

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(session_->has_image());
    EXPECT_TRUE(session_->annotations().empty());
    EXPECT_FALSE(session_->is_dirty());
    EXPECT_TRUE(session_->annotation_path() == dir_ / "img_001.txt");
}

TEST_F(AnnotationSessionTest, OpenPersistsClassesFoundInFile) {
    write_file(class_file_, "blue_ring\n");
    write_file(dir_ / "img_001.txt", "red_ring 0.5 0.5 0.2 0.2\n");
    start();

    const ParseResult result = session_->open(image_, size_);
    ASSERT_EQ(result.boxes.size(), 1u);
    EXPECT_EQ(session_->annotations().at(0).class_id, 1u);

    EXPECT_EQ(read_file(class_file_), "blue_ring\nred_ring\n");
    EXPECT_EQ(registry_.sealed_size(), 2u);
    EXPECT_FALSE(session_->is_dirty());
}

TEST_F(AnnotationSessionTest, OpenReportsMalformedLines) {
    write_file(class_file_, "a\n");
    write_file(dir_ / "img_001.txt", "0 0.5 0.5 0.2 0.2\nbroken line\n");
    start();

    const ParseResult result = session_->open(image_, size_);
    EXPECT_EQ(result.boxes.size(), 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].line_number, 2u);
    EXPECT_EQ(session_->annotations().size(), 1u);
}

TEST_F(AnnotationSessionTest, OpenClearsUndoAndSelection) {
    write_file(class_file_, "a\n");
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    EXPECT_FALSE(session_->undo_stack().empty());
    EXPECT_TRUE(session_->selection().has_box());

    const fs::path other = dir_ / "img_002.png";
    write_file(other, "x");
    session_->open(other, size_);

    EXPECT_TRUE(session_->undo_stack().empty());
    EXPECT_FALSE(session_->selection().has_box());
    EXPECT_FALSE(session_->undo());
}

// =============================================================================
// Save Tests
// =============================================================================

TEST_F(AnnotationSessionTest, SaveWritesAndClearsDirty) {
    write_file(class_file_, "blue_ring\n");
    write_file(dir_ / "img_001.txt", "0 0.5 0.5 0.2 0.2\n");
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    EXPECT_TRUE(session_->is_dirty());

    const SaveResult saved = session_->save();
    ASSERT_TRUE(saved.ok()) << saved.message;
    EXPECT_FALSE(session_->is_dirty());
    EXPECT_EQ(read_file(dir_ / "img_001.txt"),
              "0 0.500000 0.500000 0.200000 0.200000\n"
              "0 0.200000 0.300000 0.200000 0.400000\n");
}

TEST_F(AnnotationSessionTest, SavePersistsDefaultClass) {
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    EXPECT_FALSE(fs::exists(class_file_));

    ASSERT_TRUE(session_->save().ok());
    EXPECT_EQ(read_file(class_file_), "object\n");

    // Sealed once on disk: undoing the box keeps the class
    ASSERT_TRUE(session_->undo());
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_TRUE(session_->is_dirty());
}

TEST_F(AnnotationSessionTest, SaveWithoutImageFails) {
    start();
    const SaveResult saved = session_->save();
    EXPECT_FALSE(saved.ok());
    EXPECT_EQ(saved.status, SaveStatus::IoError);
}

TEST_F(AnnotationSessionTest, SaveFailureKeepsDirty) {
    write_file(class_file_, "a\n");
    start();
    session_->open(dir_ / "gone" / "img.png", size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    const SaveResult saved = session_->save();
    EXPECT_FALSE(saved.ok());
    EXPECT_TRUE(session_->is_dirty());
}

// =============================================================================
// Reload / Close Tests
// =============================================================================

TEST_F(AnnotationSessionTest, ReloadDropsEdits) {
    write_file(class_file_, "a\n");
    write_file(dir_ / "img_001.txt", "0 0.5 0.5 0.2 0.2\n");
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    EXPECT_EQ(session_->annotations().size(), 2u);

    session_->reload();
    EXPECT_EQ(session_->annotations().size(), 1u);
    EXPECT_FALSE(session_->is_dirty());
    EXPECT_TRUE(session_->undo_stack().empty());
}

TEST_F(AnnotationSessionTest, CloseResetsState) {
    start();
    session_->open(image_, size_);
    session_->close();

    EXPECT_FALSE(session_->has_image());
    EXPECT_TRUE(session_->annotations().empty());

    // Pointer input without an image does nothing
    EXPECT_FALSE(drag_box({20.0, 10.0}, {60.0, 50.0}));
}

// =============================================================================
// Class Tests
// =============================================================================

TEST_F(AnnotationSessionTest, AddClassPersistsImmediately) {
    write_file(class_file_, "cat\n");
    start();

    const SaveResult saved = session_->add_class("dog");
    ASSERT_TRUE(saved.ok());
    EXPECT_EQ(read_file(class_file_), "cat\ndog\n");

    EXPECT_TRUE(session_->add_class("cat").ok());
    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_THROW(session_->add_class("  "), std::invalid_argument);
}

TEST_F(AnnotationSessionTest, AssignByNameThroughSession) {
    write_file(class_file_, "cat\n");
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    ASSERT_TRUE(session_->assign_class_by_name("dog"));
    EXPECT_EQ(session_->annotations().at(0).class_id, 1u);

    ASSERT_TRUE(session_->save().ok());
    EXPECT_EQ(read_file(class_file_), "cat\ndog\n");
}

TEST_F(AnnotationSessionTest, CurrentClassUsedForNewBoxes) {
    write_file(class_file_, "cat\ndog\n");
    start();
    session_->open(image_, size_);

    ASSERT_TRUE(session_->set_current_class(1));
    ASSERT_TRUE(drag_box({20.0, 10.0}, {60.0, 50.0}));
    EXPECT_EQ(session_->annotations().at(0).class_id, 1u);
    EXPECT_EQ(session_->current_class(), 1u);
}

}  // namespace bxa
