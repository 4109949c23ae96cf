/**
 * @file    settings_test.cpp
 * @brief   Unit tests for editor settings loading
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/settings.hpp"
#include "temp_dir.hpp"

namespace bxa {

class SettingsTest : public test::TempDirTest {};

TEST_F(SettingsTest, Defaults) {
    const EditorSettings settings;
    EXPECT_DOUBLE_EQ(settings.click_tolerance, 8.0);
    EXPECT_DOUBLE_EQ(settings.min_box_pixels, 6.0);
    EXPECT_EQ(settings.undo_capacity, 100u);
    EXPECT_EQ(settings.class_file, "_darknet.labels");
    EXPECT_TRUE(settings.validate().empty());
}

TEST_F(SettingsTest, EffectiveHandleRadius) {
    EditorSettings settings;
    settings.handle_radius = 6.0;
    settings.click_tolerance = 8.0;
    EXPECT_DOUBLE_EQ(settings.effective_handle_radius(), 8.0);

    settings.handle_radius = 12.0;
    EXPECT_DOUBLE_EQ(settings.effective_handle_radius(), 12.0);
}

TEST_F(SettingsTest, PartialFileKeepsDefaults) {
    const auto path = dir_ / "settings.json";
    write_file(path, R"({ "click_tolerance": 12, "class_file": "classes.txt" })");

    EditorSettings settings;
    ASSERT_TRUE(load_settings(path, settings));
    EXPECT_DOUBLE_EQ(settings.click_tolerance, 12.0);
    EXPECT_EQ(settings.class_file, "classes.txt");
    EXPECT_DOUBLE_EQ(settings.min_box_pixels, 6.0);
    EXPECT_EQ(settings.undo_capacity, 100u);
}

TEST_F(SettingsTest, OutOfRangeIsRejected) {
    const auto path = dir_ / "settings.json";
    write_file(path, R"({ "click_tolerance": 4, "min_box_pixels": 100 })");

    EditorSettings settings;
    EXPECT_FALSE(load_settings(path, settings));
    EXPECT_DOUBLE_EQ(settings.click_tolerance, 8.0);
    EXPECT_DOUBLE_EQ(settings.min_box_pixels, 6.0);
}

TEST_F(SettingsTest, ValidateReportsField) {
    EditorSettings settings;
    settings.undo_capacity = 0;
    EXPECT_NE(settings.validate().find("undo_capacity"), std::string::npos);

    settings = EditorSettings{};
    settings.class_file.clear();
    EXPECT_FALSE(settings.validate().empty());
}

TEST_F(SettingsTest, InvalidJson) {
    const auto path = dir_ / "settings.json";
    write_file(path, "{ click_tolerance: ");

    EditorSettings settings;
    EXPECT_FALSE(load_settings(path, settings));
}

TEST_F(SettingsTest, WrongValueType) {
    const auto path = dir_ / "settings.json";
    write_file(path, R"({ "undo_capacity": "lots" })");

    EditorSettings settings;
    EXPECT_FALSE(load_settings(path, settings));
    EXPECT_EQ(settings.undo_capacity, 100u);
}

TEST_F(SettingsTest, MissingFile) {
    EditorSettings settings;
    EXPECT_FALSE(load_settings(dir_ / "absent.json", settings));
}

TEST_F(SettingsTest, SaveThenLoad) {
    const auto path = dir_ / "settings.json";
    EditorSettings original;
    original.click_tolerance = 10.0;
    original.handle_radius = 9.0;
    original.undo_capacity = 250;
    original.class_file = "labels.txt";

    ASSERT_TRUE(save_settings(path, original));

    EditorSettings loaded;
    ASSERT_TRUE(load_settings(path, loaded));
    EXPECT_DOUBLE_EQ(loaded.click_tolerance, 10.0);
    EXPECT_DOUBLE_EQ(loaded.handle_radius, 9.0);
    EXPECT_EQ(loaded.undo_capacity, 250u);
    EXPECT_EQ(loaded.class_file, "labels.txt");
}

}  // namespace bxa
