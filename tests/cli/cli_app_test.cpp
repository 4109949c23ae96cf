/**
 * @file    cli_app_test.cpp
 * @brief   Tests for the dataset maintenance commands
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include <gtest/gtest.h>
#include "cli/cli_app.hpp"
#include "temp_dir.hpp"

#include <string>
#include <vector>

namespace bxa::cli {

namespace fs = std::filesystem;

class CliAppTest : public test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        write_file(dir_ / "_darknet.labels", "blue_ring\n");
        write_file(dir_ / "a.png", "x");
        write_file(dir_ / "a.txt", "red_ring 0.1 0.1 0.2 0.2\n0 0.5 0.5 0.3 0.3\n");
    }

    void add_malformed_image() {
        write_file(dir_ / "b.jpg", "x");
        write_file(dir_ / "b.txt", "0 0.1\nblue_ring 0.2 0.2 0.1 0.1\n");
    }

    int run_args(std::vector<std::string> args) {
        args.insert(args.begin(), "BoxAnnotator");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        return run(static_cast<int>(args.size()), argv.data());
    }

    EditorSettings settings_;
};

// =============================================================================
// check
// =============================================================================

TEST_F(CliAppTest, CheckWritesNothing) {
    EXPECT_EQ(check_directory(dir_, settings_), 0);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "red_ring 0.1 0.1 0.2 0.2\n0 0.5 0.5 0.3 0.3\n");
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\n");
}

TEST_F(CliAppTest, CheckFailsOnMalformedLines) {
    add_malformed_image();
    EXPECT_EQ(check_directory(dir_, settings_), 1);
}

TEST_F(CliAppTest, CheckMissingDirectory) {
    EXPECT_EQ(check_directory(dir_ / "absent", settings_), 1);
}

// =============================================================================
// migrate
// =============================================================================

TEST_F(CliAppTest, MigrateRewritesNamedTokens) {
    EXPECT_EQ(migrate_directory(dir_, settings_, MigrateOptions{}), 0);

    EXPECT_EQ(read_file(dir_ / "a.txt"),
              "1 0.100000 0.100000 0.200000 0.200000\n"
              "0 0.500000 0.500000 0.300000 0.300000\n");
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\nred_ring\n");
}

TEST_F(CliAppTest, MigrateDryRunWritesNothing) {
    MigrateOptions options;
    options.dry_run = true;

    EXPECT_EQ(migrate_directory(dir_, settings_, options), 0);
    EXPECT_EQ(read_file(dir_ / "a.txt"), "red_ring 0.1 0.1 0.2 0.2\n0 0.5 0.5 0.3 0.3\n");
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\n");
}

TEST_F(CliAppTest, MigrateSkipsMalformedFiles) {
    add_malformed_image();
    EXPECT_EQ(migrate_directory(dir_, settings_, MigrateOptions{}), 0);
    EXPECT_EQ(read_file(dir_ / "b.txt"), "0 0.1\nblue_ring 0.2 0.2 0.1 0.1\n");
}

TEST_F(CliAppTest, MigrateCanDropMalformedLines) {
    add_malformed_image();
    MigrateOptions options;
    options.drop_malformed = true;

    EXPECT_EQ(migrate_directory(dir_, settings_, options), 0);
    EXPECT_EQ(read_file(dir_ / "b.txt"), "0 0.200000 0.200000 0.100000 0.100000\n");
}

TEST_F(CliAppTest, MigrateUsesConfiguredClassFile) {
    write_file(dir_ / "classes.txt", "red_ring\n");
    settings_.class_file = "classes.txt";

    EXPECT_EQ(migrate_directory(dir_, settings_, MigrateOptions{}), 0);
    EXPECT_EQ(read_file(dir_ / "a.txt"),
              "0 0.100000 0.100000 0.200000 0.200000\n"
              "0 0.500000 0.500000 0.300000 0.300000\n");
    EXPECT_EQ(read_file(dir_ / "classes.txt"), "red_ring\n");
}

// =============================================================================
// classes
// =============================================================================

TEST_F(CliAppTest, ClassesAppendsNames) {
    EXPECT_EQ(list_classes(dir_, settings_, {"zebra", "blue_ring"}), 0);
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\nzebra\n");
}

TEST_F(CliAppTest, ClassesRejectsBlankName) {
    EXPECT_EQ(list_classes(dir_, settings_, {"  "}), 1);
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\n");
}

// =============================================================================
// Argument parsing
// =============================================================================

TEST_F(CliAppTest, RunDispatchesSubcommand) {
    EXPECT_EQ(run_args({"-q", "classes", dir_.string(), "--add", "kite"}), 0);
    EXPECT_EQ(read_file(dir_ / "_darknet.labels"), "blue_ring\nkite\n");
}

TEST_F(CliAppTest, RunWithConfigFile) {
    const fs::path config = dir_ / "settings.json";
    write_file(config, R"({ "class_file": "custom.labels" })");

    EXPECT_EQ(run_args({"-q", "-c", config.string(), "classes", dir_.string(), "--add", "kite"}), 0);
    EXPECT_EQ(read_file(dir_ / "custom.labels"), "kite\n");
}

TEST_F(CliAppTest, RunRejectsInvalidConfig) {
    const fs::path config = dir_ / "settings.json";
    write_file(config, R"({ "undo_capacity": 0 })");

    EXPECT_EQ(run_args({"-q", "-c", config.string(), "check", dir_.string()}), 1);
}

TEST_F(CliAppTest, RunRequiresSubcommand) {
    EXPECT_NE(run_args({}), 0);
}

}  // namespace bxa::cli
