/**
 * @file    cli_app.hpp
 * @brief   CLI Application Interface
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Dataset maintenance commands that run without the editor:
 *   check    validate every annotation file of a directory
 *   migrate  rewrite legacy class-name tokens as numeric ids
 *   classes  list or extend the class file
 */

#pragma once

#include "core/settings.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bxa::cli {

struct MigrateOptions {
    bool dry_run = false;
    bool drop_malformed = false;
};

/**
 * Validate annotation files. Writes nothing.
 * @return  exit code, 1 if any file had malformed lines
 */
int check_directory(const std::filesystem::path& dir, const EditorSettings& settings);

/**
 * Rewrite annotation files with numeric ids and persist new classes
 * @return  exit code, 1 if any write failed
 */
int migrate_directory(const std::filesystem::path& dir,
                      const EditorSettings& settings,
                      const MigrateOptions& options);

/**
 * Print the class table, appending new names first
 * @return  exit code
 */
int list_classes(const std::filesystem::path& dir,
                 const EditorSettings& settings,
                 const std::vector<std::string>& add);

/**
 * Parse arguments and dispatch to a subcommand
 */
int run(int argc, char** argv);

}  // namespace bxa::cli
