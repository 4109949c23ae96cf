/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Command-line interface for BoxAnnotator dataset directories.
 * A directory holds images, one annotation file per image and the
 * class file shared by all of them.
 */

// Must be defined before any Windows headers
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include "cli/cli_app.hpp"
#include "core/annotation_codec.hpp"
#include "core/class_registry.hpp"
#include "core/image_catalog.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace bxa::cli {

namespace {

// =============================================================================
// Logging
// =============================================================================

void setup_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::get("bxa");
    if (!logger) {
        logger = spdlog::stdout_color_mt("bxa");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

// =============================================================================
// Processing helpers
// =============================================================================

struct BatchResult {
    int success = 0;
    int skipped = 0;
    int failed = 0;

    void print(std::string_view verb) const {
        int total = success + skipped + failed;
        fmt::print("\n");
        fmt::print(fmt::fg(fmt::color::green), "[SUMMARY] ");
        fmt::print("{}: {}", verb, success);
        if (skipped > 0) {
            fmt::print(fmt::fg(fmt::color::yellow), ", Skipped: {}", skipped);
        }
        if (failed > 0) {
            fmt::print(fmt::fg(fmt::color::red), ", Failed: {}", failed);
        }
        fmt::print(" (Total: {})\n", total);
    }
};

void print_ok(const fs::path& file, std::string_view detail) {
    fmt::print(fmt::fg(fmt::color::green), "[OK] ");
    fmt::print("{}", filename_utf8(file));
    if (!detail.empty()) {
        fmt::print(fmt::fg(fmt::color::gray), " {}", detail);
    }
    fmt::print("\n");
}

void print_skip(const fs::path& file, std::string_view reason) {
    fmt::print(fmt::fg(fmt::color::yellow), "[SKIP] ");
    fmt::print("{}: {}\n", filename_utf8(file), reason);
}

void print_fail(const fs::path& file, std::string_view reason) {
    fmt::print(fmt::fg(fmt::color::red), "[FAIL] ");
    fmt::print("{}: {}\n", filename_utf8(file), reason);
}

void print_line_errors(const ParseResult& parsed) {
    for (const auto& err : parsed.errors) {
        fmt::print(fmt::fg(fmt::color::gray), "    line {}: {} ('{}')\n",
                   err.line_number, err.reason, err.text);
    }
}

void print_new_classes(const ClassRegistry& registry, std::size_t first_new) {
    if (registry.size() <= first_new) return;

    fmt::print(fmt::fg(fmt::color::cyan), "\nNew classes:\n");
    for (std::size_t id = first_new; id < registry.size(); ++id) {
        fmt::print("  {:>4}  {}\n", id, registry.name(static_cast<ClassId>(id)));
    }
}

/**
 * Load the class file and list the images of a dataset directory
 */
bool open_dataset(const fs::path& dir,
                  const EditorSettings& settings,
                  ClassRegistry& registry,
                  ImageCatalog& catalog) {
    if (!catalog.scan(dir)) {
        fmt::print(fmt::fg(fmt::color::red), "[ERROR] ");
        fmt::print("Not a readable directory: {}\n", to_utf8(dir));
        return false;
    }

    const fs::path class_file = dir / path_from_utf8(settings.class_file);
    if (fs::exists(class_file)) {
        std::vector<std::string> names;
        if (!load_class_file(class_file, names)) {
            fmt::print(fmt::fg(fmt::color::red), "[ERROR] ");
            fmt::print("Cannot read class file: {}\n", to_utf8(class_file));
            return false;
        }
        registry.assign(std::move(names));
    } else {
        spdlog::info("No class file at {}", class_file);
    }

    spdlog::info("{} image(s), {} class(es) in {}", catalog.size(), registry.size(), dir);
    return true;
}

}  // anonymous namespace

// =============================================================================
// Commands
// =============================================================================

int check_directory(const fs::path& dir, const EditorSettings& settings) {
    ClassRegistry registry;
    ImageCatalog catalog;
    if (!open_dataset(dir, settings, registry, catalog)) {
        return 1;
    }

    const std::size_t known_classes = registry.size();
    BatchResult result;

    for (const auto& image : catalog.images()) {
        const fs::path txt = annotation_path_for(image);
        if (!fs::exists(txt)) {
            result.skipped++;
            spdlog::debug("No annotations for {}", image);
            continue;
        }

        const ParseResult parsed = load_annotation_file(txt, registry);
        if (parsed.ok()) {
            result.success++;
            std::string detail = fmt::format("({} box(es))", parsed.boxes.size());
            if (parsed.legacy_tokens > 0) {
                detail += fmt::format(" {} named class token(s)", parsed.legacy_tokens);
            }
            print_ok(txt, detail);
        } else {
            result.failed++;
            print_fail(txt, fmt::format("{} malformed line(s)", parsed.errors.size()));
            print_line_errors(parsed);
        }
    }

    print_new_classes(registry, known_classes);
    result.print("Valid");
    return (result.failed > 0) ? 1 : 0;
}

int migrate_directory(const fs::path& dir,
                      const EditorSettings& settings,
                      const MigrateOptions& options) {
    ClassRegistry registry;
    ImageCatalog catalog;
    if (!open_dataset(dir, settings, registry, catalog)) {
        return 1;
    }

    const std::size_t known_classes = registry.size();
    BatchResult result;

    if (options.dry_run) {
        fmt::print(fmt::fg(fmt::color::gray), "Dry run: nothing will be written\n\n");
    }

    for (const auto& image : catalog.images()) {
        const fs::path txt = annotation_path_for(image);
        if (!fs::exists(txt)) {
            continue;
        }

        const ParseResult parsed = load_annotation_file(txt, registry);

        if (!parsed.ok() && !options.drop_malformed) {
            result.skipped++;
            print_skip(txt, fmt::format("{} malformed line(s), use --drop-malformed", parsed.errors.size()));
            print_line_errors(parsed);
            continue;
        }
        if (parsed.ok() && parsed.legacy_tokens == 0) {
            spdlog::debug("Already numeric: {}", txt);
            continue;
        }

        if (!options.dry_run) {
            const SaveResult saved = save_annotation_file(txt, parsed.boxes);
            if (!saved.ok()) {
                result.failed++;
                print_fail(txt, fmt::format("{} ({})", saved.message, to_string(saved.status)));
                continue;
            }
        }

        result.success++;
        print_ok(txt, fmt::format("({} token(s) converted, {} line(s) dropped)",
                                  parsed.legacy_tokens, parsed.errors.size()));
    }

    print_new_classes(registry, known_classes);

    if (registry.size() > known_classes && !options.dry_run) {
        const fs::path class_file = dir / path_from_utf8(settings.class_file);
        const SaveResult saved = save_class_file(class_file, registry);
        if (!saved.ok()) {
            result.failed++;
            print_fail(class_file, saved.message);
        }
    }

    result.print(options.dry_run ? "Would migrate" : "Migrated");
    return (result.failed > 0) ? 1 : 0;
}

int list_classes(const fs::path& dir,
                 const EditorSettings& settings,
                 const std::vector<std::string>& add) {
    ClassRegistry registry;
    ImageCatalog catalog;
    if (!open_dataset(dir, settings, registry, catalog)) {
        return 1;
    }

    const std::size_t known_classes = registry.size();
    for (const auto& name : add) {
        try {
            registry.add_explicit(name);
        } catch (const std::invalid_argument& e) {
            spdlog::error("Cannot add class '{}': {}", name, e.what());
            return 1;
        }
    }

    if (registry.size() > known_classes) {
        const fs::path class_file = dir / path_from_utf8(settings.class_file);
        const SaveResult saved = save_class_file(class_file, registry);
        if (!saved.ok()) {
            print_fail(class_file, saved.message);
            return 1;
        }
    }

    for (std::size_t id = 0; id < registry.size(); ++id) {
        const auto color = id < known_classes ? fmt::color::white : fmt::color::green;
        fmt::print(fmt::fg(color), "{:>4}  {}\n", id, registry.name(static_cast<ClassId>(id)));
    }
    if (registry.empty()) {
        fmt::print(fmt::fg(fmt::color::gray), "(no classes)\n");
    }
    return 0;
}

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    CLI::App app{"BoxAnnotator - bounding box annotation dataset tool"};
    app.require_subcommand(1);

    app.set_version_flag("-V,--version", BXA_APP_VERSION);

    std::string config_path;
    app.add_option("-c,--config", config_path, "Editor settings file (JSON)")
        ->check(CLI::ExistingFile);

    // Verbosity
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    std::string dir_path;

    auto* check_cmd = app.add_subcommand("check", "Validate annotation files (writes nothing)");
    check_cmd->add_option("dir", dir_path, "Dataset directory")->required();

    MigrateOptions migrate_options;
    auto* migrate_cmd = app.add_subcommand("migrate", "Rewrite class-name tokens as numeric ids");
    migrate_cmd->add_option("dir", dir_path, "Dataset directory")->required();
    migrate_cmd->add_flag("--dry-run", migrate_options.dry_run, "Report without writing");
    migrate_cmd->add_flag("--drop-malformed", migrate_options.drop_malformed,
                          "Rewrite files with malformed lines, dropping those lines");

    std::vector<std::string> add_names;
    auto* classes_cmd = app.add_subcommand("classes", "List classes, optionally appending new ones");
    classes_cmd->add_option("dir", dir_path, "Dataset directory")->required();
    classes_cmd->add_option("--add", add_names, "Class names to append");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Configure logging
    if (quiet) {
        setup_logging(spdlog::level::err);
    } else if (verbose) {
        setup_logging(spdlog::level::debug);
    } else {
        setup_logging(spdlog::level::warn);
    }

    try {
        EditorSettings settings;
        if (!config_path.empty() && !load_settings(path_from_utf8(config_path), settings)) {
            fmt::print(fmt::fg(fmt::color::red), "[ERROR] ");
            fmt::print("Invalid settings file: {}\n", config_path);
            return 1;
        }

        const fs::path dir = path_from_utf8(dir_path);

        if (*check_cmd) {
            return check_directory(dir, settings);
        }
        if (*migrate_cmd) {
            return migrate_directory(dir, settings, migrate_options);
        }
        if (*classes_cmd) {
            return list_classes(dir, settings, add_names);
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace bxa::cli
