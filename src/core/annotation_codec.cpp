/**
 * @file    annotation_codec.cpp
 * @brief   Annotation and class file reading / writing
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "core/annotation_codec.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace bxa {

namespace {

constexpr std::size_t kFieldCount = 5;

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos >= line.size()) break;
        std::size_t end = pos;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) ++end;
        fields.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return fields;
}

bool parse_real(std::string_view field, double& out) {
    const char* first = field.data();
    const char* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last && std::isfinite(out);
}

SaveStatus classify_errno(int err) {
    const std::error_code ec(err, std::generic_category());
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return SaveStatus::PermissionDenied;
    }
    return SaveStatus::IoError;
}

SaveResult write_text_file(const fs::path& path, const std::string& content) {
    SaveResult result;

    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        const int err = errno;
        result.status = classify_errno(err);
        result.message = fmt::format("cannot open {} for writing: {}", path,
                                     err != 0 ? std::generic_category().message(err) : "unknown error");
        spdlog::error("{}", result.message);
        return result;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
        const int err = errno;
        result.status = classify_errno(err);
        result.message = fmt::format("write failed for {}", path);
        spdlog::error("{}", result.message);
        return result;
    }

    return result;
}

}  // anonymous namespace

// =============================================================================
// Annotation lines
// =============================================================================

ParseResult parse_annotations(std::istream& in, ClassRegistry& registry) {
    ParseResult result;
    std::string raw;
    std::size_t line_number = 0;

    while (std::getline(in, raw)) {
        ++line_number;
        const std::string_view line = trim(raw);     // Also drops CR of CRLF files
        if (line.empty()) {
            continue;
        }

        auto reject = [&](std::string reason) {
            result.errors.push_back(LineError{line_number, std::string(line), std::move(reason)});
        };

        const auto fields = split_fields(line);
        if (fields.size() != kFieldCount) {
            reject(fmt::format("expected {} fields, found {}", kFieldCount, fields.size()));
            continue;
        }

        std::array<double, 4> values{};
        bool numbers_ok = true;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!parse_real(fields[i + 1], values[i])) {
                reject(fmt::format("invalid number '{}'", fields[i + 1]));
                numbers_ok = false;
                break;
            }
        }
        if (!numbers_ok) {
            continue;
        }
        if (values[2] <= 0.0 || values[3] <= 0.0) {
            reject("box width and height must be positive");
            continue;
        }

        const std::string_view token = fields[0];
        ClassId class_id = 0;
        try {
            class_id = registry.resolve(token);
        } catch (const std::out_of_range& e) {
            reject(e.what());
            continue;
        }

        if (!ClassRegistry::is_numeric_token(token)) {
            ++result.legacy_tokens;
        }

        result.boxes.push_back(Box{class_id, values[0], values[1], values[2], values[3]});
    }

    return result;
}

ParseResult parse_annotations(std::string_view text, ClassRegistry& registry) {
    std::istringstream in{std::string(text)};
    return parse_annotations(in, registry);
}

std::string format_box(const Box& box) {
    return fmt::format("{} {:.{}f} {:.{}f} {:.{}f} {:.{}f}",
                       box.class_id,
                       box.cx, kCoordinatePrecision,
                       box.cy, kCoordinatePrecision,
                       box.w, kCoordinatePrecision,
                       box.h, kCoordinatePrecision);
}

std::string serialize_annotations(const std::vector<Box>& boxes) {
    std::string out;
    for (const auto& box : boxes) {
        out += format_box(box);
        out += '\n';
    }
    return out;
}

// =============================================================================
// Files
// =============================================================================

fs::path annotation_path_for(const fs::path& image_path) {
    fs::path out = image_path;
    out.replace_extension(".txt");
    return out;
}

ParseResult load_annotation_file(const fs::path& path, ClassRegistry& registry) {
    if (!fs::exists(path)) {
        spdlog::debug("No annotation file: {}", path);
        return {};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ParseResult result;
        result.errors.push_back(LineError{0, {}, fmt::format("cannot open {}", path)});
        spdlog::error("Failed to open annotation file: {}", path);
        return result;
    }

    ParseResult result = parse_annotations(file, registry);

    for (const auto& err : result.errors) {
        spdlog::warn("{}:{}: {} ('{}')", filename_utf8(path), err.line_number, err.reason, err.text);
    }
    spdlog::debug("Loaded {} box(es) from {} ({} error(s), {} legacy token(s))",
                  result.boxes.size(), path, result.errors.size(), result.legacy_tokens);
    return result;
}

SaveResult save_annotation_file(const fs::path& path, const std::vector<Box>& boxes) {
    SaveResult result = write_text_file(path, serialize_annotations(boxes));
    if (result.ok()) {
        spdlog::debug("Saved {} box(es) to {}", boxes.size(), path);
    }
    return result;
}

bool load_class_file(const fs::path& path, std::vector<std::string>& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open class file: {}", path);
        return false;
    }

    std::vector<std::string> names;
    std::string raw;
    while (std::getline(file, raw)) {
        names.emplace_back(trim(raw));
    }

    while (!names.empty() && names.back().empty()) {
        names.pop_back();
    }

    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i].empty()) {
            names[i] = ClassRegistry::placeholder_name(static_cast<ClassId>(i));
            spdlog::warn("{}:{}: blank class name, using '{}'", filename_utf8(path), i + 1, names[i]);
        } else if (seen.count(names[i]) != 0) {
            std::string replacement = ClassRegistry::placeholder_name(static_cast<ClassId>(i));
            spdlog::warn("{}:{}: duplicate class '{}', using '{}'",
                         filename_utf8(path), i + 1, names[i], replacement);
            names[i] = std::move(replacement);
        }
        seen.insert(names[i]);
    }

    out = std::move(names);
    spdlog::debug("Loaded {} class(es) from {}", out.size(), path);
    return true;
}

SaveResult save_class_file(const fs::path& path, const ClassRegistry& registry) {
    std::string content;
    for (const auto& name : registry.names()) {
        content += name;
        content += '\n';
    }

    SaveResult result = write_text_file(path, content);
    if (result.ok()) {
        spdlog::debug("Saved {} class(es) to {}", registry.size(), path);
    }
    return result;
}

}  // namespace bxa
