#include "tools/file_tool.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace toolgate::tools {

using core::errors::ErrorCategory;
using core::errors::GateError;
using nlohmann::json;
using protocol::ToolResult;

namespace {

constexpr std::uintmax_t kMaxSearchFileBytes = 1024 * 1024;
constexpr std::size_t kDefaultMaxMatches = 50;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

std::optional<std::string> string_field(const json& input, const char* key) {
    const auto it = input.find(key);
    if (it == input.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

ToolResult from_error(const GateError& error) {
    return ToolResult::error(core::errors::describe(error));
}

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool write_text(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    return out.good();
}

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

FileTool::FileTool(std::filesystem::path workspace_root, policy::Safeguard safeguard)
    : DomainTool(domain_spec()),
      workspace_root_(std::move(workspace_root)),
      safeguard_(std::move(safeguard)) {}

DomainSpec FileTool::domain_spec() {
    DomainSpec spec;
    spec.domain = "file";
    spec.description = "Read, write, edit and search files inside the workspace.";
    spec.resources = {{"file", {"read", "write", "edit", "grep"}, ""}};
    spec.aliases = {{"files", "file"}, {"fs", "file"}, {"filesystem", "file"}};

    FieldSpec path{"path", "string", "File path relative to the workspace."};
    path.required_for = {"read", "write", "edit"};
    FieldSpec content{"content", "string", "Full file content to write."};
    content.required_for = {"write"};
    FieldSpec old_string{"old_string", "string", "Exact text to replace."};
    old_string.required_for = {"edit"};
    FieldSpec new_string{"new_string", "string", "Replacement text."};
    new_string.required_for = {"edit"};
    FieldSpec replace_all{"replace_all", "boolean",
                          "Replace every occurrence instead of requiring a unique match."};
    replace_all.default_value = false;
    FieldSpec pattern{"pattern", "string", "Literal text to search for."};
    pattern.required_for = {"grep"};
    FieldSpec max_matches{"max_matches", "integer", "Maximum matches returned by grep."};
    max_matches.default_value = kDefaultMaxMatches;
    spec.fields = {path, content, old_string, new_string, replace_all, pattern, max_matches};

    spec.examples = {
        R"({"action": "read", "path": "src/main.cpp"})",
        R"({"action": "edit", "path": "README.md", "old_string": "v1", "new_string": "v2"})",
        R"({"action": "grep", "pattern": "TODO", "path": "src"})",
    };
    return spec;
}

std::optional<FileTool::Action> FileTool::to_action(const Route& route) {
    static constexpr std::array<NamedValue<Action>, 4> kActions = {{
        {"read", Action::Read},
        {"write", Action::Write},
        {"edit", Action::Edit},
        {"grep", Action::Grep},
    }};
    if (route.resource != "file") {
        return std::nullopt;
    }
    return lookup_named(kActions, route.action);
}

ToolResult FileTool::dispatch(const protocol::RequestContext& ctx, const Route& route,
                              const json& input) {
    const auto action = to_action(route);
    if (!action.has_value()) {
        return unmapped(route);
    }
    switch (action.value()) {
        case Action::Read:
            return read(input);
        case Action::Write:
            return write(input);
        case Action::Edit:
            return edit(input);
        case Action::Grep:
            return grep(ctx, input);
    }
    return unmapped(route);
}

core::errors::Result<std::filesystem::path> FileTool::resolve(const json& input,
                                                              const bool for_write) const {
    const auto path = string_field(input, "path");
    if (!path.has_value() || path->empty()) {
        return GateError{ErrorCategory::Input, "path is required", "missing_path"};
    }
    auto resolved = safeguard_.validate_path_in_workspace(workspace_root_, path.value());
    if (core::errors::is_error(resolved) || !for_write) {
        return resolved;
    }
    return safeguard_.validate_writable_path(core::errors::get_value(resolved));
}

ToolResult FileTool::read(const json& input) const {
    const auto resolved = resolve(input, false);
    if (core::errors::is_error(resolved)) {
        return from_error(core::errors::get_error(resolved));
    }
    const std::filesystem::path& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ToolResult::error("File does not exist: " + file_path.string());
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ToolResult::error("Path is not a regular file: " + file_path.string());
    }
    if (is_probably_binary(file_path)) {
        return ToolResult::error("Refusing to read binary file: " + file_path.string());
    }

    const auto text = read_text(file_path);
    if (!text.has_value()) {
        return ToolResult::error("Failed to read file: " + file_path.string());
    }
    return ToolResult::ok(text.value());
}

ToolResult FileTool::write(const json& input) const {
    const auto content = string_field(input, "content");
    if (!content.has_value()) {
        return ToolResult::error("content is required for write");
    }
    const auto resolved = resolve(input, true);
    if (core::errors::is_error(resolved)) {
        return from_error(core::errors::get_error(resolved));
    }
    const std::filesystem::path& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return ToolResult::error("Failed to create directory: " +
                                 file_path.parent_path().string());
    }
    if (!write_text(file_path, content.value())) {
        return ToolResult::error("Failed to write file: " + file_path.string());
    }
    LOG_DEBUG("FileTool: wrote " + file_path.string());
    return ToolResult::ok("Wrote " + std::to_string(content->size()) + " bytes to " +
                          file_path.string());
}

ToolResult FileTool::edit(const json& input) const {
    const auto old_string = string_field(input, "old_string");
    const auto new_string = string_field(input, "new_string");
    if (!old_string.has_value() || old_string->empty() || !new_string.has_value()) {
        return ToolResult::error("old_string and new_string are required for edit");
    }
    const auto resolved = resolve(input, true);
    if (core::errors::is_error(resolved)) {
        return from_error(core::errors::get_error(resolved));
    }
    const std::filesystem::path& file_path = core::errors::get_value(resolved);

    auto text = read_text(file_path);
    if (!text.has_value()) {
        return ToolResult::error("Failed to read file: " + file_path.string());
    }

    const auto replace_it = input.find("replace_all");
    const bool replace_all =
        replace_it != input.end() && replace_it->is_boolean() && replace_it->get<bool>();
    const std::size_t occurrences = count_occurrences(text.value(), old_string.value());
    if (occurrences == 0) {
        return ToolResult::error("old_string not found in " + file_path.string());
    }
    if (occurrences > 1 && !replace_all) {
        return ToolResult::error("old_string occurs " + std::to_string(occurrences) +
                                 " times in " + file_path.string() +
                                 "; add context or set replace_all");
    }

    std::string& body = text.value();
    std::size_t replaced = 0;
    for (auto pos = body.find(old_string.value()); pos != std::string::npos;
         pos = body.find(old_string.value(), pos + new_string->size())) {
        body.replace(pos, old_string->size(), new_string.value());
        ++replaced;
        if (!replace_all) {
            break;
        }
    }

    if (!write_text(file_path, body)) {
        return ToolResult::error("Failed to write file: " + file_path.string());
    }
    return ToolResult::ok("Replaced " + std::to_string(replaced) + " occurrence(s) in " +
                          file_path.string());
}

ToolResult FileTool::grep(const protocol::RequestContext& ctx, const json& input) const {
    const auto pattern = string_field(input, "pattern");
    if (!pattern.has_value() || pattern->empty()) {
        return ToolResult::error("pattern is required for grep");
    }
    std::size_t max_matches = kDefaultMaxMatches;
    const auto max_it = input.find("max_matches");
    if (max_it != input.end() && max_it->is_number_integer() &&
        max_it->get<std::int64_t>() > 0) {
        max_matches = max_it->get<std::size_t>();
    }

    const auto scope_arg = string_field(input, "path");
    const auto resolved = safeguard_.validate_path_in_workspace(
        workspace_root_, scope_arg.has_value() && !scope_arg->empty() ? *scope_arg : ".");
    if (core::errors::is_error(resolved)) {
        return from_error(core::errors::get_error(resolved));
    }
    const std::filesystem::path& scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    std::filesystem::path base = scope_path;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
        base = scope_path.parent_path();
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (std::filesystem::recursive_directory_iterator it(scope_path, options, ec), end;
             !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec) && !ec) {
                files.push_back(it->path());
            }
        }
    } else {
        return ToolResult::error("Scope does not exist: " + scope_path.string());
    }

    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= max_matches || ctx.done()) {
            break;
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxSearchFileBytes || is_probably_binary(file)) {
            continue;
        }
        std::ifstream in(file);
        std::string line;
        std::size_t line_no = 0;
        while (matches < max_matches && std::getline(in, line)) {
            ++line_no;
            if (line.find(pattern.value()) == std::string::npos) {
                continue;
            }
            out << std::filesystem::relative(file, base, ec).string() << ":"
                << line_no << ":" << trim_line(line) << "\n";
            ++matches;
        }
    }

    if (ctx.done()) {
        return ToolResult::error("grep cancelled");
    }
    if (matches == 0) {
        return ToolResult::ok("No matches found for \"" + pattern.value() + "\".");
    }
    return ToolResult::ok(out.str());
}

}  // namespace toolgate::tools
