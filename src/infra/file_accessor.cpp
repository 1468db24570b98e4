#include "docguard/infra/file_accessor.hpp"

#include "docguard/core/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace docguard::infra {

namespace fs = std::filesystem;

namespace {

auto op_context(std::string_view op, std::string_view path) -> std::string {
    std::string out(op);
    out += '(';
    out += path;
    out += ')';
    return out;
}

auto read_file(const fs::path& path) -> Result<std::string> {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "No such file or directory"));
    }
    if (fs::is_directory(status)) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "Is a directory"));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "Cannot open file"));
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "Read failed"));
    }
    return content;
}

} // anonymous namespace

FileAccessor::FileAccessor(PathGuard guard, AccessLimits limits)
    : guard_(std::move(guard)), limits_(std::move(limits)) {}

auto FileAccessor::exists(std::string_view path, std::string_view root) const -> bool {
    auto resolved = guard_.validate(path, root);
    if (!resolved) {
        LOG_DEBUG("exists({}): {}", path, resolved.error().what());
        return false;
    }

    std::error_code ec;
    auto found = fs::exists(*resolved, ec);
    if (ec) {
        LOG_DEBUG("exists({}): {}", path, ec.message());
        return false;
    }
    return found;
}

auto FileAccessor::is_symlink(std::string_view path, std::string_view root) const -> bool {
    auto resolved = guard_.validate(path, root);
    if (!resolved) {
        LOG_DEBUG("isSymlink({}): {}", path, resolved.error().what());
        return false;
    }

    std::error_code ec;
    auto status = fs::symlink_status(*resolved, ec);
    if (ec) {
        return false;
    }
    return fs::is_symlink(status);
}

auto FileAccessor::read_text(std::string_view path, std::string_view root) const
    -> Result<std::string> {
    auto context = op_context("readText", path);

    auto resolved = resolve_contained(path, root);
    if (!resolved) {
        return std::unexpected(resolved.error().wrap(context));
    }

    auto content = read_file(*resolved);
    if (!content) {
        LOG_DEBUG("{}: {}", context, content.error().what());
        return std::unexpected(content.error().wrap(context));
    }
    return content;
}

auto FileAccessor::read_json(std::string_view path, std::string_view root) const
    -> Result<json> {
    auto context = op_context("readJSON", path);

    auto resolved = resolve_contained(path, root);
    if (!resolved) {
        return std::unexpected(resolved.error().wrap(context));
    }

    auto content = read_file(*resolved);
    if (!content) {
        return std::unexpected(content.error().wrap(context));
    }

    try {
        return json::parse(*content);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::IoFailure, context,
            std::string("parse error: ") + e.what()));
    }
}

auto FileAccessor::count_files(std::string_view dir, std::string_view pattern,
                               std::string_view root) const -> Result<std::size_t> {
    auto context = op_context("countFiles", dir);

    auto resolved = resolve_contained(dir, root);
    if (!resolved) {
        return std::unexpected(resolved.error().wrap(context));
    }

    auto glob = GlobPattern::compile(pattern, limits_.max_pattern_length);
    if (!glob) {
        return std::unexpected(glob.error().wrap(context));
    }

    std::size_t count = 0;
    auto walked = walk(*resolved, *glob, false, [&count](const fs::path&) { ++count; });
    if (!walked) {
        return std::unexpected(walked.error().wrap(context));
    }
    return count;
}

auto FileAccessor::find_files(std::string_view dir, std::string_view pattern,
                              std::string_view root) const
    -> Result<std::vector<std::string>> {
    auto context = op_context("findFiles", dir);

    auto resolved = resolve_contained(dir, root);
    if (!resolved) {
        return std::unexpected(resolved.error().wrap(context));
    }

    auto glob = GlobPattern::compile(pattern, limits_.max_pattern_length);
    if (!glob) {
        return std::unexpected(glob.error().wrap(context));
    }

    std::vector<std::string> found;
    auto walked = walk(*resolved, *glob, true, [&found, root](const fs::path& match) {
        found.push_back(relative_path(match, root));
    });
    if (!walked) {
        return std::unexpected(walked.error().wrap(context));
    }

    std::ranges::sort(found);
    return found;
}

auto FileAccessor::read_symlink_target(std::string_view path, std::string_view root) const
    -> std::optional<std::string> {
    auto resolved = guard_.validate(path, root);
    if (!resolved) {
        LOG_DEBUG("readSymlinkTarget({}): {}", path, resolved.error().what());
        return std::nullopt;
    }

    std::error_code ec;
    auto target = fs::read_symlink(*resolved, ec);
    if (ec) {
        LOG_DEBUG("readSymlinkTarget({}): {}", path, ec.message());
        return std::nullopt;
    }
    return target.string();
}

auto FileAccessor::relative_path(const fs::path& full, std::string_view root) -> std::string {
    auto root_path = resolve_root(root);
    if (!root_path) {
        return full.generic_string();
    }

    std::error_code ec;
    auto absolute = fs::absolute(full, ec);
    if (ec) {
        return full.generic_string();
    }

    auto rel = absolute.lexically_normal().lexically_relative(*root_path);
    if (rel.empty()) {
        return full.generic_string();
    }
    return rel.generic_string();
}

auto FileAccessor::resolve_contained(std::string_view path, std::string_view root) const
    -> Result<fs::path> {
    auto resolved = guard_.validate(path, root);
    if (!resolved) {
        return resolved;
    }

    std::error_code ec;
    if (!fs::exists(*resolved, ec)) {
        // Nothing to follow; the I/O layer reports the absence.
        return resolved;
    }

    auto target = fs::canonical(*resolved, ec);
    if (ec) {
        return resolved;
    }

    auto lexical_root = resolve_root(root);
    if (!lexical_root) {
        return std::unexpected(lexical_root.error());
    }
    auto canonical_root = fs::weakly_canonical(*lexical_root, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
            "Failed to resolve project root", ec.message()));
    }

    if (!is_within_root(target, canonical_root)) {
        AUDIT_WARN("denied [{}] path='{}' root='{}' target outside root",
                   denial_reason_to_string(DenialReason::SymlinkEscape), path, root);
        return std::unexpected(make_denial(DenialReason::SymlinkEscape,
            "Symlink escapes project root", normalize_separators(path)));
    }
    return resolved;
}

auto FileAccessor::walk(const fs::path& start, const GlobPattern& glob,
                        bool apply_excludes, const MatchVisitor& on_match) const -> VoidResult {
    std::error_code ec;
    if (!fs::exists(start, ec)) {
        LOG_DEBUG("walk: {} does not exist, nothing to count", start.string());
        return {};
    }
    if (!fs::is_directory(start, ec)) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "Not a directory"));
    }

    std::size_t visited = 0;
    return walk_dir(start, 0, visited, glob, apply_excludes, on_match);
}

auto FileAccessor::walk_dir(const fs::path& dir, std::size_t depth, std::size_t& visited,
                            const GlobPattern& glob, bool apply_excludes,
                            const MatchVisitor& on_match) const -> VoidResult {
    if (depth > limits_.max_depth) {
        return std::unexpected(make_error(ErrorCode::IoFailure, "walk limit exceeded",
            "depth greater than " + std::to_string(limits_.max_depth)));
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (++visited > limits_.max_entries) {
            return std::unexpected(make_error(ErrorCode::IoFailure, "walk limit exceeded",
                "more than " + std::to_string(limits_.max_entries) + " entries"));
        }

        const auto& entry = *it;
        std::error_code st_ec;
        auto status = entry.symlink_status(st_ec);
        if (st_ec) {
            return std::unexpected(make_error(ErrorCode::IoFailure,
                "Cannot stat entry", st_ec.message()));
        }

        auto name = entry.path().filename().string();
        if (fs::is_directory(status)) {
            if (apply_excludes &&
                std::ranges::find(limits_.exclude_dirs, name) != limits_.exclude_dirs.end()) {
                LOG_TRACE("walk: skipping excluded directory {}", entry.path().string());
                continue;
            }
            auto nested = walk_dir(entry.path(), depth + 1, visited, glob,
                                   apply_excludes, on_match);
            if (!nested) {
                return nested;
            }
        } else if (fs::is_regular_file(status) && glob.matches(name)) {
            on_match(entry.path());
        }
    }

    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoFailure,
            "Cannot read directory", ec.message()));
    }
    return {};
}

} // namespace docguard::infra
