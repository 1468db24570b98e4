#include "docguard/infra/path_guard.hpp"

#include "docguard/core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace docguard::infra {

namespace fs = std::filesystem;

namespace {

auto has_nul(std::string_view s) -> bool {
    return s.find('\0') != std::string_view::npos;
}

auto has_literal_traversal(std::string_view path) -> bool {
    return path.starts_with("..") ||
           path.find("/../") != std::string_view::npos ||
           path.ends_with("/..");
}

auto is_absolute_form(std::string_view path) -> bool {
    if (path.starts_with('/')) return true;
    return path.size() >= 2 &&
           std::isalpha(static_cast<unsigned char>(path[0])) &&
           path[1] == ':';
}

auto strip_trailing_separator(fs::path p) -> fs::path {
    if (!p.has_filename() && p.has_relative_path()) {
        return p.parent_path();
    }
    return p;
}

auto deny(DenialReason reason, std::string message, const std::string& path,
          std::string_view project_root) -> Result<fs::path> {
    AUDIT_WARN("denied [{}] path='{}' root='{}'",
               denial_reason_to_string(reason), path, project_root);
    return std::unexpected(make_denial(reason, std::move(message), path));
}

} // anonymous namespace

auto normalize_separators(std::string_view path) -> std::string {
    std::string out(path);
    std::ranges::replace(out, '\\', '/');
    return out;
}

auto resolve_root(std::string_view project_root) -> Result<fs::path> {
    if (project_root.empty() || has_nul(project_root)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid project root", project_root.empty() ? "empty" : "contains NUL byte"));
    }

    std::error_code ec;
    auto root = fs::absolute(fs::path(normalize_separators(project_root)), ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid project root", std::string(project_root) + ": " + ec.message()));
    }
    return strip_trailing_separator(root.lexically_normal());
}

auto is_within_root(const fs::path& candidate, const fs::path& root) -> bool {
    auto rel = candidate.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

auto PathGuard::validate(std::string_view requested_path,
                         std::string_view project_root) const -> Result<fs::path> {
    if (requested_path.empty() || has_nul(requested_path)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid file path", requested_path.empty() ? "empty" : "contains NUL byte"));
    }
    if (project_root.empty() || has_nul(project_root)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid project root", project_root.empty() ? "empty" : "contains NUL byte"));
    }

    auto normalized = normalize_separators(requested_path);

    if (has_literal_traversal(normalized)) {
        return deny(DenialReason::TraversalDetected, "Path traversal detected",
                    normalized, project_root);
    }

    if (is_absolute_form(normalized)) {
        return deny(DenialReason::AbsolutePathRejected, "Absolute path not allowed",
                    normalized, project_root);
    }

    if (!allow_list_.is_root_file(normalized) &&
        !allow_list_.is_under_documented_dir(normalized) &&
        !allow_list_.first_segment_documented(normalized)) {
        return deny(DenialReason::AccessDenied, "Access denied", normalized, project_root);
    }

    auto root = resolve_root(project_root);
    if (!root) {
        return std::unexpected(root.error());
    }

    auto candidate = strip_trailing_separator((*root / normalized).lexically_normal());
    if (!is_within_root(candidate, *root)) {
        return deny(DenialReason::TraversalDetected, "Path traversal detected",
                    normalized, project_root);
    }

    LOG_TRACE("validated '{}' -> {}", normalized, candidate.string());
    return candidate;
}

auto PathGuard::is_documented_directory(std::string_view path) const -> bool {
    if (path.empty()) return false;
    return allow_list_.is_under_documented_dir(normalize_separators(path));
}

auto PathGuard::is_safe_path(std::string_view path, std::string_view project_root) const -> bool {
    if (path.empty() || path == ".") return true;
    if (has_nul(path)) return false;

    auto root = resolve_root(project_root);
    if (!root) return false;

    // An absolute operand replaces the root, so containment still decides.
    auto candidate = (*root / normalize_separators(path)).lexically_normal();
    return is_within_root(strip_trailing_separator(candidate), *root);
}

} // namespace docguard::infra
