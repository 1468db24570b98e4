#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "docguard/core/error.hpp"
#include "docguard/infra/allow_list.hpp"

namespace docguard::infra {

/// Decides whether a root-relative path may be resolved under a project root.
///
/// Checks are layered: a cheap literal traversal scan, absolute-path
/// rejection, a default-deny allow-list lookup, and finally a lexical
/// canonicalization that must keep the candidate under the root. The last
/// step always runs, even for allow-listed paths.
///
/// PathGuard never stats or opens anything; it only rewrites path strings.
/// Symlink targets are the caller's concern (see FileAccessor).
class PathGuard {
public:
    explicit PathGuard(AllowList allow_list = default_allow_list())
        : allow_list_(std::move(allow_list)) {}

    /// Returns the absolute, lexically normalized path of `requested_path`
    /// under `project_root`.
    ///
    /// Fails with ErrorCode::InvalidArgument for an empty or NUL-bearing
    /// argument, or ErrorCode::SecurityDenial with one of
    /// TraversalDetected / AbsolutePathRejected / AccessDenied.
    [[nodiscard]] auto validate(std::string_view requested_path,
                                std::string_view project_root) const
        -> Result<std::filesystem::path>;

    /// True when `path` is, or lies beneath, a documented directory.
    [[nodiscard]] auto is_documented_directory(std::string_view path) const -> bool;

    /// Containment-only check: does `path` stay under `project_root` once
    /// resolved? Ignores the allow-list. Empty and "." are safe.
    [[nodiscard]] auto is_safe_path(std::string_view path,
                                    std::string_view project_root) const -> bool;

    [[nodiscard]] auto allow_list() const noexcept -> const AllowList& { return allow_list_; }

private:
    AllowList allow_list_;
};

/// Replaces every backslash with '/'.
auto normalize_separators(std::string_view path) -> std::string;

/// Resolves `project_root` to an absolute, lexically normal directory path
/// without a trailing separator.
auto resolve_root(std::string_view project_root) -> Result<std::filesystem::path>;

/// True when `candidate` equals `root` or lies beneath it (both lexically normal).
auto is_within_root(const std::filesystem::path& candidate,
                    const std::filesystem::path& root) -> bool;

} // namespace docguard::infra
