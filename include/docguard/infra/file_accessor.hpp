#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docguard/core/config.hpp"
#include "docguard/core/error.hpp"
#include "docguard/infra/glob.hpp"
#include "docguard/infra/path_guard.hpp"

namespace docguard::infra {

/// Filesystem reads mediated by PathGuard.
///
/// Boolean and advisory operations (exists, is_symlink, read_symlink_target)
/// swallow every failure, denials included. Read operations return the
/// failure wrapped as "<op>(<path>): <cause>"; a denial keeps
/// ErrorCode::SecurityDenial and its reason so callers can tell policy
/// blocks from ordinary I/O errors.
class FileAccessor {
public:
    explicit FileAccessor(PathGuard guard = PathGuard{}, AccessLimits limits = {});

    [[nodiscard]] auto exists(std::string_view path, std::string_view root) const -> bool;

    /// Classifies `path` itself; the link is never followed.
    [[nodiscard]] auto is_symlink(std::string_view path, std::string_view root) const -> bool;

    [[nodiscard]] auto read_text(std::string_view path, std::string_view root) const
        -> Result<std::string>;

    /// Read and parse failures share ErrorCode::IoFailure; parse failures
    /// carry a "parse error:" detail.
    [[nodiscard]] auto read_json(std::string_view path, std::string_view root) const
        -> Result<json>;

    /// Counts regular files below `dir` whose name matches `pattern`.
    /// A missing directory counts as zero. Symlinked subdirectories are
    /// not descended and symlinked files are not counted.
    [[nodiscard]] auto count_files(std::string_view dir, std::string_view pattern,
                                   std::string_view root) const -> Result<std::size_t>;

    /// Like count_files but returns sorted root-relative paths and skips
    /// directories named in AccessLimits::exclude_dirs.
    [[nodiscard]] auto find_files(std::string_view dir, std::string_view pattern,
                                  std::string_view root) const
        -> Result<std::vector<std::string>>;

    /// Raw link target, or nullopt on any failure.
    [[nodiscard]] auto read_symlink_target(std::string_view path,
                                           std::string_view root) const
        -> std::optional<std::string>;

    /// Root-relative generic form of `full`; "." when they are the same.
    static auto relative_path(const std::filesystem::path& full, std::string_view root)
        -> std::string;

    [[nodiscard]] auto guard() const noexcept -> const PathGuard& { return guard_; }
    [[nodiscard]] auto limits() const noexcept -> const AccessLimits& { return limits_; }

private:
    using MatchVisitor = std::function<void(const std::filesystem::path&)>;

    /// PathGuard validation plus a check that the symlink-resolved target,
    /// when it exists, is still under the canonical root.
    auto resolve_contained(std::string_view path, std::string_view root) const
        -> Result<std::filesystem::path>;

    auto walk(const std::filesystem::path& start, const GlobPattern& glob,
              bool apply_excludes, const MatchVisitor& on_match) const -> VoidResult;

    auto walk_dir(const std::filesystem::path& dir, std::size_t depth, std::size_t& visited,
                  const GlobPattern& glob, bool apply_excludes,
                  const MatchVisitor& on_match) const -> VoidResult;

    PathGuard guard_;
    AccessLimits limits_;
};

} // namespace docguard::infra
