#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docguard::infra {

/// Immutable authorization policy consumed by PathGuard.
///
/// `documented_dirs` are directory prefixes permitted for recursive access;
/// `root_files` are exact root-relative paths permitted only as written.
/// Entries are stored with '/' separators and no trailing slash.
class AllowList {
public:
    AllowList(std::vector<std::string> documented_dirs,
              std::vector<std::string> root_files);

    [[nodiscard]] auto documented_dirs() const noexcept -> const std::vector<std::string>& {
        return documented_dirs_;
    }
    [[nodiscard]] auto root_files() const noexcept -> const std::vector<std::string>& {
        return root_files_;
    }

    [[nodiscard]] auto is_root_file(std::string_view path) const -> bool;

    /// True when `path` equals a documented directory or lies beneath one.
    [[nodiscard]] auto is_under_documented_dir(std::string_view path) const -> bool;

    /// True when the first segment of `path` equals a documented directory.
    [[nodiscard]] auto first_segment_documented(std::string_view path) const -> bool;

private:
    std::vector<std::string> documented_dirs_;
    std::vector<std::string> root_files_;
};

/// The policy shipped with docguard. Built once on first use.
auto default_allow_list() -> const AllowList&;

} // namespace docguard::infra
