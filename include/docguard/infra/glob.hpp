#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "docguard/core/error.hpp"

namespace docguard::infra {

/// Filename glob where `*` matches any run of characters (including none)
/// and every other character, '.' included, matches only itself.
///
/// Matching is a two-pointer scan with single-star backtracking, so the
/// cost is bounded by pattern length times name length regardless of how
/// the pattern is written.
class GlobPattern {
public:
    /// Fails with ErrorCode::InvalidArgument when `pattern` is empty or
    /// longer than `max_length`.
    static auto compile(std::string_view pattern, std::size_t max_length = 256)
        -> Result<GlobPattern>;

    [[nodiscard]] auto matches(std::string_view name) const -> bool;

    [[nodiscard]] auto pattern() const noexcept -> const std::string& { return pattern_; }

private:
    explicit GlobPattern(std::string pattern) : pattern_(std::move(pattern)) {}

    std::string pattern_;
};

} // namespace docguard::infra
