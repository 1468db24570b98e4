#include "docguard/infra/glob.hpp"

namespace docguard::infra {

auto GlobPattern::compile(std::string_view pattern, std::size_t max_length)
    -> Result<GlobPattern> {
    if (pattern.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid glob pattern", "empty"));
    }
    if (pattern.size() > max_length) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Invalid glob pattern",
            "longer than " + std::to_string(max_length) + " characters"));
    }

    // Collapse runs of '*'; they are equivalent to one.
    std::string compiled;
    compiled.reserve(pattern.size());
    for (char c : pattern) {
        if (c == '*' && !compiled.empty() && compiled.back() == '*') continue;
        compiled += c;
    }
    return GlobPattern(std::move(compiled));
}

auto GlobPattern::matches(std::string_view name) const -> bool {
    std::string_view pat = pattern_;
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (n < name.size()) {
        if (p < pat.size() && pat[p] == '*') {
            star = p++;
            resume = n;
        } else if (p < pat.size() && pat[p] == name[n]) {
            ++p;
            ++n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }

    while (p < pat.size() && pat[p] == '*') {
        ++p;
    }
    return p == pat.size();
}

} // namespace docguard::infra
