#include "docguard/infra/allow_list.hpp"

#include <algorithm>

namespace docguard::infra {

namespace {

auto canonical_entry(std::string_view entry) -> std::string {
    std::string out(entry);
    std::ranges::replace(out, '\\', '/');
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

auto canonical_entries(std::vector<std::string> entries) -> std::vector<std::string> {
    for (auto& e : entries) {
        e = canonical_entry(e);
    }
    std::erase_if(entries, [](const std::string& e) { return e.empty(); });
    return entries;
}

} // anonymous namespace

AllowList::AllowList(std::vector<std::string> documented_dirs,
                     std::vector<std::string> root_files)
    : documented_dirs_(canonical_entries(std::move(documented_dirs))),
      root_files_(canonical_entries(std::move(root_files))) {}

auto AllowList::is_root_file(std::string_view path) const -> bool {
    return std::ranges::find(root_files_, path) != root_files_.end();
}

auto AllowList::is_under_documented_dir(std::string_view path) const -> bool {
    return std::ranges::any_of(documented_dirs_, [path](const std::string& dir) {
        return path == dir ||
               (path.size() > dir.size() && path.starts_with(dir) && path[dir.size()] == '/');
    });
}

auto AllowList::first_segment_documented(std::string_view path) const -> bool {
    auto first = path.substr(0, path.find('/'));
    return std::ranges::find(documented_dirs_, first) != documented_dirs_.end();
}

auto default_allow_list() -> const AllowList& {
    static const AllowList list(
        {
            ".claude/commands",
            ".claude/agents",
            "commands",
            "agents",
            "docs",
            "lib",
            "scripts",
        },
        {
            "package.json",
            "README.md",
            "PLUGIN.md",
            "CLAUDE.md",
            "PLANNING.md",
            ".claude-plugin/plugin.json",
            ".claude-plugin/marketplace.json",
        });
    return list;
}

} // namespace docguard::infra
