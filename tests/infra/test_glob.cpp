#include <catch2/catch_test_macros.hpp>

#include "docguard/infra/glob.hpp"

#include <string>

using namespace docguard;
using namespace docguard::infra;

TEST_CASE("GlobPattern matches extension wildcards", "[infra][glob]") {
    auto glob = GlobPattern::compile("*.md");
    REQUIRE(glob.has_value());

    CHECK(glob->matches("a.md"));
    CHECK(glob->matches("file.v2.md"));
    CHECK(glob->matches(".hidden.md"));
    CHECK(glob->matches(".md"));

    CHECK_FALSE(glob->matches("a.mdx"));
    CHECK_FALSE(glob->matches("amd"));
    CHECK_FALSE(glob->matches("a.MD"));
    CHECK_FALSE(glob->matches("md"));
}

TEST_CASE("GlobPattern treats every non-star character literally", "[infra][glob]") {
    auto dot = GlobPattern::compile("file.*");
    REQUIRE(dot.has_value());
    CHECK(dot->matches("file.txt"));
    CHECK(dot->matches("file."));
    CHECK_FALSE(dot->matches("filetxt"));

    auto meta = GlobPattern::compile("a+b.md");
    REQUIRE(meta.has_value());
    CHECK(meta->matches("a+b.md"));
    CHECK_FALSE(meta->matches("aab.md"));
    CHECK_FALSE(meta->matches("ab.md"));

    auto group = GlobPattern::compile("(x)?[y]*");
    REQUIRE(group.has_value());
    CHECK(group->matches("(x)?[y]"));
    CHECK(group->matches("(x)?[y]tail"));
    CHECK_FALSE(group->matches("xy"));
}

TEST_CASE("GlobPattern handles multiple stars", "[infra][glob]") {
    auto glob = GlobPattern::compile("a*b*c");
    REQUIRE(glob.has_value());

    CHECK(glob->matches("abc"));
    CHECK(glob->matches("aXbYc"));
    CHECK(glob->matches("abcbc"));
    CHECK_FALSE(glob->matches("acb"));
    CHECK_FALSE(glob->matches("abcd"));

    auto any = GlobPattern::compile("*");
    REQUIRE(any.has_value());
    CHECK(any->matches(""));
    CHECK(any->matches("anything.at.all"));
}

TEST_CASE("GlobPattern collapses repeated stars", "[infra][glob]") {
    auto glob = GlobPattern::compile("***.md");
    REQUIRE(glob.has_value());
    CHECK(glob->pattern() == "*.md");
    CHECK(glob->matches("x.md"));
}

TEST_CASE("GlobPattern stays fast on adversarial input", "[infra][glob]") {
    auto glob = GlobPattern::compile("*a*a*a*a*a*a*a*a*b");
    REQUIRE(glob.has_value());
    CHECK_FALSE(glob->matches(std::string(4096, 'a')));
}

TEST_CASE("GlobPattern::compile rejects empty and over-long patterns", "[infra][glob]") {
    auto empty = GlobPattern::compile("");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::InvalidArgument);

    auto too_long = GlobPattern::compile(std::string(300, 'a'));
    REQUIRE_FALSE(too_long.has_value());
    CHECK(too_long.error().code() == ErrorCode::InvalidArgument);

    CHECK_FALSE(GlobPattern::compile("*.md", 3).has_value());
    CHECK(GlobPattern::compile("*.md", 4).has_value());
}
