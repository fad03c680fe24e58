#include "switchyard/path-pattern.hpp"

#include <gtest/gtest.h>

#include <array>
#include <span>
#include <stdexcept>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/path-split.hpp"

namespace switchyard {

TEST(PathSegment, ClassifiesTokens) {
  const auto literal = PathSegment::FromToken("users");
  EXPECT_EQ(literal.kind(), PathSegment::Kind::Literal);
  EXPECT_FALSE(literal.isWildcard());
  EXPECT_EQ(literal.literal(), "users");

  const auto wildcard = PathSegment::FromToken(kWildcardToken);
  EXPECT_EQ(wildcard.kind(), PathSegment::Kind::Wildcard);
  EXPECT_TRUE(wildcard.isWildcard());
  EXPECT_EQ(wildcard.literal(), "");
  EXPECT_EQ(wildcard, PathSegment::Wildcard());

  // only the exact token is a wildcard
  EXPECT_FALSE(PathSegment::FromToken("__").isWildcard());
  EXPECT_FALSE(PathSegment::FromToken("_x").isWildcard());
}

TEST(PathSegment, InvalidTokensThrow) {
  EXPECT_THROW(PathSegment::FromToken(""), std::invalid_argument);
  EXPECT_THROW(PathSegment::FromToken("a/b"), std::invalid_argument);
  EXPECT_THROW(PathSegment::FromToken("/"), std::invalid_argument);
}

TEST(PathPattern, RootPattern) {
  PathPattern root(http::Method::GET);
  EXPECT_TRUE(root.isRoot());
  EXPECT_EQ(root.size(), 0U);
  EXPECT_EQ(root.nbWildcards(), 0U);
  EXPECT_EQ(root.toString(), "/");
  EXPECT_EQ(root, PathPattern(http::Method::GET, {}));
  EXPECT_EQ(root, PathPattern::Parse(http::Method::GET, "/"));
  EXPECT_EQ(root, PathPattern::Parse(http::Method::GET, ""));
}

TEST(PathPattern, FromTokens) {
  PathPattern pattern(http::Method::POST, {"foo", "_", "bar", "_", "baz"});
  EXPECT_EQ(pattern.method(), http::Method::POST);
  ASSERT_EQ(pattern.size(), 5U);
  EXPECT_EQ(pattern.nbWildcards(), 2U);
  EXPECT_EQ(pattern[0].literal(), "foo");
  EXPECT_TRUE(pattern[1].isWildcard());
  EXPECT_EQ(pattern[2].literal(), "bar");
  EXPECT_TRUE(pattern[3].isWildcard());
  EXPECT_EQ(pattern[4].literal(), "baz");
  EXPECT_EQ(pattern.segments().size(), 5U);
  EXPECT_EQ(pattern.toString(), "/foo/_/bar/_/baz");
}

TEST(PathPattern, FromSpan) {
  static constexpr std::array<std::string_view, 2> kTokens{"users", "_"};
  PathPattern pattern(http::Method::GET, std::span<const std::string_view>(kTokens));
  EXPECT_EQ(pattern, PathPattern(http::Method::GET, {"users", "_"}));
}

TEST(PathPattern, ParseIgnoresEmptyComponents) {
  EXPECT_EQ(PathPattern::Parse(http::Method::GET, "/foo/_/bar"), PathPattern(http::Method::GET, {"foo", "_", "bar"}));
  EXPECT_EQ(PathPattern::Parse(http::Method::GET, "foo//_/bar/"), PathPattern(http::Method::GET, {"foo", "_", "bar"}));
}

TEST(PathPattern, InvalidTokensThrow) {
  EXPECT_THROW(PathPattern(http::Method::GET, {"foo", ""}), std::invalid_argument);
  EXPECT_THROW(PathPattern(http::Method::GET, {"foo/bar"}), std::invalid_argument);
}

TEST(PathPattern, Equality) {
  const PathPattern pattern(http::Method::GET, {"a", "_"});
  EXPECT_EQ(pattern, PathPattern(http::Method::GET, {"a", "_"}));
  EXPECT_NE(pattern, PathPattern(http::Method::POST, {"a", "_"}));
  EXPECT_NE(pattern, PathPattern(http::Method::GET, {"a", "b"}));
  EXPECT_NE(pattern, PathPattern(http::Method::GET, {"_", "_"}));
  EXPECT_NE(pattern, PathPattern(http::Method::GET, {"a"}));
  EXPECT_NE(pattern, PathPattern(http::Method::GET, {"A", "_"}));
}

TEST(PathPattern, MatchesLiteralsExactly) {
  const PathPattern pattern(http::Method::GET, {"foo", "bar"});
  EXPECT_TRUE(pattern.matches(SplitPathComponents("/foo/bar")));
  EXPECT_FALSE(pattern.matches(SplitPathComponents("/foo/baz")));
  EXPECT_FALSE(pattern.matches(SplitPathComponents("/Foo/bar")));
  EXPECT_FALSE(pattern.matches(SplitPathComponents("/foo")));
  EXPECT_FALSE(pattern.matches(SplitPathComponents("/foo/bar/baz")));
}

TEST(PathPattern, MatchCapturesWildcardsLeftToRight) {
  const PathPattern pattern(http::Method::POST, {"foo", "_", "bar", "_", "baz"});
  PathParams captures;
  ASSERT_TRUE(pattern.match(SplitPathComponents("/foo/1/bar/2/baz"), captures));
  ASSERT_EQ(captures.size(), 2U);
  EXPECT_EQ(captures[0], "1");
  EXPECT_EQ(captures[1], "2");
}

TEST(PathPattern, MatchLeavesCapturesUntouchedOnFailure) {
  const PathPattern pattern(http::Method::GET, {"_", "x"});
  PathParams captures;
  captures.emplace_back("previous");
  EXPECT_FALSE(pattern.match(SplitPathComponents("/a/y"), captures));
  ASSERT_EQ(captures.size(), 1U);
  EXPECT_EQ(captures[0], "previous");
}

TEST(PathPattern, RootMatchesOnlyZeroComponents) {
  const PathPattern root(http::Method::GET);
  PathParams captures;
  EXPECT_TRUE(root.match(SplitPathComponents("/"), captures));
  EXPECT_TRUE(captures.empty());
  EXPECT_FALSE(root.matches(SplitPathComponents("/x")));
}

TEST(PathPattern, WildcardAcceptsAnyComponent) {
  const PathPattern pattern(http::Method::GET, {"_"});
  for (std::string_view path : {"/x", "/_", "/%20", "/ab..cd"}) {
    PathParams captures;
    ASSERT_TRUE(pattern.match(SplitPathComponents(path), captures)) << path;
    ASSERT_EQ(captures.size(), 1U);
    EXPECT_EQ(captures[0], path.substr(1));
  }
}

}  // namespace switchyard
