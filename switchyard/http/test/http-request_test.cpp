#include "switchyard/http-request.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "switchyard/http-method.hpp"

namespace switchyard {

TEST(HttpRequest, SplitsTargetIntoPathAndQuery) {
  HttpRequest req(http::Method::GET, "/items/42?sort=asc&limit=10");
  EXPECT_EQ(req.method(), http::Method::GET);
  EXPECT_EQ(req.path(), "/items/42");
  EXPECT_EQ(req.query(), "sort=asc&limit=10");
}

TEST(HttpRequest, TargetWithoutQuery) {
  HttpRequest req(http::Method::POST, "/items");
  EXPECT_EQ(req.path(), "/items");
  EXPECT_EQ(req.query(), "");
}

TEST(HttpRequest, EmptyPathIsRoot) {
  EXPECT_EQ(HttpRequest(http::Method::GET, "").path(), "/");
  HttpRequest req(http::Method::GET, "?a=b");
  EXPECT_EQ(req.path(), "/");
  EXPECT_EQ(req.query(), "a=b");
}

TEST(HttpRequest, PathIsNotDecodedNorNormalized) {
  HttpRequest req(http::Method::GET, "//a%20b/");
  EXPECT_EQ(req.path(), "//a%20b/");
}

TEST(HttpRequest, HeaderLookupIsCaseInsensitive) {
  HttpRequest req(http::Method::GET, "/");
  req.header("Content-Type", "application/json").header("X-Trace", "abc");

  EXPECT_EQ(req.headerValue("content-type").value_or(""), "application/json");
  EXPECT_EQ(req.headerValueOrEmpty("X-TRACE"), "abc");
  EXPECT_FALSE(req.headerValue("Accept").has_value());
  EXPECT_EQ(req.headerValueOrEmpty("Accept"), "");
  EXPECT_EQ(req.headers().size(), 2U);
}

TEST(HttpRequest, HeaderAcceptsUtf8Value) {
  HttpRequest req(http::Method::GET, "/");
  req.header("X-Display-Name", "Jos\xC3\xA9");
  EXPECT_EQ(req.headerValueOrEmpty("x-display-name"), "Jos\xC3\xA9");
}

TEST(HttpRequest, HeaderReplacesExistingOne) {
  HttpRequest req(http::Method::GET, "/");
  req.header("X-Trace", "first");
  req.header("x-trace", "second");
  ASSERT_EQ(req.headers().size(), 1U);
  EXPECT_EQ(req.headers()[0].name(), "x-trace");
  EXPECT_EQ(req.headerValueOrEmpty("X-Trace"), "second");
}

TEST(HttpRequest, InvalidHeaderThrows) {
  HttpRequest req(http::Method::GET, "/");
  EXPECT_THROW(req.header("Bad Header", "v"), std::invalid_argument);
  EXPECT_TRUE(req.headers().empty());
}

TEST(HttpRequest, Body) {
  HttpRequest req(http::Method::PUT, "/doc");
  EXPECT_EQ(req.body(), "");
  req.body("payload");
  EXPECT_EQ(req.body(), "payload");
}

}  // namespace switchyard
