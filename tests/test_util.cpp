/// @file test_util.cpp
/// Unit tests for util.hpp: URL parsing, Link-header pagination and
/// query-string encoding.

#include "util.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace stock_sync;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:4000/admin/api/2024-07/graphql.json");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "4000");
    EXPECT_EQ(parts.target, "/admin/api/2024-07/graphql.json");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://pos.example.com/api");
    EXPECT_EQ(parts.host, "pos.example.com");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://shop.myshopify.com/admin/api/2024-07/products.json");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "shop.myshopify.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/admin/api/2024-07/products.json");
}

TEST(ParseUrl, QueryStringIsPartOfTarget) {
    auto parts = parseUrl("https://shop.myshopify.com/admin/api/2024-07/products.json"
                          "?limit=250&page_info=abc");
    EXPECT_EQ(parts.target, "/admin/api/2024-07/products.json?limit=250&page_info=abc");
}

TEST(ParseUrl, QueryWithoutPathGetsLeadingSlash) {
    auto parts = parseUrl("http://pos.example.com?ps=x&get=all");
    EXPECT_EQ(parts.host, "pos.example.com");
    EXPECT_EQ(parts.target, "/?ps=x&get=all");
}

TEST(ParseUrl, FragmentIsDropped) {
    auto parts = parseUrl("http://example.com/a#frag");
    EXPECT_EQ(parts.target, "/a");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://example.com");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:4000/graphql"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/file"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///graphql"), std::invalid_argument);
}

TEST(ParseUrl, EmptyPortThrows) {
    EXPECT_THROW(parseUrl("http://example.com:/x"), std::invalid_argument);
}

// ============================================================================
// parseNextPageUrl
// ============================================================================

TEST(ParseNextPageUrl, NextOnly) {
    auto next = parseNextPageUrl(
        "<https://shop.myshopify.com/admin/api/2024-07/products.json?limit=250&page_info=p2>; rel=\"next\"");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, "https://shop.myshopify.com/admin/api/2024-07/products.json?limit=250&page_info=p2");
}

TEST(ParseNextPageUrl, PreviousAndNext) {
    auto next = parseNextPageUrl(
        "<https://s/products.json?page_info=p1>; rel=\"previous\", "
        "<https://s/products.json?page_info=p3>; rel=\"next\"");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, "https://s/products.json?page_info=p3");
}

TEST(ParseNextPageUrl, PreviousOnlyMeansLastPage) {
    EXPECT_FALSE(parseNextPageUrl("<https://s/products.json?page_info=p1>; rel=\"previous\"")
                     .has_value());
}

TEST(ParseNextPageUrl, EmptyHeader) {
    EXPECT_FALSE(parseNextPageUrl("").has_value());
}

TEST(ParseNextPageUrl, EmptyUrlIsIgnored) {
    EXPECT_FALSE(parseNextPageUrl("<>; rel=\"next\"").has_value());
}

// ============================================================================
// urlEncode / trimTrailingSlashes
// ============================================================================

TEST(UrlEncode, UnreservedCharactersPassThrough) {
    EXPECT_EQ(urlEncode("abcXYZ019-_.~"), "abcXYZ019-_.~");
}

TEST(UrlEncode, ReservedCharactersAreEscaped) {
    EXPECT_EQ(urlEncode("p@ss w&rd=1"), "p%40ss%20w%26rd%3D1");
    EXPECT_EQ(urlEncode("\xC3\xA9"), "%C3%A9");
}

TEST(TrimTrailingSlashes, RemovesAllTrailing) {
    EXPECT_EQ(trimTrailingSlashes("http://x//"), "http://x");
    EXPECT_EQ(trimTrailingSlashes("shop.example.com"), "shop.example.com");
}
