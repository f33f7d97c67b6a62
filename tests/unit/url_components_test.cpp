// tests/unit/url_components_test.cpp
#include <gtest/gtest.h>
#include "common/url/include/UrlComponents.hpp"

using namespace wallet_link::url;

TEST(UrlComponentsTest, DecomposesFullUrl) {
    auto url = UrlComponents::Parse("https://user@example.com:8443/a/b?x=1&y=2#frag");
    ASSERT_TRUE(url.has_value());

    EXPECT_EQ(url->Scheme(), "https");
    ASSERT_TRUE(url->Host().has_value());
    EXPECT_EQ(*url->Host(), "example.com");
    ASSERT_TRUE(url->Port().has_value());
    EXPECT_EQ(*url->Port(), 8443);
    EXPECT_EQ(url->Path(), "/a/b");
    ASSERT_TRUE(url->PercentEncodedQuery().has_value());
    EXPECT_EQ(*url->PercentEncodedQuery(), "x=1&y=2");
    ASSERT_TRUE(url->Fragment().has_value());
    EXPECT_EQ(*url->Fragment(), "frag");
    EXPECT_TRUE(url->IsAbsolute());
    EXPECT_EQ(url->ToString(), "https://user@example.com:8443/a/b?x=1&y=2#frag");
}

TEST(UrlComponentsTest, CustomSchemeHostIsCommandName) {
    auto url = UrlComponents::Parse("wallet://sign-message?message=aGVsbG8=");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->Scheme(), "wallet");
    ASSERT_TRUE(url->Host().has_value());
    EXPECT_EQ(*url->Host(), "sign-message");
    EXPECT_EQ(url->Path(), "");
}

TEST(UrlComponentsTest, RelativeReferenceHasNoScheme) {
    auto url = UrlComponents::Parse("/just/a/path?q=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_FALSE(url->IsAbsolute());
    EXPECT_FALSE(url->Host().has_value());
}

TEST(UrlComponentsTest, RejectsMalformedUrls) {
    EXPECT_FALSE(UrlComponents::Parse("").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://cb?x=a b").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://cb?x=%G1").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://cb?x=%4").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://cb?x=<y>").has_value());
    EXPECT_FALSE(UrlComponents::Parse("1app://cb").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://host:99999/").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://host:8a/").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://[::1/").has_value());
    EXPECT_FALSE(UrlComponents::Parse("app://cb#a#b").has_value());
}

TEST(UrlComponentsTest, QueryItemsArePercentDecodedFirstMatchWins) {
    auto url = UrlComponents::Parse("app://cb?a=1&a=2&b=x%26y&flag&c=&&d=%2B+");
    ASSERT_TRUE(url.has_value());

    auto items = url->QueryItems();
    ASSERT_EQ(items.size(), 6u);
    EXPECT_EQ(items[0].name, "a");
    EXPECT_EQ(*items[0].value, "1");
    EXPECT_EQ(items[3].name, "flag");
    EXPECT_FALSE(items[3].value.has_value());

    EXPECT_EQ(url->QueryValue("a"), std::optional<std::string>("1"));
    EXPECT_EQ(url->QueryValue("b"), std::optional<std::string>("x&y"));
    EXPECT_EQ(url->QueryValue("c"), std::optional<std::string>(""));
    EXPECT_FALSE(url->QueryValue("flag").has_value());
    EXPECT_FALSE(url->QueryValue("missing").has_value());

    // '+'는 공백이 아님
    EXPECT_EQ(url->QueryValue("d"), std::optional<std::string>("++"));
}

TEST(UrlComponentsTest, AppendQueryItemCreatesOrExtendsQuery) {
    auto bare = UrlComponents::Parse("app://cb");
    ASSERT_TRUE(bare.has_value());
    bare->AppendQueryItem("result", "AQI=");
    EXPECT_EQ(bare->ToString(), "app://cb?result=AQI=");

    auto existing = UrlComponents::Parse("app://cb/path?session=7#top");
    ASSERT_TRUE(existing.has_value());
    existing->AppendQueryItem("error", "cancelled");
    EXPECT_EQ(existing->ToString(), "app://cb/path?session=7&error=cancelled#top");

    auto empty_query = UrlComponents::Parse("app://cb?");
    ASSERT_TRUE(empty_query.has_value());
    empty_query->AppendQueryItem("error", "1");
    EXPECT_EQ(empty_query->ToString(), "app://cb?error=1");
}

TEST(UrlComponentsTest, EqualityComparesSerializedForm) {
    auto a = UrlComponents::Parse("app://cb?x=1");
    auto b = UrlComponents::Parse("app://cb?x=1");
    auto c = UrlComponents::Parse("app://cb?x=2");
    ASSERT_TRUE(a && b && c);
    EXPECT_TRUE(*a == *b);
    EXPECT_TRUE(*a != *c);
}

TEST(PercentEncodingTest, EscapesReservedQueryCharacters) {
    EXPECT_EQ(PercentEncodeQueryValue("a+b/c=="), "a%2Bb/c==");
    EXPECT_EQ(PercentEncodeQueryValue("x&y#z%"), "x%26y%23z%25");
    EXPECT_EQ(PercentEncodeQueryValue("a b"), "a%20b");
    EXPECT_EQ(PercentEncodeQueryValue("app://cb?k=v@h"), "app://cb?k=v@h");
    EXPECT_EQ(PercentEncodeQueryValue("\xc3\xa9"), "%C3%A9");
}

TEST(PercentEncodingTest, DecodeRejectsBrokenEscapes) {
    EXPECT_EQ(PercentDecode("a%20b"), std::optional<std::string>("a b"));
    EXPECT_EQ(PercentDecode("%2b%2B"), std::optional<std::string>("++"));
    EXPECT_FALSE(PercentDecode("%").has_value());
    EXPECT_FALSE(PercentDecode("%zz").has_value());
}
