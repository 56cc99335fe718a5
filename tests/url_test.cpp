#include <gtest/gtest.h>
#include <string>

#include "kg/internal/url.hpp"

using kg::internal::Url;

TEST(UrlTest, ParsesHttpsWithBasePath)
{
    // Scheme default port, host and base path without the trailing slash.
    Url u;
    ASSERT_TRUE(kg::internal::parse_url("https://generativelanguage.googleapis.com/v1beta/openai/", u));
    EXPECT_TRUE(u.tls);
    EXPECT_EQ(u.host, "generativelanguage.googleapis.com");
    EXPECT_EQ(u.port, 443);
    EXPECT_EQ(u.path, "/v1beta/openai");
    EXPECT_EQ(u.query, "");
    EXPECT_EQ(u.host_header(), "generativelanguage.googleapis.com");
}

TEST(UrlTest, ParsesExplicitPortAndQuery)
{
    // A non-default port shows up in the Host header value.
    Url u;
    ASSERT_TRUE(kg::internal::parse_url("HTTP://127.0.0.1:9000?v=1", u));
    EXPECT_FALSE(u.tls);
    EXPECT_EQ(u.host, "127.0.0.1");
    EXPECT_EQ(u.port, 9000);
    EXPECT_EQ(u.path, "");
    EXPECT_EQ(u.query, "v=1");
    EXPECT_EQ(u.host_header(), "127.0.0.1:9000");
}

TEST(UrlTest, ParsesBracketedIpv6)
{
    // IPv6 literals lose their brackets in `host` and regain them in Host.
    Url u;
    ASSERT_TRUE(kg::internal::parse_url("http://[::1]:8080/api", u));
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, 8080);
    EXPECT_EQ(u.host_header(), "[::1]:8080");
}

TEST(UrlTest, RejectsUnsupportedForms)
{
    // Other schemes, userinfo, fragments, empty hosts and bad ports are refused.
    Url u;
    EXPECT_FALSE(kg::internal::parse_url("ftp://example.com/", u));
    EXPECT_FALSE(kg::internal::parse_url("example.com/v1", u));
    EXPECT_FALSE(kg::internal::parse_url("https://user:pw@example.com/", u));
    EXPECT_FALSE(kg::internal::parse_url("https://example.com/#frag", u));
    EXPECT_FALSE(kg::internal::parse_url("https:///path", u));
    EXPECT_FALSE(kg::internal::parse_url("https://example.com:0/", u));
    EXPECT_FALSE(kg::internal::parse_url("https://example.com:70000/", u));
    EXPECT_FALSE(kg::internal::parse_url("https://example.com:/", u));
    EXPECT_FALSE(kg::internal::parse_url("http://[::1/", u));
}

TEST(UrlTest, JoinPath)
{
    // Exactly one slash between the base path and the forwarded remainder.
    EXPECT_EQ(kg::internal::join_path("/v1", "/models"), "/v1/models");
    EXPECT_EQ(kg::internal::join_path("/v1/", "models"), "/v1/models");
    EXPECT_EQ(kg::internal::join_path("", "/chat/completions"), "/chat/completions");
    EXPECT_EQ(kg::internal::join_path("", ""), "/");
    EXPECT_EQ(kg::internal::join_path("/v1", ""), "/v1/");
}
