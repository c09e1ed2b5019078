#include <gtest/gtest.h>
#include "parse_url.hpp"

using endpoint_lib::parseUrl;

TEST(ParseUrlTest, SplitsSchemeAuthorityAndPath) {
    core::DiagnosticCollector diagnostics;
    auto url = parseUrl("https://example.com/path/to", diagnostics);
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->authority, "example.com");
    EXPECT_EQ(url->path, "/path/to");
    EXPECT_EQ(url->normalized_path, "/path/to/");
    EXPECT_FALSE(url->is_ip);
}

TEST(ParseUrlTest, EmptyPathNormalizesToSlash) {
    core::DiagnosticCollector diagnostics;
    auto url = parseUrl("http://example.com:8443", diagnostics);
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->authority, "example.com:8443");
    EXPECT_EQ(url->path, "");
    EXPECT_EQ(url->normalized_path, "/");
}

TEST(ParseUrlTest, DetectsIpHosts) {
    core::DiagnosticCollector diagnostics;
    auto v4 = parseUrl("http://127.0.0.1:8080/", diagnostics);
    ASSERT_TRUE(v4.has_value());
    EXPECT_TRUE(v4->is_ip);

    auto v6 = parseUrl("https://[2001:db8::1]/x", diagnostics);
    ASSERT_TRUE(v6.has_value());
    EXPECT_TRUE(v6->is_ip);
    EXPECT_EQ(v6->authority, "[2001:db8::1]");

    auto not_ip = parseUrl("https://999.0.0.1", diagnostics);
    ASSERT_TRUE(not_ip.has_value());
    EXPECT_FALSE(not_ip->is_ip);
}

TEST(ParseUrlTest, RejectsUnsupportedForms) {
    core::DiagnosticCollector diagnostics;
    EXPECT_FALSE(parseUrl("ftp://example.com", diagnostics).has_value());
    EXPECT_FALSE(parseUrl("https://example.com/?query=1", diagnostics).has_value());
    EXPECT_FALSE(parseUrl("https://example.com/#frag", diagnostics).has_value());
    EXPECT_FALSE(parseUrl("https:///path", diagnostics).has_value());
    EXPECT_FALSE(parseUrl("example.com", diagnostics).has_value());
    EXPECT_EQ(diagnostics.errors().size(), 5u);
}

TEST(ParseUrlTest, Ipv4LiteralHelper) {
    EXPECT_TRUE(endpoint_lib::isIpv4Literal("10.0.0.1"));
    EXPECT_FALSE(endpoint_lib::isIpv4Literal("10.0.0"));
    EXPECT_FALSE(endpoint_lib::isIpv4Literal("10.0.0.256"));
    EXPECT_FALSE(endpoint_lib::isIpv4Literal("a.b.c.d"));
}
