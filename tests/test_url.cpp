/**
 * @file test_url.cpp
 * @brief Tests for URL parsing and private-host classification.
 */

#include <gtest/gtest.h>

#include "hearth/net/url.hpp"

using hearth::net::is_private_host;
using hearth::net::parse_url;

/**
 * @test Url_Parse_Defaults
 * @brief Scheme decides the default port; empty path becomes "/".
 */
TEST(Url, Url_Parse_Defaults) {
  auto u = parse_url("HTTPS://API.Example.com");
  ASSERT_TRUE(u);
  EXPECT_EQ(u->scheme, "https");
  EXPECT_EQ(u->host, "api.example.com");
  EXPECT_EQ(u->port, 443);
  EXPECT_EQ(u->target, "/");
  EXPECT_TRUE(u->tls());
  EXPECT_EQ(u->dependency(), "api.example.com:443");
  EXPECT_EQ(u->host_header(), "api.example.com");

  auto ws = parse_url("ws://stream.example.com/feed");
  ASSERT_TRUE(ws);
  EXPECT_EQ(ws->port, 80);
  EXPECT_FALSE(ws->tls());
}

/**
 * @test Url_Parse_Port_Query_Fragment
 * @brief Explicit port, query kept in target, fragment dropped.
 */
TEST(Url, Url_Parse_Port_Query_Fragment) {
  auto u = parse_url("http://example.com:8080/v1/items?page=2#top");
  ASSERT_TRUE(u);
  EXPECT_EQ(u->port, 8080);
  EXPECT_EQ(u->target, "/v1/items?page=2");
  EXPECT_EQ(u->host_header(), "example.com:8080");

  auto q = parse_url("http://example.com?x=1");
  ASSERT_TRUE(q);
  EXPECT_EQ(q->target, "/?x=1");
}

/**
 * @test Url_Parse_IPv6
 * @brief Bracketed literals parse; host is stored without brackets.
 */
TEST(Url, Url_Parse_IPv6) {
  auto u = parse_url("wss://[2001:db8::1]:9443/ws");
  ASSERT_TRUE(u);
  EXPECT_EQ(u->host, "2001:db8::1");
  EXPECT_EQ(u->port, 9443);
  EXPECT_EQ(u->host_header(), "[2001:db8::1]:9443");
}

/**
 * @test Url_Parse_Rejects
 * @brief Missing scheme/host, unknown schemes, bad ports and credentials are errors.
 */
TEST(Url, Url_Parse_Rejects) {
  EXPECT_FALSE(parse_url("example.com/path"));
  EXPECT_FALSE(parse_url("ftp://example.com"));
  EXPECT_FALSE(parse_url("http://"));
  EXPECT_FALSE(parse_url("http://example.com:0"));
  EXPECT_FALSE(parse_url("http://example.com:70000"));
  EXPECT_FALSE(parse_url("http://example.com:80x"));
  EXPECT_FALSE(parse_url("http://user:pw@example.com"));
  EXPECT_FALSE(parse_url("ws://[::1"));
}

/**
 * @test Url_Private_Hosts
 * @brief Loopback, RFC 1918, link-local and ULA ranges are private.
 */
TEST(Url, Url_Private_Hosts) {
  for (const char* h : {"localhost", "api.localhost", "127.0.0.1", "10.1.2.3", "172.16.0.1", "172.31.255.255",
                        "192.168.1.1", "169.254.169.254", "0.0.0.0", "::1", "::", "fd00::1", "fe80::1",
                        "::ffff:10.0.0.1"}) {
    EXPECT_TRUE(is_private_host(h)) << h;
  }
  for (const char* h : {"example.com", "8.8.8.8", "172.32.0.1", "192.169.0.1", "2001:db8::1", "::ffff:8.8.8.8"}) {
    EXPECT_FALSE(is_private_host(h)) << h;
  }
}
