/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "common/uri.hpp"

using eraoracle::common::Uri;

TEST(UriTest, CorrectFullURL) {
  auto original_url =
      "wss://rpc.polkadot.io:12345/path/to/resource?alpha=A&beta=B#anchor";

  auto uri = Uri::parse(original_url);

  EXPECT_FALSE(uri.error().has_value());
  EXPECT_EQ(uri.Schema, "wss");
  EXPECT_EQ(uri.Host, "rpc.polkadot.io");
  EXPECT_EQ(uri.Port, "12345");
  EXPECT_EQ(uri.Path, "/path/to/resource");
  EXPECT_EQ(uri.Query, "alpha=A&beta=B");
  EXPECT_EQ(uri.Fragment, "anchor");
  EXPECT_EQ(uri.to_string(), original_url);
  EXPECT_EQ(uri.port(), 12345);
  EXPECT_EQ(uri.target(), "/path/to/resource?alpha=A&beta=B");
  EXPECT_TRUE(uri.isSecure());
}

TEST(UriTest, CorrectWithoutSchema) {
  auto original_url = "hostname:12345/path/to/resource?alpha=A&beta=B#anchor";

  auto uri = Uri::parse(original_url);

  EXPECT_EQ(uri.Schema, "");
  EXPECT_EQ(uri.Host, "hostname");
  EXPECT_EQ(uri.Port, "12345");
  EXPECT_EQ(uri.Path, "/path/to/resource");
  EXPECT_EQ(uri.Query, "alpha=A&beta=B");
  EXPECT_EQ(uri.Fragment, "anchor");
  EXPECT_EQ(uri.to_string(), original_url);
  EXPECT_EQ(uri.port(), 12345);
}

TEST(UriTest, DefaultPortOfSchema) {
  auto ws = Uri::parse("ws://localhost");
  EXPECT_FALSE(ws.error().has_value());
  EXPECT_EQ(ws.Port, "");
  EXPECT_EQ(ws.port(), 80);
  EXPECT_EQ(ws.target(), "/");
  EXPECT_FALSE(ws.isSecure());

  auto wss = Uri::parse("wss://kusama-rpc.polkadot.io/");
  EXPECT_EQ(wss.port(), 443);
  EXPECT_EQ(wss.target(), "/");

  EXPECT_EQ(Uri::parse("schema://hostname").port(), std::nullopt);
}

TEST(UriTest, CorrectWithoutQuery) {
  auto original_url = "ws://hostname:12345/path/to/resource#anchor";

  auto uri = Uri::parse(original_url);

  EXPECT_EQ(uri.Schema, "ws");
  EXPECT_EQ(uri.Host, "hostname");
  EXPECT_EQ(uri.Port, "12345");
  EXPECT_EQ(uri.Path, "/path/to/resource");
  EXPECT_EQ(uri.Query, "");
  EXPECT_EQ(uri.Fragment, "anchor");
  EXPECT_EQ(uri.to_string(), original_url);
}

TEST(UriTest, EmptyUri) {
  auto uri = Uri::parse("");
  ASSERT_TRUE(uri.error().has_value());
}

TEST(UriTest, InvalidHostname) {
  EXPECT_TRUE(Uri::parse("ws://").error().has_value());
  EXPECT_TRUE(Uri::parse("ws://host name/").error().has_value());
  EXPECT_TRUE(Uri::parse("ws://:9944").error().has_value());
}

TEST(UriTest, InvalidPort) {
  EXPECT_TRUE(Uri::parse("ws://hostname:/").error().has_value());
  EXPECT_TRUE(Uri::parse("ws://hostname:0").error().has_value());
  EXPECT_TRUE(Uri::parse("ws://hostname:65536").error().has_value());
  EXPECT_TRUE(Uri::parse("ws://hostname:99a").error().has_value());
  EXPECT_FALSE(Uri::parse("ws://hostname:65535").error().has_value());
}

TEST(UriTest, InvalidSchema) {
  EXPECT_TRUE(Uri::parse("://hostname").error().has_value());
  EXPECT_TRUE(Uri::parse("w1s://hostname").error().has_value());
}
