// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>

using linkgate::core::ConfigLoader;
using linkgate::dnslink::DnslinkPolicy;
using linkgate::dnslink::HostState;
using linkgate::dnslink::NodeMode;
using linkgate::dnslink::ResolverConfig;

TEST_CASE("ConfigLoader basic operations", "[config][ConfigLoader]")
{
  linkgate::test::initializeTestLogging();
  const std::string cfgFile = "linkgate_test_config.toml";
  {
    std::ofstream out(cfgFile);
    out << "# sample\n";
    out << "[section]\n";
    out << "int_val = 42\n";
    out << "bool_val = true\n";
    out << "str_val = 'hello'\n";
    out << "[other]\n";
    out << "float_val = 3.14 # trailing comment\n";
    out << "big = 1_000_000\n";
  }

  ConfigLoader loader(cfgFile);
  REQUIRE_FALSE(loader.isLoaded());
  REQUIRE_NOTHROW(loader.load());
  REQUIRE(loader.isLoaded());

  REQUIRE(loader.getInt("section.int_val").value() == 42);
  REQUIRE(loader.getBool("section.bool_val").value() == true);
  REQUIRE(loader.getString("section.str_val").value() == "hello");
  REQUIRE(loader.getDouble("other.float_val").value() == Approx(3.14));
  REQUIRE(loader.getInt("other.big").value() == 1000000);
  // Integers widen to double
  REQUIRE(loader.getDouble("section.int_val").value() == Approx(42.0));

  REQUIRE_FALSE(loader.getInt("section.missing").has_value());
  REQUIRE_FALSE(loader.getInt("section.str_val").has_value());
  REQUIRE_FALSE(loader.getString("section").has_value());

  std::remove(cfgFile.c_str());
}

TEST_CASE("ConfigLoader reports missing and malformed files", "[config][ConfigLoader]")
{
  SECTION("missing file")
  {
    ConfigLoader loader("does_not_exist_linkgate.toml");
    REQUIRE_FALSE(loader.reload());
    REQUIRE_THROWS_AS(loader.load(), std::runtime_error);
  }

  SECTION("duplicate key")
  {
    REQUIRE_THROWS_AS(ConfigLoader::fromString("a = 1\na = 2\n"), std::runtime_error);
  }

  SECTION("unterminated string")
  {
    REQUIRE_THROWS_AS(ConfigLoader::fromString("a = \"open\n"), std::runtime_error);
  }

  SECTION("trailing content")
  {
    REQUIRE_THROWS_AS(ConfigLoader::fromString("a = 1 2\n"), std::runtime_error);
  }

  SECTION("error mentions the line")
  {
    try
    {
      ConfigLoader::fromString("a = 1\n\nb = \n");
      FAIL("expected a parse error");
    }
    catch (const std::runtime_error& e)
    {
      REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
    }
  }
}

TEST_CASE("ConfigLoader dotted section headers", "[config][toml]")
{
  auto loader = ConfigLoader::fromString("[outer.inner]\nkey = \"v\"\n[outer]\nother = 1\n");
  REQUIRE(loader.getString("outer.inner.key").value() == "v");
  REQUIRE(loader.getInt("outer.other").value() == 1);
}

TEST_CASE("ResolverConfig defaults", "[config][resolver]")
{
  ResolverConfig config = ResolverConfig::fromLoader(ConfigLoader::fromString(""));
  CHECK(config.cache.capacity == 1000);
  CHECK(config.cache.ttl == std::chrono::seconds(3600));
  CHECK(config.cache.coalesceLookups);
  CHECK(config.lookup.http.connectTimeout == std::chrono::milliseconds(2000));
  CHECK(config.lookup.http.requestTimeout == std::chrono::milliseconds(3000));
  CHECK(config.lookup.http.userAgent == "linkgate/1.0");
  CHECK(config.lookup.tls.verifyPeer);
  CHECK(config.lookup.tls.caFile.empty());
  CHECK(config.log.level == linkgate::core::Logger::Level::Info);
  CHECK(config.log.file.empty());
}

TEST_CASE("ResolverConfig reads every table", "[config][resolver]")
{
  auto loader = ConfigLoader::fromString(R"(
[cache]
capacity = 50
ttl_seconds = 120
coalesce_lookups = false

[lookup]
connect_timeout_ms = 150
request_timeout_ms = 900
user_agent = "probe/2"
verify_peer = false
ca_file = "/etc/ssl/custom.pem"

[log]
level = "debug"
file = "linkgate.log"
)");
  ResolverConfig config = ResolverConfig::fromLoader(loader);
  CHECK(config.cache.capacity == 50);
  CHECK(config.cache.ttl == std::chrono::seconds(120));
  CHECK_FALSE(config.cache.coalesceLookups);
  CHECK(config.lookup.http.connectTimeout == std::chrono::milliseconds(150));
  CHECK(config.lookup.http.requestTimeout == std::chrono::milliseconds(900));
  CHECK(config.lookup.http.userAgent == "probe/2");
  CHECK_FALSE(config.lookup.tls.verifyPeer);
  CHECK(config.lookup.tls.caFile == "/etc/ssl/custom.pem");
  CHECK(config.log.level == linkgate::core::Logger::Level::Debug);
  CHECK(config.log.file == "linkgate.log");
}

TEST_CASE("ResolverConfig rejects out-of-range values", "[config][resolver]")
{
  CHECK_THROWS_AS(ResolverConfig::fromLoader(ConfigLoader::fromString("[cache]\ncapacity = 0\n")),
                  std::invalid_argument);
  CHECK_THROWS_AS(
      ResolverConfig::fromLoader(ConfigLoader::fromString("[cache]\nttl_seconds = -5\n")),
      std::invalid_argument);
  CHECK_THROWS_AS(
      ResolverConfig::fromLoader(ConfigLoader::fromString("[lookup]\nrequest_timeout_ms = 0\n")),
      std::invalid_argument);
  CHECK_THROWS_AS(ResolverConfig::fromLoader(ConfigLoader::fromString("[log]\nlevel = \"loud\"\n")),
                  std::invalid_argument);
}

TEST_CASE("HostState reads the host table", "[config][host]")
{
  SECTION("defaults")
  {
    HostState state = HostState::fromLoader(ConfigLoader::fromString(""));
    CHECK(state.peerCount == -1);
    CHECK(state.dnslinkPolicy == DnslinkPolicy::Manual);
    CHECK(state.apiBaseUrl == "http://127.0.0.1:5001/");
    CHECK(state.gatewayBaseUrl == "http://127.0.0.1:8080/");
    CHECK(state.publicGatewayBaseUrl == "https://ipfs.io/");
    CHECK(state.nodeMode == NodeMode::External);
  }

  SECTION("overrides")
  {
    HostState state = HostState::fromLoader(ConfigLoader::fromString(R"(
[host]
peer_count = 12
dnslink_policy = "eagerDnsTxtLookup"
api_url = "http://10.0.0.2:5001/"
gateway_url = "http://10.0.0.2:8080/"
public_gateway_url = "https://dweb.link/"
node_mode = "embedded"
)"));
    CHECK(state.peerCount == 12);
    CHECK(state.dnslinkPolicy == DnslinkPolicy::Eager);
    CHECK(state.apiBaseUrl == "http://10.0.0.2:5001/");
    CHECK(state.gatewayBaseUrl == "http://10.0.0.2:8080/");
    CHECK(state.publicGatewayBaseUrl == "https://dweb.link/");
    CHECK(state.nodeMode == NodeMode::Embedded);
  }

  SECTION("unknown names")
  {
    CHECK_THROWS_AS(
        HostState::fromLoader(ConfigLoader::fromString("[host]\ndnslink_policy = \"sometimes\"\n")),
        std::invalid_argument);
    CHECK_THROWS_AS(
        HostState::fromLoader(ConfigLoader::fromString("[host]\nnode_mode = \"cloud\"\n")),
        std::invalid_argument);
  }
}

TEST_CASE("DNSLink policy aliases", "[config][host]")
{
  using linkgate::dnslink::parseDnslinkPolicy;
  CHECK(parseDnslinkPolicy("off") == DnslinkPolicy::Disabled);
  CHECK(parseDnslinkPolicy("false") == DnslinkPolicy::Disabled);
  CHECK(parseDnslinkPolicy("enabled") == DnslinkPolicy::Manual);
  CHECK(parseDnslinkPolicy("eager") == DnslinkPolicy::Eager);
  CHECK(std::string(linkgate::dnslink::toString(DnslinkPolicy::Eager)) == "eager");
}

TEST_CASE("Sample configuration file parses", "[config][sample]")
{
  ConfigLoader loader(LINKGATE_SAMPLE_CONFIG);
  REQUIRE_NOTHROW(loader.load());
  REQUIRE_NOTHROW(ResolverConfig::fromLoader(loader));
  REQUIRE_NOTHROW(HostState::fromLoader(loader));
}
