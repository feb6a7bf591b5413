// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace linkgate::dnslink;
using linkgate::network::Url;
using linkgate::test::ScriptedLookupClient;

namespace
{
struct PlannerFixture
{
  std::shared_ptr<HostState> state =
      std::make_shared<HostState>(linkgate::test::makeState(DnslinkPolicy::Manual));
  std::shared_ptr<ScriptedLookupClient> client = std::make_shared<ScriptedLookupClient>();
  ResolutionEngine engine{client};
  RedirectPlanner planner{linkgate::test::providerFor(state), engine};

  PlannerFixture()
  {
    linkgate::test::initializeTestLogging();
    client->scriptResolved("example.com", "/ipfs/QmXyz");
    client->scriptAbsent("nodesite.test");
  }
};
} // namespace

TEST_CASE("RedirectPlanner reserved gateway paths", "[planner][reserved]")
{
  CHECK(RedirectPlanner::isReservedGatewayPath("/ipfs/QmXyz"));
  CHECK(RedirectPlanner::isReservedGatewayPath("/ipns/example.com/"));
  CHECK(RedirectPlanner::isReservedGatewayPath("/api/v0/id"));
  CHECK_FALSE(RedirectPlanner::isReservedGatewayPath("/ipfs"));
  CHECK_FALSE(RedirectPlanner::isReservedGatewayPath("/api/status"));
  CHECK_FALSE(RedirectPlanner::isReservedGatewayPath("/docs/ipfs/"));
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner never touches reserved paths",
                 "[planner][reserved]")
{
  engine.setCached("example.com", DnslinkValue::resolved("/ipfs/QmXyz"));
  auto known = DnslinkValue::resolved("/ipfs/QmXyz");
  for (const char* url : {"http://example.com/ipfs/QmOther", "http://example.com/ipns/x.test/",
                          "http://example.com/api/v0/cat"})
  {
    CHECK_FALSE(planner.canRedirectToIpns(Url::parse(url), known));
    CHECK_FALSE(planner.dnslinkRedirect(url, known).shouldRedirect());
  }
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner prefers the known value", "[planner][known]")
{
  Url url = Url::parse("http://example.com/docs/a.md");

  SECTION("known resolved value redirects without a lookup")
  {
    CHECK(planner.canRedirectToIpns(url, DnslinkValue::resolved("/ipfs/QmXyz")));
    CHECK(client->totalCalls() == 0);
  }

  SECTION("known absent value wins over a cached resolved one")
  {
    engine.setCached("example.com", DnslinkValue::resolved("/ipfs/QmXyz"));
    CHECK_FALSE(planner.canRedirectToIpns(url, DnslinkValue::absent()));
  }
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner manual policy reads the cache only",
                 "[planner][policy]")
{
  Url url = Url::parse("http://example.com/docs/a.md");
  CHECK_FALSE(planner.canRedirectToIpns(url, std::nullopt));
  CHECK(client->totalCalls() == 0);

  engine.setCached("example.com", DnslinkValue::resolved("/ipfs/QmXyz"));
  CHECK(planner.canRedirectToIpns(url, std::nullopt));
  CHECK(client->totalCalls() == 0);
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner eager policy resolves on demand",
                 "[planner][policy]")
{
  state->dnslinkPolicy = DnslinkPolicy::Eager;

  CHECK(planner.canRedirectToIpns(Url::parse("http://example.com/docs/a.md"), std::nullopt));
  CHECK(client->calls("example.com") == 1);
  CHECK(engine.cached("example.com").has_value());

  CHECK_FALSE(planner.canRedirectToIpns(Url::parse("http://nodesite.test/"), std::nullopt));
  CHECK(engine.cached("nodesite.test")->isAbsent());

  // Failed lookups leave the decision at "no redirect"
  CHECK_FALSE(planner.canRedirectToIpns(Url::parse("http://unscripted.test/"), std::nullopt));
  CHECK_FALSE(engine.cached("unscripted.test").has_value());
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner rewrites onto the gateway", "[planner][rewrite]")
{
  auto known = DnslinkValue::resolved("/ipfs/QmXyz");

  SECTION("external node uses the configured gateway")
  {
    auto decision = planner.dnslinkRedirect("http://example.com/docs/a.md", known);
    REQUIRE(decision.shouldRedirect());
    CHECK(*decision.redirectUrl == "http://127.0.0.1:8080/ipns/example.com/docs/a.md");
  }

  SECTION("embedded node uses the public gateway")
  {
    state->nodeMode = NodeMode::Embedded;
    auto decision = planner.dnslinkRedirect("http://example.com/docs/a.md", known);
    REQUIRE(decision.shouldRedirect());
    CHECK(*decision.redirectUrl == "https://ipfs.io/ipns/example.com/docs/a.md");
  }

  SECTION("query and fragment survive")
  {
    auto decision =
        planner.dnslinkRedirect("https://example.com:8443/search?q=dnslink&page=2#top", known);
    REQUIRE(decision.shouldRedirect());
    CHECK(*decision.redirectUrl ==
          "http://127.0.0.1:8080/ipns/example.com/search?q=dnslink&page=2#top");
  }

  SECTION("root path keeps its slash")
  {
    auto decision = planner.dnslinkRedirect("http://example.com", known);
    REQUIRE(decision.shouldRedirect());
    CHECK(*decision.redirectUrl == "http://127.0.0.1:8080/ipns/example.com/");
  }

  SECTION("gateway with default port")
  {
    state->gatewayBaseUrl = "https://gw.example.net/";
    auto decision = planner.dnslinkRedirect("http://example.com/a", known);
    REQUIRE(decision.shouldRedirect());
    CHECK(*decision.redirectUrl == "https://gw.example.net/ipns/example.com/a");
  }
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner declines unusable input", "[planner][errors]")
{
  auto known = DnslinkValue::resolved("/ipfs/QmXyz");
  CHECK_FALSE(planner.dnslinkRedirect("not a url", known).shouldRedirect());

  state->gatewayBaseUrl = "not a gateway";
  CHECK_FALSE(planner.dnslinkRedirect("http://example.com/a", known).shouldRedirect());
}

TEST_CASE_METHOD(PlannerFixture, "RedirectPlanner negative end to end", "[planner][negative]")
{
  state->dnslinkPolicy = DnslinkPolicy::Eager;
  for (const char* url : {"http://nodesite.test/", "http://nodesite.test/blog/post?id=1"})
  {
    CHECK_FALSE(planner.dnslinkRedirect(url, std::nullopt).shouldRedirect());
  }
  CHECK(client->calls("nodesite.test") == 1);
}
