// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "StubHttpServer.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace linkgate::dnslink;
using linkgate::network::HttpClient;

namespace
{
struct LookupFixture
{
  StubHttpServer server;
  std::shared_ptr<HostState> state = std::make_shared<HostState>(linkgate::test::makeState());

  LookupFixture()
  {
    linkgate::test::initializeTestLogging();
    server.start();
    state->apiBaseUrl = server.baseUrl();
  }

  HttpLookupClient client()
  {
    return HttpLookupClient(linkgate::test::providerFor(state), HttpClient::Config::forLocalhost());
  }
};
} // namespace

TEST_CASE("HttpLookupClient builds the lookup endpoint", "[lookup][url]")
{
  CHECK(HttpLookupClient::lookupUrl("http://127.0.0.1:5001/", "example.com") ==
        "http://127.0.0.1:5001/api/v0/dns/example.com");
  CHECK(HttpLookupClient::lookupUrl("http://127.0.0.1:5001", "example.com") ==
        "http://127.0.0.1:5001/api/v0/dns/example.com");
  CHECK(HttpLookupClient::lookupUrl("http://node:5001//", "a.b") ==
        "http://node:5001/api/v0/dns/a.b");
}

TEST_CASE_METHOD(LookupFixture, "HttpLookupClient maps 200 with a valid path", "[lookup][http]")
{
  server.on("/api/v0/dns/example.com", {200, "OK", "{\"Path\":\"/ipfs/QmXyz\"}"});
  auto lookupClient = client();

  LookupResult result = lookupClient.lookup("example.com");
  REQUIRE(result.ok);
  REQUIRE(result.value == DnslinkValue::resolved("/ipfs/QmXyz"));
  REQUIRE(server.hits("/api/v0/dns/example.com") == 1);
  CHECK(server.lastRequestHeaders().find("Accept: application/json") != std::string::npos);
}

TEST_CASE_METHOD(LookupFixture, "HttpLookupClient follows the current API base", "[lookup][http]")
{
  server.on("/api/v0/dns/example.com", {200, "OK", "{\"Path\":\"/ipns/other.example\"}"});
  state->apiBaseUrl = "http://127.0.0.1:" + std::to_string(server.port());
  auto lookupClient = client();

  LookupResult result = lookupClient.lookup("example.com");
  REQUIRE(result.ok);
  REQUIRE(result.value.path() == "/ipns/other.example");
}

TEST_CASE_METHOD(LookupFixture, "HttpLookupClient maps 500 to absent", "[lookup][http]")
{
  server.on("/api/v0/dns/nodesite.test",
            {500, "Internal Server Error", "{\"Message\":\"could not resolve name\"}"});
  auto lookupClient = client();

  LookupResult result = lookupClient.lookup("nodesite.test");
  REQUIRE(result.ok);
  REQUIRE(result.value.isAbsent());
}

TEST_CASE_METHOD(LookupFixture, "HttpLookupClient reports other statuses as errors",
                 "[lookup][errors]")
{
  auto lookupClient = client();

  SECTION("404 keeps the status text")
  {
    LookupResult result = lookupClient.lookup("missing.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.kind == LookupError::Kind::HttpStatus);
    CHECK(result.error.statusCode == 404);
    CHECK(result.error.message == "Not Found");
  }

  SECTION("empty status text falls back to the code")
  {
    server.on("/api/v0/dns/busy.test", {503, "", ""});
    LookupResult result = lookupClient.lookup("busy.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.statusCode == 503);
    CHECK(result.error.message == "HTTP 503");
  }
}

TEST_CASE_METHOD(LookupFixture, "HttpLookupClient rejects bad bodies", "[lookup][errors]")
{
  auto lookupClient = client();

  SECTION("invalid content path")
  {
    server.on("/api/v0/dns/bad.test", {200, "OK", "{\"Path\":\"not a path\"}"});
    LookupResult result = lookupClient.lookup("bad.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.kind == LookupError::Kind::InvalidPath);
    CHECK(result.error.message == "invalid DNSLink path for 'bad.test': 'not a path'");
  }

  SECTION("not JSON")
  {
    server.on("/api/v0/dns/garbled.test", {200, "OK", "<html>oops</html>", "text/html"});
    LookupResult result = lookupClient.lookup("garbled.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.kind == LookupError::Kind::Parse);
  }

  SECTION("missing Path")
  {
    server.on("/api/v0/dns/nopath.test", {200, "OK", "{\"Name\":\"x\"}"});
    LookupResult result = lookupClient.lookup("nopath.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.kind == LookupError::Kind::Parse);
  }

  SECTION("Path is not a string")
  {
    server.on("/api/v0/dns/numeric.test", {200, "OK", "{\"Path\":42}"});
    LookupResult result = lookupClient.lookup("numeric.test");
    REQUIRE_FALSE(result.ok);
    CHECK(result.error.kind == LookupError::Kind::Parse);
  }
}

TEST_CASE("HttpLookupClient reports transport failures", "[lookup][errors]")
{
  std::uint16_t port = 0;
  {
    StubHttpServer server;
    server.start();
    port = server.port();
  }
  auto state = std::make_shared<HostState>(linkgate::test::makeState());
  state->apiBaseUrl = "http://127.0.0.1:" + std::to_string(port) + "/";
  HttpLookupClient lookupClient(linkgate::test::providerFor(state),
                                HttpClient::Config::forLocalhost());

  LookupResult result = lookupClient.lookup("example.com");
  REQUIRE_FALSE(result.ok);
  CHECK(result.error.kind == LookupError::Kind::Transport);
  CHECK_FALSE(result.error.message.empty());
}

TEST_CASE("HttpLookupClient requires a state provider", "[lookup][config]")
{
  CHECK_THROWS_AS(HttpLookupClient(HostStateProvider{}), std::invalid_argument);
}
