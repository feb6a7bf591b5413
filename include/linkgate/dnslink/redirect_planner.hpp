// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "linkgate/core/logger.hpp"
#include "linkgate/dnslink/dnslink_value.hpp"
#include "linkgate/dnslink/host_state.hpp"
#include "linkgate/dnslink/resolution_engine.hpp"
#include "linkgate/network/url.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Either "leave the request alone" or the URL to redirect it to.
  struct RedirectDecision
  {
    std::optional<std::string> redirectUrl;

    static RedirectDecision none() { return RedirectDecision{}; }
    static RedirectDecision to(std::string url) { return RedirectDecision{std::move(url)}; }

    bool shouldRedirect() const { return redirectUrl.has_value(); }
  };

  /// \brief Turns requests for hosts with a DNSLink into requests for the
  /// matching `/ipns/<fqdn>` path on the configured gateway.
  class RedirectPlanner
  {
  public:
    RedirectPlanner(HostStateProvider stateProvider, ResolutionEngine& engine)
      : _stateProvider(std::move(stateProvider)), _engine(engine)
    {
      if (!_stateProvider)
      {
        throw std::invalid_argument("RedirectPlanner: state provider is required");
      }
    }

    /// \brief Paths served by gateways themselves; a DNSLink redirect must
    /// never touch them, whatever the host's DNSLink says.
    static bool isReservedGatewayPath(const std::string& path)
    {
      return startsWith(path, "/ipfs/") || startsWith(path, "/ipns/") ||
             startsWith(path, "/api/v");
    }

    /// \brief Whether the URL's host has a DNSLink that allows a redirect.
    ///
    /// A known value wins. Otherwise the eager policy resolves now, and any
    /// other policy consults the cache only.
    bool canRedirectToIpns(const network::Url& url, const MaybeDnslink& known)
    {
      if (isReservedGatewayPath(url.path))
      {
        return false;
      }
      MaybeDnslink effective = known;
      if (!effective)
      {
        const std::string fqdn = url.hostname();
        effective = _stateProvider().dnslinkPolicy == DnslinkPolicy::Eager
                        ? _engine.resolveAndCache(fqdn)
                        : _engine.cached(fqdn);
      }
      return effective && effective->isResolved();
    }

    RedirectDecision dnslinkRedirect(const std::string& requestUrl, const MaybeDnslink& known)
    {
      auto url = network::Url::tryParse(requestUrl);
      if (!url)
      {
        core::Logger::debug("RedirectPlanner: ignoring unparsable URL '" + requestUrl + "'");
        return RedirectDecision::none();
      }
      if (!canRedirectToIpns(*url, known))
      {
        return RedirectDecision::none();
      }
      return redirectToIpnsPath(*url);
    }

    /// \brief Moves the request onto the gateway under `/ipns/<fqdn>`,
    /// keeping path, query and fragment.
    RedirectDecision redirectToIpnsPath(const network::Url& original)
    {
      HostState state = _stateProvider();
      const std::string& gatewayText = state.nodeMode == NodeMode::Embedded
                                           ? state.publicGatewayBaseUrl
                                           : state.gatewayBaseUrl;
      auto gateway = network::Url::tryParse(gatewayText);
      if (!gateway)
      {
        LINKGATE_LOG_ERROR("RedirectPlanner: invalid gateway URL '" << gatewayText << "'");
        return RedirectDecision::none();
      }

      network::Url target = original;
      target.scheme = gateway->scheme;
      target.host = gateway->host;
      target.port = gateway->port;
      target.path = "/ipns/" + original.hostname() + original.path;
      std::string redirectUrl = target.toString();
      core::Logger::debug("RedirectPlanner: " + original.toString() + " -> " + redirectUrl);
      return RedirectDecision::to(std::move(redirectUrl));
    }

  private:
    HostStateProvider _stateProvider;
    ResolutionEngine& _engine;

    static bool startsWith(const std::string& s, const std::string& prefix)
    {
      return s.compare(0, prefix.size(), prefix) == 0;
    }
  };

} // namespace dnslink
} // namespace linkgate
