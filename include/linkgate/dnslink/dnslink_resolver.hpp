// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "linkgate/dnslink/dnslink_value.hpp"
#include "linkgate/dnslink/host_state.hpp"
#include "linkgate/dnslink/lookup_client.hpp"
#include "linkgate/dnslink/redirect_planner.hpp"
#include "linkgate/dnslink/resolution_engine.hpp"
#include "linkgate/dnslink/resolver_config.hpp"
#include "linkgate/dnslink/safety_gate.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Entry point for a request-interception hook.
  ///
  /// Typical use per request:
  /// \code
  ///   if (resolver.isLookupSafeForUrl(url))
  ///   {
  ///     auto decision = resolver.planRedirect(url, std::nullopt);
  ///     if (decision.shouldRedirect()) { ... }
  ///   }
  /// \endcode
  class DnslinkResolver
  {
  public:
    /// \brief Builds the resolver with the HTTP lookup client against the
    /// host's API endpoint.
    DnslinkResolver(HostStateProvider stateProvider, const ResolverConfig& config = {})
      : DnslinkResolver(stateProvider, makeHttpLookupClient(stateProvider, config), config)
    {
    }

    /// \brief Builds the resolver over any lookup client.
    DnslinkResolver(HostStateProvider stateProvider, std::shared_ptr<LookupClient> client,
                    const ResolverConfig& config = {},
                    ResolutionEngine::Cache::NowFunction now = nullptr)
      : _stateProvider(std::move(stateProvider)),
        _engine(std::move(client), config.cache, std::move(now)),
        _planner(_stateProvider, _engine)
    {
      if (!_stateProvider)
      {
        throw std::invalid_argument("DnslinkResolver: state provider is required");
      }
    }

    DnslinkResolver(const DnslinkResolver&) = delete;
    DnslinkResolver& operator=(const DnslinkResolver&) = delete;

    bool isLookupPossible() const { return SafetyGate::lookupPossible(_stateProvider()); }

    bool isLookupSafeForUrl(const std::string& url) const
    {
      return SafetyGate::lookupSafeForUrl(_stateProvider(), url);
    }

    /// \brief Redirect decision for a request; `known` is a DNSLink value the
    /// caller already has, if any.
    RedirectDecision planRedirect(const std::string& url, const MaybeDnslink& known = std::nullopt)
    {
      return _planner.dnslinkRedirect(url, known);
    }

    bool canRedirectToIpns(const std::string& url, const MaybeDnslink& known = std::nullopt)
    {
      auto parsed = network::Url::tryParse(url);
      return parsed && _planner.canRedirectToIpns(*parsed, known);
    }

    MaybeDnslink resolveAndCache(const std::string& fqdn) { return _engine.resolveAndCache(fqdn); }

    MaybeDnslink cachedValue(const std::string& fqdn) { return _engine.cached(fqdn); }

    void setCachedValue(const std::string& fqdn, const DnslinkValue& value)
    {
      _engine.setCached(fqdn, value);
    }

    void clearCache() { _engine.clear(); }

    void setDiagnosticSink(DiagnosticSink sink) { _engine.setDiagnosticSink(std::move(sink)); }

  private:
    HostStateProvider _stateProvider;
    ResolutionEngine _engine;
    RedirectPlanner _planner;

    static std::shared_ptr<LookupClient> makeHttpLookupClient(const HostStateProvider& provider,
                                                              const ResolverConfig& config)
    {
      auto client = std::make_shared<HttpLookupClient>(provider, config.lookup.http);
      client->setTlsConfig(config.lookup.tls);
      return client;
    }
  };

} // namespace dnslink
} // namespace linkgate
