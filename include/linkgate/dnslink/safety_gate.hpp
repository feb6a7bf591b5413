// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <string>

#include "linkgate/dnslink/content_path.hpp"
#include "linkgate/dnslink/host_state.hpp"
#include "linkgate/network/url.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Decides whether a DNSLink lookup may run at all, and whether it
  /// is safe for a particular request URL.
  ///
  /// Requests aimed at the node's own API or gateway, and requests that are
  /// already content-addressed, are refused so that a redirect can never feed
  /// back into another lookup.
  class SafetyGate
  {
  public:
    /// \brief Lookups need the node API, which reports a non-negative peer
    /// count while reachable.
    static bool lookupPossible(const HostState& state) { return state.peerCount >= 0; }

    static bool lookupSafeForUrl(const HostState& state, const std::string& url)
    {
      if (state.dnslinkPolicy == DnslinkPolicy::Disabled || !lookupPossible(state))
      {
        return false;
      }
      auto parsed = network::Url::tryParse(url);
      if (!parsed || !parsed->isHttp())
      {
        return false;
      }
      if (ContentPath::isContentAddressedUrl(url))
      {
        return false;
      }
      std::string normalized = parsed->toString();
      return !startsWithBase(normalized, state.apiBaseUrl) &&
             !startsWithBase(normalized, state.gatewayBaseUrl);
    }

  private:
    /// \brief Prefix test against a base URL in normalised form; an
    /// unparsable base falls back to its literal text.
    static bool startsWithBase(const std::string& url, const std::string& base)
    {
      if (base.empty())
      {
        return false;
      }
      auto parsedBase = network::Url::tryParse(base);
      std::string prefix = parsedBase ? parsedBase->toString() : base;
      return url.compare(0, prefix.size(), prefix) == 0;
    }
  };

} // namespace dnslink
} // namespace linkgate
