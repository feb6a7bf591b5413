// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "linkgate/core/config_loader.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief When DNSLink lookups may run. Only Eager authorises a lookup
  /// during redirect planning.
  enum class DnslinkPolicy
  {
    Disabled,
    Manual,
    Eager
  };

  /// \brief Where the content node runs, which selects the redirect gateway.
  enum class NodeMode
  {
    Embedded,
    External
  };

  inline const char* toString(DnslinkPolicy policy)
  {
    switch (policy)
    {
    case DnslinkPolicy::Disabled:
      return "disabled";
    case DnslinkPolicy::Manual:
      return "manual";
    case DnslinkPolicy::Eager:
      return "eager";
    }
    return "unknown";
  }

  inline const char* toString(NodeMode mode)
  {
    return mode == NodeMode::Embedded ? "embedded" : "external";
  }

  /// \throws std::invalid_argument for unknown names
  inline DnslinkPolicy parseDnslinkPolicy(const std::string& name)
  {
    if (name == "disabled" || name == "off" || name == "false")
      return DnslinkPolicy::Disabled;
    if (name == "manual" || name == "enabled")
      return DnslinkPolicy::Manual;
    if (name == "eager" || name == "eagerDnsTxtLookup")
      return DnslinkPolicy::Eager;
    throw std::invalid_argument("Unknown DNSLink policy: " + name);
  }

  /// \throws std::invalid_argument for unknown names
  inline NodeMode parseNodeMode(const std::string& name)
  {
    if (name == "embedded")
      return NodeMode::Embedded;
    if (name == "external")
      return NodeMode::External;
    throw std::invalid_argument("Unknown node mode: " + name);
  }

  /// \brief Snapshot of host-owned settings, pulled on every decision.
  struct HostState
  {
    /// Connected peers; a negative value means the node API is unreachable.
    std::int64_t peerCount = -1;
    DnslinkPolicy dnslinkPolicy = DnslinkPolicy::Manual;
    std::string apiBaseUrl = "http://127.0.0.1:5001/";
    std::string gatewayBaseUrl = "http://127.0.0.1:8080/";
    std::string publicGatewayBaseUrl = "https://ipfs.io/";
    NodeMode nodeMode = NodeMode::External;

    /// \brief Reads the [host] table of a configuration file, keeping defaults
    /// for missing keys.
    static HostState fromLoader(const core::ConfigLoader& loader)
    {
      HostState state;
      if (auto v = loader.getInt("host.peer_count"))
        state.peerCount = *v;
      if (auto v = loader.getString("host.dnslink_policy"))
        state.dnslinkPolicy = parseDnslinkPolicy(*v);
      if (auto v = loader.getString("host.api_url"))
        state.apiBaseUrl = *v;
      if (auto v = loader.getString("host.gateway_url"))
        state.gatewayBaseUrl = *v;
      if (auto v = loader.getString("host.public_gateway_url"))
        state.publicGatewayBaseUrl = *v;
      if (auto v = loader.getString("host.node_mode"))
        state.nodeMode = parseNodeMode(*v);
      return state;
    }
  };

  /// \brief Pull-based accessor for the current host state.
  using HostStateProvider = std::function<HostState()>;

} // namespace dnslink
} // namespace linkgate
