// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "linkgate/core/config_loader.hpp"
#include "linkgate/core/json.hpp"
#include "linkgate/core/logger.hpp"
#include "linkgate/parsers/minimal_toml.hpp"
#include "linkgate/util/lru_expiring_cache.hpp"
#include "linkgate/network/url.hpp"
#include "linkgate/network/http_client.hpp"
#include "linkgate/dnslink/dnslink_value.hpp"
#include "linkgate/dnslink/host_state.hpp"
#include "linkgate/dnslink/content_path.hpp"
#include "linkgate/dnslink/lookup_client.hpp"
#include "linkgate/dnslink/resolver_config.hpp"
#include "linkgate/dnslink/resolution_engine.hpp"
#include "linkgate/dnslink/safety_gate.hpp"
#include "linkgate/dnslink/redirect_planner.hpp"
#include "linkgate/dnslink/dnslink_resolver.hpp"

namespace linkgate
{
  /// \brief Library version string.
  inline constexpr const char* kVersion = "1.0.0";
} // namespace linkgate
