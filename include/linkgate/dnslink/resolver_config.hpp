// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "linkgate/core/config_loader.hpp"
#include "linkgate/core/logger.hpp"
#include "linkgate/network/http_client.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Tunables of the resolver core, read from the [cache], [lookup]
  /// and [log] tables.
  struct ResolverConfig
  {
    struct CacheConfig
    {
      std::size_t capacity = 1000;
      std::chrono::seconds ttl{3600};
      bool coalesceLookups = true;
    } cache;

    struct LookupConfig
    {
      network::HttpClient::Config http;
      network::HttpClient::TlsConfig tls;
    } lookup;

    struct LogConfig
    {
      core::Logger::Level level = core::Logger::Level::Info;
      std::string file;
    } log;

    /// \throws std::invalid_argument for out-of-range or unknown values
    static ResolverConfig fromLoader(const core::ConfigLoader& loader)
    {
      ResolverConfig config;

      if (auto v = loader.getInt("cache.capacity"))
        config.cache.capacity = static_cast<std::size_t>(requirePositive("cache.capacity", *v));
      if (auto v = loader.getInt("cache.ttl_seconds"))
        config.cache.ttl = std::chrono::seconds(requirePositive("cache.ttl_seconds", *v));
      if (auto v = loader.getBool("cache.coalesce_lookups"))
        config.cache.coalesceLookups = *v;

      if (auto v = loader.getInt("lookup.connect_timeout_ms"))
        config.lookup.http.connectTimeout =
            std::chrono::milliseconds(requirePositive("lookup.connect_timeout_ms", *v));
      if (auto v = loader.getInt("lookup.request_timeout_ms"))
        config.lookup.http.requestTimeout =
            std::chrono::milliseconds(requirePositive("lookup.request_timeout_ms", *v));
      if (auto v = loader.getString("lookup.user_agent"))
        config.lookup.http.userAgent = *v;
      if (auto v = loader.getBool("lookup.verify_peer"))
        config.lookup.tls.verifyPeer = *v;
      if (auto v = loader.getString("lookup.ca_file"))
        config.lookup.tls.caFile = *v;

      if (auto v = loader.getString("log.level"))
        config.log.level = core::Logger::levelFromString(*v);
      if (auto v = loader.getString("log.file"))
        config.log.file = *v;

      return config;
    }

  private:
    static std::int64_t requirePositive(const std::string& key, std::int64_t value)
    {
      if (value <= 0)
      {
        throw std::invalid_argument("Configuration value '" + key +
                                    "' must be positive, got " + std::to_string(value));
      }
      return value;
    }
  };

} // namespace dnslink
} // namespace linkgate
