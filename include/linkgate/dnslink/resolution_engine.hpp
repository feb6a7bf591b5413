// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "linkgate/core/logger.hpp"
#include "linkgate/dnslink/dnslink_value.hpp"
#include "linkgate/dnslink/lookup_client.hpp"
#include "linkgate/dnslink/resolver_config.hpp"
#include "linkgate/util/lru_expiring_cache.hpp"

namespace linkgate
{
namespace dnslink
{

  /// \brief Structured report of a failed lookup, emitted by the engine.
  struct LookupDiagnostic
  {
    std::string fqdn;
    LookupError error;
  };

  using DiagnosticSink = std::function<void(const LookupDiagnostic&)>;

  /// \brief Cache-aside DNSLink resolution.
  ///
  /// Owns the FQDN cache. Both positive and negative (absent) results are
  /// cached; lookup errors never are, so the next call for the same FQDN
  /// retries the backend. No engine lock is held while the diagnostic sink,
  /// the cache eviction callback or the logger run.
  class ResolutionEngine
  {
  public:
    using Cache = util::LruExpiringCache<std::string, DnslinkValue>;

    ResolutionEngine(std::shared_ptr<LookupClient> client,
                     const ResolverConfig::CacheConfig& config = ResolverConfig::CacheConfig{},
                     Cache::NowFunction now = nullptr)
      : _client(std::move(client)),
        _cache(config.capacity, config.ttl, std::move(now)),
        _coalesce(config.coalesceLookups)
    {
      if (!_client)
      {
        throw std::invalid_argument("ResolutionEngine: lookup client is required");
      }
      _cache.setEvictionCallback(
          [](const std::string& fqdn, const DnslinkValue&, Cache::EvictionReason reason)
          {
            if (reason == Cache::EvictionReason::Expired)
            {
              core::Logger::debug("ResolutionEngine: DNSLink entry for '" + fqdn + "' expired");
            }
            else if (reason == Cache::EvictionReason::Capacity)
            {
              core::Logger::debug("ResolutionEngine: evicted least recently used entry '" +
                                  fqdn + "'");
            }
          });
    }

    ResolutionEngine(const ResolutionEngine&) = delete;
    ResolutionEngine& operator=(const ResolutionEngine&) = delete;

    /// \brief Registers the collaborator notified of every failed lookup.
    void setDiagnosticSink(DiagnosticSink sink)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _diagnosticSink = std::move(sink);
    }

    /// \brief Returns the cached value, or looks it up and caches it.
    /// \return std::nullopt when the lookup failed; never throws for lookup
    /// failures
    MaybeDnslink resolveAndCache(const std::string& fqdn)
    {
      if (auto value = _cache.get(fqdn))
      {
        return value;
      }
      if (!_coalesce)
      {
        return lookupAndStore(fqdn, currentGeneration());
      }

      std::promise<MaybeDnslink> promise;
      std::shared_future<MaybeDnslink> pending;
      std::uint64_t generation = 0;
      bool leader = false;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _inFlight.find(fqdn);
        if (it != _inFlight.end())
        {
          pending = it->second.result;
        }
        else
        {
          leader = true;
          generation = _generation;
          pending = promise.get_future().share();
          _inFlight.emplace(fqdn, InFlight{pending, generation});
        }
      }

      if (!leader)
      {
        core::Logger::debug("ResolutionEngine: joining in-flight lookup for '" + fqdn + "'");
        return pending.get();
      }

      LeaderCompletion completion(*this, fqdn, generation, promise);
      // A lookup may have completed between the cache miss and registration
      completion.result = _cache.get(fqdn);
      if (completion.result)
      {
        return completion.result;
      }
      completion.result = lookupAndStore(fqdn, generation);
      return completion.result;
    }

    /// \brief Cached value only; never triggers a lookup.
    MaybeDnslink cached(const std::string& fqdn) { return _cache.get(fqdn); }

    /// \brief Records a value learnt out of band, e.g. from a response header.
    void setCached(const std::string& fqdn, const DnslinkValue& value)
    {
      _cache.set(fqdn, value);
    }

    /// \brief Drops every cached value. Lookups already running when this is
    /// called do not write their results back.
    void clear()
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_generation;
        _inFlight.clear();
      }
      _cache.clear();
      core::Logger::info("ResolutionEngine: DNSLink cache cleared");
    }

    std::size_t cacheSize() const { return _cache.size(); }

  private:
    struct InFlight
    {
      std::shared_future<MaybeDnslink> result;
      std::uint64_t generation;
    };

    /// Retires the leader's in-flight entry and publishes its result to the
    /// joined callers on every exit path, including exceptions.
    class LeaderCompletion
    {
    public:
      LeaderCompletion(ResolutionEngine& engine, const std::string& fqdn,
                       std::uint64_t generation, std::promise<MaybeDnslink>& promise)
        : _engine(engine), _fqdn(fqdn), _generation(generation), _promise(promise)
      {
      }

      LeaderCompletion(const LeaderCompletion&) = delete;
      LeaderCompletion& operator=(const LeaderCompletion&) = delete;

      ~LeaderCompletion()
      {
        {
          std::lock_guard<std::mutex> lock(_engine._mutex);
          auto it = _engine._inFlight.find(_fqdn);
          if (it != _engine._inFlight.end() && it->second.generation == _generation)
          {
            _engine._inFlight.erase(it);
          }
        }
        _promise.set_value(result);
      }

      MaybeDnslink result;

    private:
      ResolutionEngine& _engine;
      const std::string& _fqdn;
      std::uint64_t _generation;
      std::promise<MaybeDnslink>& _promise;
    };

    std::shared_ptr<LookupClient> _client;
    Cache _cache;
    bool _coalesce;
    std::mutex _mutex;
    std::unordered_map<std::string, InFlight> _inFlight;
    std::atomic<std::uint64_t> _generation{0};
    DiagnosticSink _diagnosticSink;

    std::uint64_t currentGeneration() const { return _generation.load(); }

    MaybeDnslink lookupAndStore(const std::string& fqdn, std::uint64_t generation)
    {
      core::Logger::info("ResolutionEngine: DNSLink cache miss for '" + fqdn +
                         "', running DNS TXT lookup");
      LookupResult result;
      try
      {
        result = _client->lookup(fqdn);
      }
      catch (const std::exception& e)
      {
        result = LookupResult::failure(LookupError::Kind::Transport, e.what());
      }

      if (!result.ok)
      {
        report(fqdn, result.error);
        return std::nullopt;
      }

      if (result.value.isResolved())
      {
        core::Logger::info("ResolutionEngine: found DNSLink: '" + fqdn + "' -> '" +
                           result.value.path() + "'");
      }
      else
      {
        core::Logger::info("ResolutionEngine: found NO DNSLink for '" + fqdn + "'");
      }

      // clear() bumps the generation before emptying the cache, so a stale
      // result is either rejected here or removed by that clear
      bool stored = _cache.setIf(fqdn, result.value,
                                 [this, generation]() { return _generation.load() == generation; });
      if (!stored)
      {
        core::Logger::debug("ResolutionEngine: cache cleared during lookup for '" + fqdn +
                            "', result not stored");
      }
      return result.value;
    }

    void report(const std::string& fqdn, const LookupError& error)
    {
      DiagnosticSink sink;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        sink = _diagnosticSink;
      }
      try
      {
        LINKGATE_LOG_ERROR("Error in resolveAndCache for '"
                           << fqdn << "' (" << toString(error.kind) << "): " << error.message);
        if (sink)
        {
          sink(LookupDiagnostic{fqdn, error});
        }
      }
      catch (const std::exception& e)
      {
        LINKGATE_LOG_WARN("Diagnostic sink failed for '" << fqdn << "': " << e.what());
      }
    }
  };

} // namespace dnslink
} // namespace linkgate
