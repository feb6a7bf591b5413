// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "linkgate/core/logger.hpp"

namespace linkgate
{
namespace util
{
  // Forward declaration for friend accessor
  template <typename K, typename V> struct LruExpiringCacheTestAccessor;

  /// \brief Thread-safe cache bounded both by entry count (least recently used
  /// entries are evicted first) and by a fixed time-to-live per entry.
  ///
  /// Expired entries are never returned; they are removed lazily on access and
  /// ahead of any LRU eviction. The eviction callback runs after the cache lock
  /// is released, so it may call back into the cache.
  template <typename K, typename V> class LruExpiringCache
  {
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowFunction = std::function<TimePoint()>;

    enum class EvictionReason
    {
      Expired,
      Capacity,
      Removed,
      Cleared
    };

    /// \brief Callback function type for cache evictions
    using EvictionCallback =
        std::function<void(const K& key, const V& value, EvictionReason reason)>;

    LruExpiringCache(std::size_t capacity, std::chrono::seconds ttl,
                     NowFunction now = nullptr)
      : _capacity(capacity), _ttl(ttl), _now(now ? std::move(now) : NowFunction(&Clock::now))
    {
      if (_capacity == 0)
      {
        throw std::invalid_argument("LruExpiringCache: capacity must be positive");
      }
      if (_ttl.count() <= 0)
      {
        throw std::invalid_argument("LruExpiringCache: TTL must be positive");
      }
      core::Logger::debug("LruExpiringCache: Initializing with capacity " +
                          std::to_string(capacity) + " and TTL of " +
                          std::to_string(ttl.count()) + " seconds");
    }

    LruExpiringCache(const LruExpiringCache&) = delete;
    LruExpiringCache& operator=(const LruExpiringCache&) = delete;

    void setEvictionCallback(EvictionCallback callback)
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _evictionCallback = std::move(callback);
    }

    /// \brief Inserts or overwrites a value, resetting its age and marking it
    /// most recently used.
    void set(const K& key, const V& value)
    {
      setIf(key, value, nullptr);
    }

    /// \brief Like set(), but stores the value only when `condition` holds.
    /// The condition is evaluated under the cache lock.
    /// \return true when the value was stored
    bool setIf(const K& key, const V& value, const std::function<bool()>& condition)
    {
      std::vector<Evicted> evicted;
      std::size_t purgedCount = 0;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        if (condition && !condition())
        {
          return false;
        }
        TimePoint expiration = _now() + _ttl;
        auto it = _index.find(key);
        if (it != _index.end())
        {
          it->second->value = value;
          it->second->expiration = expiration;
          _entries.splice(_entries.begin(), _entries, it->second);
          return true;
        }

        _entries.push_front(Entry{key, value, expiration});
        _index.emplace(key, _entries.begin());

        if (_entries.size() > _capacity)
        {
          purgedCount = purgeExpiredLocked(evicted);
        }
        while (_entries.size() > _capacity)
        {
          evictLocked(std::prev(_entries.end()), EvictionReason::Capacity, evicted);
        }
      }
      logPurged(purgedCount);
      notify(evicted);
      return true;
    }

    /// \brief Returns the live value for a key and marks it most recently
    /// used, or std::nullopt when the key is absent or expired.
    std::optional<V> get(const K& key)
    {
      std::vector<Evicted> evicted;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _index.find(key);
        if (it == _index.end())
        {
          return std::nullopt;
        }
        if (!isExpired(*it->second, _now()))
        {
          _entries.splice(_entries.begin(), _entries, it->second);
          return it->second->value;
        }
        evictLocked(it->second, EvictionReason::Expired, evicted);
      }
      notify(evicted);
      return std::nullopt;
    }

    /// \brief Removes a key from the cache.
    bool remove(const K& key)
    {
      std::vector<Evicted> evicted;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _index.find(key);
        if (it == _index.end())
        {
          return false;
        }
        evictLocked(it->second, EvictionReason::Removed, evicted);
      }
      notify(evicted);
      return true;
    }

    /// \brief Removes every entry.
    void clear()
    {
      std::vector<Evicted> evicted;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        evicted.reserve(_entries.size());
        for (auto& entry : _entries)
        {
          evicted.push_back(Evicted{std::move(entry.key), std::move(entry.value),
                                    EvictionReason::Cleared});
        }
        _entries.clear();
        _index.clear();
      }
      notify(evicted);
    }

    /// \brief Drops all expired entries and returns how many were removed.
    std::size_t purgeExpired()
    {
      std::vector<Evicted> evicted;
      std::size_t purgedCount = 0;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        purgedCount = purgeExpiredLocked(evicted);
      }
      logPurged(purgedCount);
      notify(evicted);
      return purgedCount;
    }

    /// \brief Number of stored entries, including expired ones not yet purged.
    std::size_t size() const
    {
      std::lock_guard<std::mutex> lock(_mutex);
      return _entries.size();
    }

    std::size_t capacity() const { return _capacity; }

    std::chrono::seconds ttl() const { return _ttl; }

    // Friend accessor for unit testing
    friend struct LruExpiringCacheTestAccessor<K, V>;

  private:
    struct Entry
    {
      K key;
      V value;
      TimePoint expiration;
    };

    using EntryList = std::list<Entry>;

    struct Evicted
    {
      K key;
      V value;
      EvictionReason reason;
    };

    std::size_t _capacity;
    std::chrono::seconds _ttl;
    NowFunction _now;
    EntryList _entries; // front = most recently used
    std::unordered_map<K, typename EntryList::iterator> _index;
    mutable std::mutex _mutex;
    EvictionCallback _evictionCallback;

    static bool isExpired(const Entry& entry, TimePoint now) { return entry.expiration <= now; }

    void evictLocked(typename EntryList::iterator it, EvictionReason reason,
                     std::vector<Evicted>& evicted)
    {
      _index.erase(it->key);
      evicted.push_back(Evicted{std::move(it->key), std::move(it->value), reason});
      _entries.erase(it);
    }

    std::size_t purgeExpiredLocked(std::vector<Evicted>& evicted)
    {
      TimePoint now = _now();
      std::size_t purgedCount = 0;
      for (auto it = _entries.begin(); it != _entries.end();)
      {
        auto current = it++;
        if (isExpired(*current, now))
        {
          evictLocked(current, EvictionReason::Expired, evicted);
          ++purgedCount;
        }
      }
      return purgedCount;
    }

    // Called without the cache lock held
    void notify(const std::vector<Evicted>& evicted)
    {
      if (evicted.empty())
      {
        return;
      }
      EvictionCallback callback;
      {
        std::lock_guard<std::mutex> lock(_mutex);
        callback = _evictionCallback;
      }
      if (!callback)
      {
        return;
      }
      for (const auto& entry : evicted)
      {
        callback(entry.key, entry.value, entry.reason);
      }
    }

    void logPurged(std::size_t purgedCount) const
    {
      if (purgedCount > 0)
      {
        core::Logger::debug("LruExpiringCache: Purged " + std::to_string(purgedCount) +
                            " expired entries (" + std::to_string(size()) + " remaining)");
      }
    }
  };

  /// \brief Provides unit test access to internal state of LruExpiringCache.
  template <typename K, typename V> struct LruExpiringCacheTestAccessor
  {
    /// \brief Keys from most to least recently used.
    static std::list<K> recencyOrder(LruExpiringCache<K, V>& cache)
    {
      std::lock_guard<std::mutex> lock(cache._mutex);
      std::list<K> keys;
      for (const auto& entry : cache._entries)
      {
        keys.push_back(entry.key);
      }
      return keys;
    }
  };
} // namespace util
} // namespace linkgate
