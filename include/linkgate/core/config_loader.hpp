// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <linkgate/core/logger.hpp>
#include <linkgate/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace linkgate
{
namespace core
{
/// \brief Loads and parses TOML configuration files for the application.
class ConfigLoader
{
public:
  /// \brief Constructs a loader for the given file; call load() to read it.
  explicit ConfigLoader(const std::string& filename) : _filename(filename) {}

  /// \brief Builds a loader over an in-memory document.
  static ConfigLoader fromString(const std::string& toml)
  {
    ConfigLoader loader("<memory>");
    loader._table = parsers::toml::parse(toml);
    loader._loaded = true;
    return loader;
  }

  /// \brief Reloads the configuration from disk.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      return true;
    }
    catch (const std::exception& e)
    {
      LINKGATE_LOG_ERROR("ConfigLoader: failed to load " << _filename << ": " << e.what());
      _table = parsers::toml::table{};
      _loaded = false;
      return false;
    }
  }

  /// \brief Loads the file on first use.
  /// \throws std::runtime_error if the file cannot be read or parsed
  const parsers::toml::table& load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string& filename() const { return _filename; }

  /// \brief Gets the full configuration table.
  const parsers::toml::table& table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T One of int64_t, double, bool, std::string
  template <typename T> std::optional<T> get(const std::string& dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string& key) const { return get<int64_t>(key); }

  std::optional<double> getDouble(const std::string& key) const { return get<double>(key); }

  std::optional<bool> getBool(const std::string& key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string& key) const
  {
    return get<std::string>(key);
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded = false;
};

} // namespace core
} // namespace linkgate
