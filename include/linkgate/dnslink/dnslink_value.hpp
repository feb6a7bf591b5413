// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Linkgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace linkgate
{
namespace dnslink
{

  /// \brief Outcome of a completed DNSLink lookup for one FQDN: either a
  /// content path or the confirmed absence of a record.
  ///
  /// "Not looked up yet" is not a DnslinkValue; APIs express it as an empty
  /// std::optional<DnslinkValue>.
  class DnslinkValue
  {
  public:
    static DnslinkValue resolved(std::string path)
    {
      return DnslinkValue(std::move(path), true);
    }

    static DnslinkValue absent() { return DnslinkValue(std::string(), false); }

    bool isResolved() const { return _resolved; }
    bool isAbsent() const { return !_resolved; }

    /// \brief Content path; empty for an absent value.
    const std::string& path() const { return _path; }

    bool operator==(const DnslinkValue& other) const
    {
      return _resolved == other._resolved && _path == other._path;
    }
    bool operator!=(const DnslinkValue& other) const { return !(*this == other); }

    std::string toString() const { return _resolved ? _path : std::string("<absent>"); }

  private:
    DnslinkValue(std::string path, bool resolved) : _path(std::move(path)), _resolved(resolved)
    {
    }

    std::string _path;
    bool _resolved;
  };

  /// \brief Cache-level view: empty means unknown (never looked up, expired,
  /// evicted, or the last lookup failed).
  using MaybeDnslink = std::optional<DnslinkValue>;

  inline std::ostream& operator<<(std::ostream& os, const DnslinkValue& value)
  {
    return os << value.toString();
  }

} // namespace dnslink
} // namespace linkgate
